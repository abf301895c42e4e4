#pragma once

#include <codekata/common/expected.hpp>
#include <codekata/common/formatters/macros.hpp>

#include <regex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace codekata {

/// What a restricted operation would give untrusted code access to
enum class Capability { Filesystem, Network, ProcessSpawn, CodeEvaluation, SharedState, ShellCommand };

/// e.g., "filesystem access"
std::string_view describe(Capability capability);

struct SafetyRule
{
    std::string name;
    Capability capability;
    std::string pattern; ///< ECMAScript regex, matched anywhere in the source
};

/// Why a submission was turned away
struct Rejection
{
    std::string rule;
    Capability capability;

    bool operator==(const Rejection&) const = default;
};

/// Static deny-list check run before any code executes.
///
/// A submission is rejected if any rule matches anywhere in its text, including inside
/// comments and string literals. Over-blocking is accepted.
class SafetyGate
{
public:
    /// Uses ``default_rules()``
    SafetyGate();

    /// Throws std::regex_error if a pattern is invalid
    explicit SafetyGate(std::vector<SafetyRule> rules);

    /// Rejections are logged at warning level along with the offending source.
    /// The first matching rule (in table order) is reported.
    Expected<void, Rejection> check(std::string_view source) const;

    std::span<const SafetyRule> rules() const { return rules_; }

    static std::vector<SafetyRule> default_rules();

private:
    std::vector<SafetyRule> rules_;
    std::vector<std::regex> compiled_;
};

} // namespace codekata

FMT_SERIALIZE_ENUM(::codekata::Capability, Filesystem, Network, ProcessSpawn, CodeEvaluation, SharedState,
                   ShellCommand);
