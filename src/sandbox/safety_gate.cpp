#include <codekata/sandbox/safety_gate.hpp>

#include <codekata/common/expected.hpp>
#include <codekata/logging.hpp>

#include <range/v3/view/transform.hpp>
#include <range/v3/range/conversion.hpp>

#include <cstddef>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace codekata {

std::string_view describe(Capability capability) {
    switch (capability) {
    case Capability::Filesystem:
        return "filesystem access";
    case Capability::Network:
        return "network access";
    case Capability::ProcessSpawn:
        return "process or OS access";
    case Capability::CodeEvaluation:
        return "dynamic code evaluation";
    case Capability::SharedState:
        return "shared state or concurrency primitives";
    case Capability::ShellCommand:
        return "shell command execution";
    }

    return "unknown capability";
}

std::vector<SafetyRule> SafetyGate::default_rules() {
    using enum Capability;

    return {
        // Filesystem
        {"File.", Filesystem, R"(File\.)"},
        {"Path.", Filesystem, R"(Path\.)"},
        {":file.", Filesystem, R"(:file\.)"},
        {"System.", ProcessSpawn, R"(System\.)"},

        // Network
        {"HTTPoison", Network, R"(HTTPoison)"},
        {":httpc", Network, R"(:httpc)"},
        {":gen_tcp", Network, R"(:gen_tcp)"},
        {":gen_udp", Network, R"(:gen_udp)"},
        {"Socket.", Network, R"(Socket\.)"},

        // Process spawning; "spawn" alone also covers spawn_link and spawn_monitor
        {"Process.spawn", ProcessSpawn, R"(Process\.spawn)"},
        {"spawn", ProcessSpawn, R"(spawn)"},
        {":os.", ProcessSpawn, R"(:os\.)"},

        // Nested evaluation
        {"Code.eval", CodeEvaluation, R"(Code\.eval)"},
        {"Code.compile", CodeEvaluation, R"(Code\.compile)"},
        {"Code.load", CodeEvaluation, R"(Code\.load)"},

        // Shared state and concurrency primitives
        {":ets", SharedState, R"(:ets)"},
        {":dets", SharedState, R"(:dets)"},
        {":mnesia", SharedState, R"(:mnesia)"},
        {"Agent.", SharedState, R"(Agent\.)"},
        {"GenServer.", SharedState, R"(GenServer\.)"},
        {"Task.", SharedState, R"(Task\.)"},

        // Shell
        {"System.cmd", ShellCommand, R"(System\.cmd)"},
        {"Port.", ShellCommand, R"(Port\.)"},
        {":erlang.port", ShellCommand, R"(:erlang\.port)"},
    };
}

SafetyGate::SafetyGate()
    : SafetyGate{default_rules()} {}

SafetyGate::SafetyGate(std::vector<SafetyRule> rules)
    : rules_{std::move(rules)}
    , compiled_{rules_ |
                ranges::views::transform([](const SafetyRule& rule) { return std::regex{rule.pattern}; }) |
                ranges::to<std::vector<std::regex>>()} {}

Expected<void, Rejection> SafetyGate::check(std::string_view source) const {
    for (std::size_t i = 0; i < rules_.size(); ++i) {
        if (!std::regex_search(source.begin(), source.end(), compiled_[i])) {
            continue;
        }

        const SafetyRule& rule = rules_[i];
        LOG_WARN("Dangerous code detected (rule {:?}, {}): {:?}", rule.name, describe(rule.capability), source);

        return Rejection{.rule = rule.name, .capability = rule.capability};
    }

    return {};
}

} // namespace codekata
