#pragma once

#include <codekata/common/formatters/debug.hpp>
#include <codekata/common/static_string.hpp>

#include <fmt/format.h>

#include <optional>
#include <string_view>
#include <utility>

namespace codekata::detail {

/// \tparam Enumerators - std::pair<StaticString, Enum>
///                                 name          value
///                       Very annoying to declare manually, so use FMT_SERIALIZE_ENUM instead!
template <typename Enum, StaticString EnumName, auto... Enumerators>
struct EnumFormatter
{
    DebugFormatter debug_parser;

    constexpr auto parse(fmt::format_parse_context& ctx) { return debug_parser.parse(ctx); }

    static constexpr std::optional<std::string_view> name_of(const Enum& from) {
        std::optional<std::string_view> res;
        ((Enumerators.second == from ? res = std::string_view{Enumerators.first} : res), ...);
        return res;
    }

    auto format(const Enum& from, fmt::format_context& ctx) const {
        auto name = name_of(from);

        if (debug_parser.is_debug_format) {
            if (name) {
                return fmt::format_to(ctx.out(), "{}{{{}}}", std::string_view{EnumName}, *name);
            }
            return fmt::format_to(ctx.out(), "{}{{<unknown ({})>}}", std::string_view{EnumName},
                                  fmt::underlying(from));
        }

        if (name) {
            return fmt::format_to(ctx.out(), "{}", *name);
        }

        return fmt::format_to(ctx.out(), "<unknown ({})>", fmt::underlying(from));
    }
};

} // namespace codekata::detail
