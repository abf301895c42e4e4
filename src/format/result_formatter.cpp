#include <codekata/format/result_formatter.hpp>

#include <codekata/execution_result.hpp>
#include <codekata/lang/value.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/take.hpp>
#include <range/v3/view/transform.hpp>

#include <chrono>
#include <cmath>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace codekata::result_formatter {

namespace {

constexpr std::size_t LIST_LIMIT = 10;
constexpr std::size_t LIST_SHOWN = 5;
constexpr std::size_t MAP_LIMIT = 5;
constexpr std::size_t MAP_SHOWN = 3;
constexpr std::size_t TUPLE_LIMIT = 5;
constexpr std::size_t TUPLE_SHOWN = 3;

constexpr std::string_view WHITESPACE = " \t\n\r\f\v";

bool is_space(char chr) {
    return WHITESPACE.find(chr) != std::string_view::npos;
}

struct Rendering
{
    std::string_view open;
    std::string_view close;
    std::vector<std::string> parts;
    std::string suffix; ///< e.g. " ... (20 items)"; empty if nothing was left out
};

std::string compact(const Rendering& rendering) {
    return fmt::format("{}{}{}{}", rendering.open, fmt::join(rendering.parts, ", "), rendering.suffix,
                       rendering.close);
}

std::string pretty(const Rendering& rendering) {
    std::string out{rendering.open};
    out += '\n';

    for (std::size_t i = 0; i < rendering.parts.size(); ++i) {
        out += "  ";
        out += rendering.parts[i];
        out += (i + 1 == rendering.parts.size()) ? rendering.suffix : ",";
        out += '\n';
    }

    out += rendering.close;
    return out;
}

template <typename Range>
std::vector<std::string> inspect_first(const Range& items, std::size_t count) {
    return items | ranges::views::take(static_cast<std::ptrdiff_t>(count)) |
           ranges::views::transform([](const lang::Value& item) { return lang::inspect(item); }) |
           ranges::to<std::vector<std::string>>();
}

Rendering sequence(const std::vector<lang::Value>& items, std::string_view open, std::string_view close,
                   std::size_t limit, std::size_t shown, std::string_view noun) {
    if (items.size() <= limit) {
        return {open, close, inspect_first(items, items.size()), ""};
    }
    return {open, close, inspect_first(items, shown), fmt::format(" ... ({} {})", items.size(), noun)};
}

Rendering map_entries(const lang::MapData& map) {
    const auto& entries = map.entries;
    std::size_t shown = entries.size() <= MAP_LIMIT ? entries.size() : MAP_SHOWN;

    auto parts = entries | ranges::views::take(static_cast<std::ptrdiff_t>(shown)) |
                 ranges::views::transform([](const auto& entry) {
                     return fmt::format("{} => {}", lang::inspect(entry.first), lang::inspect(entry.second));
                 }) |
                 ranges::to<std::vector<std::string>>();

    std::string suffix;
    if (shown < entries.size()) {
        suffix = fmt::format(" ... ({} keys)", entries.size());
    }

    return {"%{", "}", std::move(parts), std::move(suffix)};
}

std::optional<Rendering> composite(const lang::Value& value) {
    switch (value.type()) {
    case lang::Value::Type::List:
        return sequence(value.as_list().items, "[", "]", LIST_LIMIT, LIST_SHOWN, "items");
    case lang::Value::Type::Tuple:
        return sequence(value.as_tuple().items, "{", "}", TUPLE_LIMIT, TUPLE_SHOWN, "elements");
    case lang::Value::Type::Map:
        return map_entries(value.as_map());
    default:
        return std::nullopt;
    }
}

std::string_view trim_right(std::string_view str) {
    while (!str.empty() && is_space(str.back())) {
        str.remove_suffix(1);
    }
    return str;
}

/// At most ``width`` characters; does not split UTF-8 sequences
std::string truncate(std::string_view str, std::size_t width) {
    std::size_t chars = 0;
    std::size_t pos = 0;

    while (pos < str.size()) {
        auto byte = static_cast<unsigned char>(str[pos]);
        if ((byte & 0xC0U) != 0x80U) {
            if (chars == width) {
                break;
            }
            ++chars;
        }
        ++pos;
    }

    return std::string{str.substr(0, pos)};
}

} // namespace

DisplayResult format(const ExecutionResult& result) {
    std::optional<std::string> error_text;
    if (result.error) {
        error_text = format_error_message(result.error->message);
    }

    return {.success = result.success(),
            .value_text = format_value(result.value),
            .output_text = format_output(result.output),
            .error_text = std::move(error_text),
            .elapsed_text = format_elapsed(result.elapsed)};
}

std::string format_value(const std::optional<lang::Value>& value) {
    if (!value) {
        return "nil";
    }

    auto rendering = composite(*value);
    if (!rendering) {
        return lang::inspect(*value);
    }

    std::string flat = compact(*rendering);
    bool too_wide = flat.size() > PRETTY_PRINT_WIDTH ||
                    ranges::any_of(rendering->parts, [](const std::string& part) { return part.find('\n') != std::string::npos; });

    if (!too_wide || rendering->parts.empty()) {
        return flat;
    }

    return pretty(*rendering);
}

std::optional<std::string> format_output(std::string_view output) {
    auto trimmed = trim_right(output);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    return std::string{trimmed};
}

std::string format_error_message(std::string_view message) {
    std::string out;
    out.reserve(message.size());

    bool pending_space = false;
    for (char chr : message) {
        if (is_space(chr)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out += ' ';
            pending_space = false;
        }
        out += chr;
    }

    return out;
}

std::string format_elapsed(std::chrono::milliseconds elapsed) {
    auto millis = elapsed.count();

    auto hundredths = [](double val) { return lang::format_float(std::round(val * 100.0) / 100.0); };

    if (millis < 1) {
        return "< 1ms";
    }
    if (millis < 1000) {
        return fmt::format("{}ms", millis);
    }
    if (millis < 60'000) {
        return hundredths(static_cast<double>(millis) / 1000.0) + "s";
    }
    return hundredths(static_cast<double>(millis) / 60'000.0) + "min";
}

std::string create_summary(const DisplayResult& display) {
    if (!display.success) {
        return fmt::format("Error: {} | Failed in {}", truncate(display.error_text.value_or(""), SUMMARY_FIELD_WIDTH),
                           display.elapsed_text);
    }

    std::vector<std::string> parts;

    if (display.value_text != "nil") {
        parts.push_back("Result: " + truncate(display.value_text, SUMMARY_FIELD_WIDTH));
    }
    if (display.output_text) {
        parts.push_back("Output: " + truncate(*display.output_text, SUMMARY_FIELD_WIDTH));
    }
    parts.push_back("Executed in " + display.elapsed_text);

    return fmt::format("{}", fmt::join(parts, " | "));
}

} // namespace codekata::result_formatter
