#include <codekata/lang/builtins.hpp>

#include "lang/arithmetic.hpp"

#include <codekata/common/error_types.hpp>
#include <codekata/common/expected.hpp>
#include <codekata/lang/fault.hpp>
#include <codekata/lang/memory_budget.hpp>
#include <codekata/lang/value.hpp>

#include <fmt/format.h>
#include <gsl/util>
#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/find_if.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace codekata::lang {

namespace {

using BuiltinResult = Expected<Value, Fault>;

// Argument helpers. ``fn`` is the qualified name used in messages, e.g. "Enum.map/2".

Fault wrong_type(std::string_view fn, std::string_view expected, const Value& got) {
    return {FaultKind::Argument, fmt::format("{} expected {}, got {}", fn, expected, inspect(got))};
}

Expected<std::int64_t, Fault> want_int(std::string_view fn, const Value& arg) {
    if (arg.type() != Value::Type::Integer) {
        return wrong_type(fn, "an integer", arg);
    }
    return arg.as_int();
}

Expected<std::size_t, Fault> want_count(std::string_view fn, const Value& arg) {
    auto count = TRY(want_int(fn, arg));
    if (count < 0) {
        return wrong_type(fn, "a non-negative integer", arg);
    }
    return gsl::narrow_cast<std::size_t>(count);
}

Expected<std::string, Fault> want_string(std::string_view fn, const Value& arg) {
    if (arg.type() != Value::Type::String) {
        return wrong_type(fn, "a string", arg);
    }
    return arg.as_string();
}

Expected<std::vector<Value>, Fault> want_list(std::string_view fn, const Value& arg) {
    if (arg.type() != Value::Type::List) {
        return wrong_type(fn, "a list", arg);
    }
    return arg.as_list().items;
}

Expected<void, Fault> want_map(std::string_view fn, const Value& arg) {
    if (arg.type() != Value::Type::Map) {
        return wrong_type(fn, "a map", arg);
    }
    return {};
}

Expected<void, Fault> want_function(std::string_view fn, const Value& arg) {
    if (arg.type() != Value::Type::Function) {
        return wrong_type(fn, "a function", arg);
    }
    return {};
}

/// Lists enumerate their elements, maps enumerate {key, value} tuples
Expected<std::vector<Value>, Fault> enumerable(CallContext& ctx, std::string_view fn, const Value& arg) {
    if (arg.type() == Value::Type::List) {
        return arg.as_list().items;
    }

    if (arg.type() == Value::Type::Map) {
        std::vector<Value> pairs;
        pairs.reserve(arg.as_map().entries.size());
        for (const auto& [key, val] : arg.as_map().entries) {
            pairs.push_back(make_tuple({key, val}, &ctx.budget()));
        }
        return pairs;
    }

    return wrong_type(fn, "a list or map", arg);
}

Value list_of(CallContext& ctx, std::vector<Value> items) {
    return make_list(std::move(items), &ctx.budget());
}

Value string_of(CallContext& ctx, std::string text) {
    return make_string(std::move(text), &ctx.budget());
}

bool is_space(char chr) {
    return chr == ' ' || chr == '\t' || chr == '\n' || chr == '\r' || chr == '\v' || chr == '\f';
}

std::string_view trim_view(std::string_view text) {
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

/// Splits UTF-8 text into codepoints. Invalid bytes are kept as single-byte units.
std::vector<std::string_view> codepoints(std::string_view text) {
    std::vector<std::string_view> result;

    std::size_t pos = 0;
    while (pos < text.size()) {
        auto lead = static_cast<unsigned char>(text[pos]);

        std::size_t len = 1;
        if ((lead & 0xE0U) == 0xC0U) {
            len = 2;
        } else if ((lead & 0xF0U) == 0xE0U) {
            len = 3;
        } else if ((lead & 0xF8U) == 0xF0U) {
            len = 4;
        }
        len = std::min(len, text.size() - pos);

        result.push_back(text.substr(pos, len));
        pos += len;
    }

    return result;
}

Expected<Value, Fault> to_integer(std::string_view fn, double val) {
    constexpr double LIMIT = 9223372036854775808.0; // 2^63

    if (!std::isfinite(val) || val >= LIMIT || val < -LIMIT) {
        return Fault{FaultKind::Arithmetic, fmt::format("{} cannot convert {} to an integer", fn, format_float(val))};
    }
    return Value::integer(static_cast<std::int64_t>(val));
}

// ----------------------------------------------------------------------------
// Kernel

BuiltinResult kernel_div(CallContext& /*ctx*/, std::span<const Value> args) {
    return integer_div(args[0], args[1]);
}

BuiltinResult kernel_rem(CallContext& /*ctx*/, std::span<const Value> args) {
    return integer_rem(args[0], args[1]);
}

BuiltinResult kernel_abs(CallContext& /*ctx*/, std::span<const Value> args) {
    const Value& arg = args[0];
    if (arg.type() == Value::Type::Float) {
        return Value::floating(std::fabs(arg.as_float()));
    }
    auto val = TRY(want_int("abs/1", arg));
    if (val < 0) {
        return negate(arg);
    }
    return arg;
}

Expected<std::partial_ordering, Fault> ordering(std::string_view fn, const Value& lhs, const Value& rhs) {
    auto order = compare(lhs, rhs);
    if (!order) {
        return Fault{FaultKind::Argument,
                     fmt::format("{} cannot compare {} with {}", fn, inspect(lhs), inspect(rhs))};
    }
    return *order;
}

BuiltinResult kernel_max(CallContext& /*ctx*/, std::span<const Value> args) {
    auto order = TRY(ordering("max/2", args[0], args[1]));
    return order < 0 ? args[1] : args[0];
}

BuiltinResult kernel_min(CallContext& /*ctx*/, std::span<const Value> args) {
    auto order = TRY(ordering("min/2", args[0], args[1]));
    return order > 0 ? args[1] : args[0];
}

BuiltinResult kernel_round(CallContext& /*ctx*/, std::span<const Value> args) {
    if (args[0].type() == Value::Type::Integer) {
        return args[0];
    }
    if (args[0].type() != Value::Type::Float) {
        return wrong_type("round/1", "a number", args[0]);
    }
    return to_integer("round/1", std::round(args[0].as_float()));
}

BuiltinResult kernel_trunc(CallContext& /*ctx*/, std::span<const Value> args) {
    if (args[0].type() == Value::Type::Integer) {
        return args[0];
    }
    if (args[0].type() != Value::Type::Float) {
        return wrong_type("trunc/1", "a number", args[0]);
    }
    return to_integer("trunc/1", std::trunc(args[0].as_float()));
}

BuiltinResult kernel_length(CallContext& /*ctx*/, std::span<const Value> args) {
    auto items = TRY(want_list("length/1", args[0]));
    return Value::integer(gsl::narrow_cast<std::int64_t>(items.size()));
}

BuiltinResult kernel_hd(CallContext& /*ctx*/, std::span<const Value> args) {
    auto items = TRY(want_list("hd/1", args[0]));
    if (items.empty()) {
        return wrong_type("hd/1", "a non-empty list", args[0]);
    }
    return items.front();
}

BuiltinResult kernel_tl(CallContext& ctx, std::span<const Value> args) {
    auto items = TRY(want_list("tl/1", args[0]));
    if (items.empty()) {
        return wrong_type("tl/1", "a non-empty list", args[0]);
    }
    items.erase(items.begin());
    return list_of(ctx, std::move(items));
}

BuiltinResult kernel_elem(CallContext& /*ctx*/, std::span<const Value> args) {
    if (args[0].type() != Value::Type::Tuple) {
        return wrong_type("elem/2", "a tuple", args[0]);
    }
    auto index = TRY(want_int("elem/2", args[1]));
    const auto& items = args[0].as_tuple().items;

    if (index < 0 || gsl::narrow_cast<std::size_t>(index) >= items.size()) {
        return Fault{FaultKind::Argument,
                     fmt::format("elem/2 index {} is out of range for a tuple of size {}", index, items.size())};
    }
    return items[gsl::narrow_cast<std::size_t>(index)];
}

BuiltinResult kernel_tuple_size(CallContext& /*ctx*/, std::span<const Value> args) {
    if (args[0].type() != Value::Type::Tuple) {
        return wrong_type("tuple_size/1", "a tuple", args[0]);
    }
    return Value::integer(gsl::narrow_cast<std::int64_t>(args[0].as_tuple().items.size()));
}

/// range(first, last[, step]): inclusive on both ends
BuiltinResult kernel_range(CallContext& ctx, std::span<const Value> args) {
    auto first = TRY(want_int("range/2", args[0]));
    auto last = TRY(want_int("range/2", args[1]));

    std::int64_t step = first <= last ? 1 : -1;
    if (args.size() == 3) {
        step = TRY(want_int("range/3", args[2]));
        if (step == 0) {
            return wrong_type("range/3", "a non-zero step", args[2]);
        }
    }

    if ((step > 0 && first > last) || (step < 0 && first < last)) {
        return list_of(ctx, {});
    }

    // Distance may not fit in int64; the count always fits in uint64
    auto distance = step > 0 ? static_cast<std::uint64_t>(last) - static_cast<std::uint64_t>(first)
                             : static_cast<std::uint64_t>(first) - static_cast<std::uint64_t>(last);
    auto stride = step > 0 ? static_cast<std::uint64_t>(step) : 0 - static_cast<std::uint64_t>(step);
    std::uint64_t count = distance / stride + 1;

    if (count > std::numeric_limits<std::size_t>::max() / sizeof(Value)) {
        throw ResourceLimitError{};
    }
    ctx.budget().ensure_available(list_footprint(count));

    std::vector<Value> items;
    items.reserve(count);
    std::int64_t current = first;
    for (std::uint64_t i = 0; i < count; ++i) {
        items.push_back(Value::integer(current));
        if (i + 1 < count) {
            current += step;
        }
    }

    return list_of(ctx, std::move(items));
}

BuiltinResult kernel_to_string(CallContext& ctx, std::span<const Value> args) {
    if (args[0].type() == Value::Type::String) {
        return args[0];
    }
    return string_of(ctx, to_display_string(args[0]));
}

BuiltinResult kernel_inspect(CallContext& ctx, std::span<const Value> args) {
    return string_of(ctx, inspect(args[0]));
}

BuiltinResult kernel_raise(CallContext& /*ctx*/, std::span<const Value> args) {
    return Fault{FaultKind::Raised, to_display_string(args[0])};
}

template <Value::Type Wanted>
BuiltinResult kernel_is_type(CallContext& /*ctx*/, std::span<const Value> args) {
    return Value::boolean(args[0].type() == Wanted);
}

BuiltinResult kernel_is_number(CallContext& /*ctx*/, std::span<const Value> args) {
    return Value::boolean(args[0].is_number());
}

// ----------------------------------------------------------------------------
// IO

BuiltinResult io_puts(CallContext& ctx, std::span<const Value> args) {
    TRY(ctx.write_output(to_display_string(args[0]) + "\n"));
    return Value::ok();
}

BuiltinResult io_write(CallContext& ctx, std::span<const Value> args) {
    TRY(ctx.write_output(to_display_string(args[0])));
    return Value::ok();
}

BuiltinResult io_inspect(CallContext& ctx, std::span<const Value> args) {
    TRY(ctx.write_output(inspect(args[0]) + "\n"));
    return args[0];
}

// ----------------------------------------------------------------------------
// Enum

BuiltinResult enum_map(CallContext& ctx, std::span<const Value> args) {
    auto items = TRY(enumerable(ctx, "Enum.map/2", args[0]));
    TRY(want_function("Enum.map/2", args[1]));

    std::vector<Value> mapped;
    mapped.reserve(items.size());
    for (auto& item : items) {
        mapped.push_back(TRY(ctx.invoke(args[1], {std::move(item)})));
    }

    return list_of(ctx, std::move(mapped));
}

BuiltinResult enum_filter(CallContext& ctx, std::span<const Value> args) {
    auto items = TRY(enumerable(ctx, "Enum.filter/2", args[0]));
    TRY(want_function("Enum.filter/2", args[1]));

    std::vector<Value> kept;
    for (auto& item : items) {
        auto keep = TRY(ctx.invoke(args[1], {item}));
        if (keep.is_truthy()) {
            kept.push_back(std::move(item));
        }
    }

    return list_of(ctx, std::move(kept));
}

/// reduce(enumerable, acc, fn(elem, acc) -> acc end)
BuiltinResult enum_reduce(CallContext& ctx, std::span<const Value> args) {
    auto items = TRY(enumerable(ctx, "Enum.reduce/3", args[0]));
    TRY(want_function("Enum.reduce/3", args[2]));

    Value acc = args[1];
    for (auto& item : items) {
        acc = TRY(ctx.invoke(args[2], {std::move(item), std::move(acc)}));
    }

    return acc;
}

BuiltinResult enum_sum(CallContext& /*ctx*/, std::span<const Value> args) {
    auto items = TRY(want_list("Enum.sum/1", args[0]));

    Value total = Value::integer(0);
    for (const auto& item : items) {
        total = TRY(arithmetic(TokenKind::Plus, total, item));
    }

    return total;
}

BuiltinResult enum_count(CallContext& ctx, std::span<const Value> args) {
    auto items = TRY(enumerable(ctx, "Enum.count/1", args[0]));

    if (args.size() == 1) {
        return Value::integer(gsl::narrow_cast<std::int64_t>(items.size()));
    }

    TRY(want_function("Enum.count/2", args[1]));

    std::int64_t count = 0;
    for (auto& item : items) {
        auto matches = TRY(ctx.invoke(args[1], {std::move(item)}));
        if (matches.is_truthy()) {
            ++count;
        }
    }

    return Value::integer(count);
}

BuiltinResult enum_reverse(CallContext& ctx, std::span<const Value> args) {
    auto items = TRY(enumerable(ctx, "Enum.reverse/1", args[0]));
    std::reverse(items.begin(), items.end());
    return list_of(ctx, std::move(items));
}

/// Negative counts take from the end
BuiltinResult enum_take(CallContext& ctx, std::span<const Value> args) {
    auto items = TRY(enumerable(ctx, "Enum.take/2", args[0]));
    auto count = TRY(want_int("Enum.take/2", args[1]));

    std::size_t amount = count < 0 ? gsl::narrow_cast<std::size_t>(-(count + 1)) + 1
                                   : gsl::narrow_cast<std::size_t>(count);
    amount = std::min(amount, items.size());

    if (count < 0) {
        items.erase(items.begin(), items.end() - static_cast<std::ptrdiff_t>(amount));
    } else {
        items.resize(amount);
    }

    return list_of(ctx, std::move(items));
}

/// at(enumerable, index[, default]); negative indices count from the end
BuiltinResult enum_at(CallContext& ctx, std::span<const Value> args) {
    auto items = TRY(enumerable(ctx, "Enum.at/2", args[0]));
    auto index = TRY(want_int("Enum.at/2", args[1]));

    Value fallback = args.size() == 3 ? args[2] : Value{};

    auto size = gsl::narrow_cast<std::int64_t>(items.size());
    if (index < 0) {
        if (index < -size) {
            return fallback;
        }
        index += size;
    }

    if (index >= size) {
        return fallback;
    }

    return items[gsl::narrow_cast<std::size_t>(index)];
}

BuiltinResult enum_member(CallContext& ctx, std::span<const Value> args) {
    auto items = TRY(enumerable(ctx, "Enum.member?/2", args[0]));
    return Value::boolean(ranges::any_of(items, [&args](const Value& item) { return item == args[1]; }));
}

BuiltinResult enum_join(CallContext& ctx, std::span<const Value> args) {
    auto items = TRY(enumerable(ctx, "Enum.join/2", args[0]));

    std::string separator;
    if (args.size() == 2) {
        separator = TRY(want_string("Enum.join/2", args[1]));
    }

    std::string joined;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i != 0) {
            joined += separator;
        }
        joined += to_display_string(items[i]);
        ctx.budget().ensure_available(joined.size());
    }

    return string_of(ctx, std::move(joined));
}

BuiltinResult enum_sort(CallContext& ctx, std::span<const Value> args) {
    auto items = TRY(want_list("Enum.sort/1", args[0]));

    bool numbers = ranges::all_of(items, [](const Value& item) { return item.is_number(); });
    bool strings = ranges::all_of(items, [](const Value& item) { return item.type() == Value::Type::String; });

    if (!numbers && !strings) {
        return wrong_type("Enum.sort/1", "a list of numbers or a list of strings", args[0]);
    }

    // nan is unordered against everything
    if (numbers && ranges::any_of(items, [](const Value& item) {
            return item.type() == Value::Type::Float && std::isnan(item.as_float());
        })) {
        return Fault{FaultKind::Argument, "Enum.sort/1 cannot order a list containing nan"};
    }

    std::stable_sort(items.begin(), items.end(),
                     [](const Value& lhs, const Value& rhs) { return *compare(lhs, rhs) < 0; });

    return list_of(ctx, std::move(items));
}

// ----------------------------------------------------------------------------
// String

BuiltinResult string_length(CallContext& /*ctx*/, std::span<const Value> args) {
    auto text = TRY(want_string("String.length/1", args[0]));
    return Value::integer(gsl::narrow_cast<std::int64_t>(codepoints(text).size()));
}

template <char (*Convert)(char)>
BuiltinResult string_case(std::string_view fn, CallContext& ctx, const Value& arg) {
    auto text = TRY(want_string(fn, arg));
    std::transform(text.begin(), text.end(), text.begin(), Convert);
    return string_of(ctx, std::move(text));
}

char ascii_upper(char chr) {
    return chr >= 'a' && chr <= 'z' ? static_cast<char>(chr - 'a' + 'A') : chr;
}

char ascii_lower(char chr) {
    return chr >= 'A' && chr <= 'Z' ? static_cast<char>(chr - 'A' + 'a') : chr;
}

BuiltinResult string_upcase(CallContext& ctx, std::span<const Value> args) {
    return string_case<ascii_upper>("String.upcase/1", ctx, args[0]);
}

BuiltinResult string_downcase(CallContext& ctx, std::span<const Value> args) {
    return string_case<ascii_lower>("String.downcase/1", ctx, args[0]);
}

BuiltinResult string_reverse(CallContext& ctx, std::span<const Value> args) {
    auto text = TRY(want_string("String.reverse/1", args[0]));
    auto units = codepoints(text);

    std::string reversed;
    reversed.reserve(text.size());
    for (auto iter = units.rbegin(); iter != units.rend(); ++iter) {
        reversed += *iter;
    }

    return string_of(ctx, std::move(reversed));
}

/// split(text) splits on whitespace runs; split(text, sep) keeps empty pieces
BuiltinResult string_split(CallContext& ctx, std::span<const Value> args) {
    auto text = TRY(want_string("String.split/1", args[0]));
    std::vector<Value> pieces;

    if (args.size() == 1) {
        std::size_t pos = 0;
        while (pos < text.size()) {
            while (pos < text.size() && is_space(text[pos])) {
                ++pos;
            }
            std::size_t start = pos;
            while (pos < text.size() && !is_space(text[pos])) {
                ++pos;
            }
            if (pos > start) {
                pieces.push_back(string_of(ctx, text.substr(start, pos - start)));
            }
        }
        return list_of(ctx, std::move(pieces));
    }

    auto separator = TRY(want_string("String.split/2", args[1]));

    if (separator.empty()) {
        for (auto unit : codepoints(text)) {
            pieces.push_back(string_of(ctx, std::string{unit}));
        }
        return list_of(ctx, std::move(pieces));
    }

    std::size_t start = 0;
    while (true) {
        std::size_t found = text.find(separator, start);
        if (found == std::string::npos) {
            pieces.push_back(string_of(ctx, text.substr(start)));
            break;
        }
        pieces.push_back(string_of(ctx, text.substr(start, found - start)));
        start = found + separator.size();
    }

    return list_of(ctx, std::move(pieces));
}

BuiltinResult string_trim(CallContext& ctx, std::span<const Value> args) {
    auto text = TRY(want_string("String.trim/1", args[0]));
    return string_of(ctx, std::string{trim_view(text)});
}

BuiltinResult string_contains(CallContext& /*ctx*/, std::span<const Value> args) {
    auto text = TRY(want_string("String.contains?/2", args[0]));
    auto needle = TRY(want_string("String.contains?/2", args[1]));
    return Value::boolean(text.find(needle) != std::string::npos);
}

BuiltinResult string_duplicate(CallContext& ctx, std::span<const Value> args) {
    auto text = TRY(want_string("String.duplicate/2", args[0]));
    auto times = TRY(want_count("String.duplicate/2", args[1]));

    if (!text.empty() && times > std::numeric_limits<std::size_t>::max() / text.size()) {
        throw ResourceLimitError{};
    }
    ctx.budget().ensure_available(text.size() * times);

    std::string result;
    result.reserve(text.size() * times);
    for (std::size_t i = 0; i < times; ++i) {
        result += text;
    }

    return string_of(ctx, std::move(result));
}

// ----------------------------------------------------------------------------
// Map

BuiltinResult map_get(CallContext& /*ctx*/, std::span<const Value> args) {
    TRY(want_map("Map.get/2", args[0]));

    const Value* found = args[0].as_map().find(args[1]);
    if (found != nullptr) {
        return *found;
    }
    return args.size() == 3 ? args[2] : Value{};
}

BuiltinResult map_put(CallContext& ctx, std::span<const Value> args) {
    TRY(want_map("Map.put/3", args[0]));

    auto entries = args[0].as_map().entries;
    entries.emplace_back(args[1], args[2]);

    return make_map(std::move(entries), &ctx.budget());
}

BuiltinResult map_keys(CallContext& ctx, std::span<const Value> args) {
    TRY(want_map("Map.keys/1", args[0]));

    std::vector<Value> keys;
    for (const auto& [key, _] : args[0].as_map().entries) {
        keys.push_back(key);
    }
    return list_of(ctx, std::move(keys));
}

BuiltinResult map_values(CallContext& ctx, std::span<const Value> args) {
    TRY(want_map("Map.values/1", args[0]));

    std::vector<Value> values;
    for (const auto& [_, val] : args[0].as_map().entries) {
        values.push_back(val);
    }
    return list_of(ctx, std::move(values));
}

BuiltinResult map_has_key(CallContext& /*ctx*/, std::span<const Value> args) {
    TRY(want_map("Map.has_key?/2", args[0]));
    return Value::boolean(args[0].as_map().find(args[1]) != nullptr);
}

// ----------------------------------------------------------------------------
// List

BuiltinResult list_first(CallContext& /*ctx*/, std::span<const Value> args) {
    auto items = TRY(want_list("List.first/1", args[0]));
    return items.empty() ? Value{} : items.front();
}

BuiltinResult list_last(CallContext& /*ctx*/, std::span<const Value> args) {
    auto items = TRY(want_list("List.last/1", args[0]));
    return items.empty() ? Value{} : items.back();
}

BuiltinResult list_duplicate(CallContext& ctx, std::span<const Value> args) {
    auto times = TRY(want_count("List.duplicate/2", args[1]));

    if (times > std::numeric_limits<std::size_t>::max() / sizeof(Value)) {
        throw ResourceLimitError{};
    }
    ctx.budget().ensure_available(list_footprint(times));

    return list_of(ctx, std::vector<Value>(times, args[0]));
}

constexpr auto BUILTINS = std::to_array<Builtin>({
    {KERNEL_MODULE, "div", 2, 2, kernel_div},
    {KERNEL_MODULE, "rem", 2, 2, kernel_rem},
    {KERNEL_MODULE, "abs", 1, 1, kernel_abs},
    {KERNEL_MODULE, "max", 2, 2, kernel_max},
    {KERNEL_MODULE, "min", 2, 2, kernel_min},
    {KERNEL_MODULE, "round", 1, 1, kernel_round},
    {KERNEL_MODULE, "trunc", 1, 1, kernel_trunc},
    {KERNEL_MODULE, "length", 1, 1, kernel_length},
    {KERNEL_MODULE, "hd", 1, 1, kernel_hd},
    {KERNEL_MODULE, "tl", 1, 1, kernel_tl},
    {KERNEL_MODULE, "elem", 2, 2, kernel_elem},
    {KERNEL_MODULE, "tuple_size", 1, 1, kernel_tuple_size},
    {KERNEL_MODULE, "range", 2, 3, kernel_range},
    {KERNEL_MODULE, "to_string", 1, 1, kernel_to_string},
    {KERNEL_MODULE, "inspect", 1, 1, kernel_inspect},
    {KERNEL_MODULE, "raise", 1, 1, kernel_raise},
    {KERNEL_MODULE, "is_integer", 1, 1, kernel_is_type<Value::Type::Integer>},
    {KERNEL_MODULE, "is_float", 1, 1, kernel_is_type<Value::Type::Float>},
    {KERNEL_MODULE, "is_number", 1, 1, kernel_is_number},
    {KERNEL_MODULE, "is_string", 1, 1, kernel_is_type<Value::Type::String>},
    {KERNEL_MODULE, "is_atom", 1, 1, kernel_is_type<Value::Type::Atom>},
    {KERNEL_MODULE, "is_list", 1, 1, kernel_is_type<Value::Type::List>},
    {KERNEL_MODULE, "is_map", 1, 1, kernel_is_type<Value::Type::Map>},
    {KERNEL_MODULE, "is_nil", 1, 1, kernel_is_type<Value::Type::Nil>},
    {KERNEL_MODULE, "is_function", 1, 1, kernel_is_type<Value::Type::Function>},

    {"IO", "puts", 1, 1, io_puts},
    {"IO", "write", 1, 1, io_write},
    {"IO", "inspect", 1, 1, io_inspect},

    {"Enum", "map", 2, 2, enum_map},
    {"Enum", "filter", 2, 2, enum_filter},
    {"Enum", "reduce", 3, 3, enum_reduce},
    {"Enum", "sum", 1, 1, enum_sum},
    {"Enum", "count", 1, 2, enum_count},
    {"Enum", "reverse", 1, 1, enum_reverse},
    {"Enum", "take", 2, 2, enum_take},
    {"Enum", "at", 2, 3, enum_at},
    {"Enum", "member?", 2, 2, enum_member},
    {"Enum", "join", 1, 2, enum_join},
    {"Enum", "sort", 1, 1, enum_sort},

    {"String", "length", 1, 1, string_length},
    {"String", "upcase", 1, 1, string_upcase},
    {"String", "downcase", 1, 1, string_downcase},
    {"String", "reverse", 1, 1, string_reverse},
    {"String", "split", 1, 2, string_split},
    {"String", "trim", 1, 1, string_trim},
    {"String", "contains?", 2, 2, string_contains},
    {"String", "duplicate", 2, 2, string_duplicate},

    {"Map", "get", 2, 3, map_get},
    {"Map", "put", 3, 3, map_put},
    {"Map", "keys", 1, 1, map_keys},
    {"Map", "values", 1, 1, map_values},
    {"Map", "has_key?", 2, 2, map_has_key},

    {"List", "first", 1, 1, list_first},
    {"List", "last", 1, 1, list_last},
    {"List", "duplicate", 2, 2, list_duplicate},
});

} // namespace

std::span<const Builtin> builtin_table() {
    return BUILTINS;
}

const Builtin* find_builtin(std::string_view module, std::string_view name) {
    auto iter =
        ranges::find_if(BUILTINS, [&](const Builtin& entry) { return entry.module == module && entry.name == name; });

    if (iter == BUILTINS.end()) {
        return nullptr;
    }
    return &*iter;
}

bool is_builtin_module(std::string_view module) {
    return ranges::any_of(BUILTINS, [module](const Builtin& entry) { return entry.module == module; });
}

} // namespace codekata::lang
