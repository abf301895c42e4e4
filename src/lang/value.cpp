#include <codekata/lang/value.hpp>

#include <codekata/lang/memory_budget.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <libassert/assert.hpp>
#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/view/transform.hpp>
#include <range/v3/range/conversion.hpp>

#include <algorithm>
#include <cmath>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace codekata::lang {

namespace {

constexpr std::size_t VALUE_SIZE = sizeof(Value);

std::size_t nested_depth(const std::vector<Value>& items) {
    std::size_t deepest = 0;
    for (const auto& item : items) {
        deepest = std::max(deepest, item.depth());
    }
    if (deepest + 1 > MAX_VALUE_DEPTH) {
        throw NestingLimitError{};
    }
    return deepest + 1;
}

std::string quote(std::string_view text) {
    std::string result = "\"";
    for (char chr : text) {
        switch (chr) {
        case '\n':
            result += "\\n";
            break;
        case '\t':
            result += "\\t";
            break;
        case '\r':
            result += "\\r";
            break;
        case '\0':
            result += "\\0";
            break;
        case '\\':
            result += "\\\\";
            break;
        case '"':
            result += "\\\"";
            break;
        default:
            result += chr;
        }
    }
    result += '"';
    return result;
}

std::string join_inspected(const std::vector<Value>& items) {
    std::string result;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i != 0) {
            result += ", ";
        }
        result += inspect(items[i]);
    }
    return result;
}

} // namespace

bool Value::is_truthy() const {
    if (is_nil()) {
        return false;
    }
    if (type() == Type::Boolean) {
        return as_bool();
    }
    return true;
}

double Value::as_number() const {
    DEBUG_ASSERT(is_number());
    if (type() == Type::Integer) {
        return static_cast<double>(as_int());
    }
    return as_float();
}

const std::string& Value::as_string() const {
    return std::get<std::shared_ptr<const StringData>>(data_)->text;
}

const ListData& Value::as_list() const {
    return *std::get<std::shared_ptr<const ListData>>(data_);
}

const TupleData& Value::as_tuple() const {
    return *std::get<std::shared_ptr<const TupleData>>(data_);
}

const MapData& Value::as_map() const {
    return *std::get<std::shared_ptr<const MapData>>(data_);
}

const FunctionData& Value::as_function() const {
    return *std::get<std::shared_ptr<const FunctionData>>(data_);
}

const std::vector<Value>& Value::elements() const {
    if (type() == Type::Tuple) {
        return as_tuple().items;
    }
    return as_list().items;
}

std::size_t Value::depth() const {
    switch (type()) {
    case Type::List:
        return as_list().depth;
    case Type::Tuple:
        return as_tuple().depth;
    case Type::Map:
        return as_map().depth;
    case Type::Function:
        return as_function().depth;
    default:
        return 0;
    }
}

bool Value::operator==(const Value& rhs) const {
    if (is_number() && rhs.is_number()) {
        if (type() == Type::Integer && rhs.type() == Type::Integer) {
            return as_int() == rhs.as_int();
        }
        return as_number() == rhs.as_number();
    }

    if (type() != rhs.type()) {
        return false;
    }

    switch (type()) {
    case Type::Nil:
        return true;
    case Type::Boolean:
        return as_bool() == rhs.as_bool();
    case Type::String:
        return as_string() == rhs.as_string();
    case Type::Atom:
        return as_atom() == rhs.as_atom();
    case Type::List:
    case Type::Tuple:
        return elements() == rhs.elements();
    case Type::Map: {
        const auto& lhs_entries = as_map().entries;
        const auto& rhs_map = rhs.as_map();
        if (lhs_entries.size() != rhs_map.entries.size()) {
            return false;
        }
        return ranges::all_of(lhs_entries, [&rhs_map](const auto& entry) {
            const Value* other = rhs_map.find(entry.first);
            return other != nullptr && *other == entry.second;
        });
    }
    case Type::Function:
        return &as_function() == &rhs.as_function();
    case Type::Integer:
    case Type::Float:
        break;
    }

    // numbers were compared above
    return false;
}

const Value* MapData::find(const Value& key) const {
    auto iter = ranges::find_if(entries, [&key](const auto& entry) { return entry.first == key; });
    if (iter == entries.end()) {
        return nullptr;
    }
    return &iter->second;
}

Value make_string(std::string text, MemoryBudget* budget) {
    auto reservation = reserve_in(budget, sizeof(StringData) + text.size());
    return Value{std::make_shared<const StringData>(StringData{std::move(text), std::move(reservation)})};
}

std::size_t list_footprint(std::size_t count) {
    return sizeof(ListData) + count * VALUE_SIZE;
}

Value make_list(std::vector<Value> items, MemoryBudget* budget) {
    std::size_t depth = nested_depth(items);
    auto reservation = reserve_in(budget, list_footprint(items.size()));
    return Value{std::make_shared<const ListData>(ListData{std::move(items), depth, std::move(reservation)})};
}

Value make_tuple(std::vector<Value> items, MemoryBudget* budget) {
    std::size_t depth = nested_depth(items);
    auto reservation = reserve_in(budget, sizeof(TupleData) + items.size() * VALUE_SIZE);
    return Value{std::make_shared<const TupleData>(TupleData{std::move(items), depth, std::move(reservation)})};
}

Value make_map(std::vector<std::pair<Value, Value>> entries, MemoryBudget* budget) {
    std::vector<std::pair<Value, Value>> unique;
    unique.reserve(entries.size());

    std::size_t deepest = 0;
    for (auto& [key, val] : entries) {
        deepest = std::max({deepest, key.depth(), val.depth()});

        auto existing = std::find_if(unique.begin(), unique.end(), [&key](const auto& kv) { return kv.first == key; });
        if (existing != unique.end()) {
            existing->second = std::move(val);
        } else {
            unique.emplace_back(std::move(key), std::move(val));
        }
    }

    if (deepest + 1 > MAX_VALUE_DEPTH) {
        throw NestingLimitError{};
    }

    auto reservation = reserve_in(budget, sizeof(MapData) + unique.size() * 2 * VALUE_SIZE);
    return Value{std::make_shared<const MapData>(MapData{std::move(unique), deepest + 1, std::move(reservation)})};
}

Value make_function(std::string name, std::vector<std::string> params, NodePtr body,
                    std::vector<std::pair<std::string, Value>> captured, MemoryBudget* budget) {
    std::size_t deepest = 0;
    for (const auto& [_, val] : captured) {
        deepest = std::max(deepest, val.depth());
    }
    if (deepest + 1 > MAX_VALUE_DEPTH) {
        throw NestingLimitError{};
    }

    std::size_t bytes = sizeof(FunctionData) + captured.size() * (sizeof(std::string) + VALUE_SIZE);
    auto reservation = reserve_in(budget, bytes);
    return Value{std::make_shared<const FunctionData>(FunctionData{std::move(name), std::move(params), std::move(body),
                                                                   std::move(captured), deepest + 1,
                                                                   std::move(reservation)})};
}

std::string_view type_name(const Value& value) {
    switch (value.type()) {
    case Value::Type::Nil:
        return "nil";
    case Value::Type::Boolean:
        return "boolean";
    case Value::Type::Integer:
        return "integer";
    case Value::Type::Float:
        return "float";
    case Value::Type::String:
        return "string";
    case Value::Type::Atom:
        return "atom";
    case Value::Type::List:
        return "list";
    case Value::Type::Tuple:
        return "tuple";
    case Value::Type::Map:
        return "map";
    case Value::Type::Function:
        return "function";
    }
    return "unknown";
}

std::optional<std::partial_ordering> compare(const Value& lhs, const Value& rhs) {
    if (lhs.type() == Value::Type::Integer && rhs.type() == Value::Type::Integer) {
        return lhs.as_int() <=> rhs.as_int();
    }
    if (lhs.is_number() && rhs.is_number()) {
        return lhs.as_number() <=> rhs.as_number();
    }
    if (lhs.type() == Value::Type::String && rhs.type() == Value::Type::String) {
        return lhs.as_string() <=> rhs.as_string();
    }
    return std::nullopt;
}

std::string format_float(double value) {
    if (std::isnan(value)) {
        return "nan";
    }
    if (std::isinf(value)) {
        return value < 0 ? "-inf" : "inf";
    }

    std::string text = fmt::format("{}", value);

    auto exponent = text.find('e');
    std::string mantissa = text.substr(0, exponent);
    std::string suffix;

    if (exponent != std::string::npos) {
        // "1e+20" -> "1.0e20"
        std::string_view exp_digits{text.data() + exponent + 1, text.size() - exponent - 1};
        if (exp_digits.starts_with('+')) {
            exp_digits.remove_prefix(1);
        }
        suffix = fmt::format("e{}", exp_digits);
    }

    if (mantissa.find('.') == std::string::npos) {
        mantissa += ".0";
    }

    return mantissa + suffix;
}

std::string inspect(const Value& value) {
    switch (value.type()) {
    case Value::Type::Nil:
        return "nil";
    case Value::Type::Boolean:
        return value.as_bool() ? "true" : "false";
    case Value::Type::Integer:
        return fmt::format("{}", value.as_int());
    case Value::Type::Float:
        return format_float(value.as_float());
    case Value::Type::String:
        return quote(value.as_string());
    case Value::Type::Atom:
        return ":" + value.as_atom().name;
    case Value::Type::List:
        return "[" + join_inspected(value.as_list().items) + "]";
    case Value::Type::Tuple:
        return "{" + join_inspected(value.as_tuple().items) + "}";
    case Value::Type::Map: {
        auto entries = value.as_map().entries | ranges::views::transform([](const auto& entry) {
                           return fmt::format("{} => {}", inspect(entry.first), inspect(entry.second));
                       }) |
                       ranges::to<std::vector<std::string>>();
        return fmt::format("%{{{}}}", fmt::join(entries, ", "));
    }
    case Value::Type::Function: {
        const auto& func = value.as_function();
        return fmt::format("#Function<{}/{}>", func.name.empty() ? "fn" : func.name, func.params.size());
    }
    }

    return "<unknown>";
}

std::string to_display_string(const Value& value) {
    if (value.type() == Value::Type::String) {
        return value.as_string();
    }
    return inspect(value);
}

} // namespace codekata::lang
