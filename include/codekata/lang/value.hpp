#pragma once

#include <codekata/common/formatters/macros.hpp>
#include <codekata/lang/memory_budget.hpp>

#include <compare>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace codekata::lang {

struct Node;
using NodePtr = std::shared_ptr<const Node>;

struct StringData;
struct ListData;
struct TupleData;
struct MapData;
struct FunctionData;

/// Containers may not nest deeper than this
inline constexpr std::size_t MAX_VALUE_DEPTH = 256;

/// Thrown when building a container would exceed MAX_VALUE_DEPTH
class NestingLimitError : public std::length_error
{
public:
    NestingLimitError()
        : std::length_error{"values nested too deeply"} {}
};

struct Atom
{
    std::string name;

    bool operator==(const Atom&) const = default;
};

/// A Kata runtime value. Cheap to copy; composite payloads are shared and immutable.
class Value
{
public:
    enum class Type { Nil, Boolean, Integer, Float, String, Atom, List, Tuple, Map, Function };

    Value() = default;

    static Value boolean(bool val) { return Value{Storage{val}}; }

    static Value integer(std::int64_t val) { return Value{Storage{val}}; }

    static Value floating(double val) { return Value{Storage{val}}; }

    static Value atom(std::string name) { return Value{Storage{Atom{std::move(name)}}}; }

    static Value ok() { return atom("ok"); }

    explicit Value(std::shared_ptr<const StringData> data)
        : data_{std::move(data)} {}

    explicit Value(std::shared_ptr<const ListData> data)
        : data_{std::move(data)} {}

    explicit Value(std::shared_ptr<const TupleData> data)
        : data_{std::move(data)} {}

    explicit Value(std::shared_ptr<const MapData> data)
        : data_{std::move(data)} {}

    explicit Value(std::shared_ptr<const FunctionData> data)
        : data_{std::move(data)} {}

    Type type() const { return static_cast<Type>(data_.index()); }

    bool is_nil() const { return type() == Type::Nil; }

    bool is_number() const { return type() == Type::Integer || type() == Type::Float; }

    /// Only ``false`` and ``nil`` are falsy
    bool is_truthy() const;

    bool as_bool() const { return std::get<bool>(data_); }

    std::int64_t as_int() const { return std::get<std::int64_t>(data_); }

    double as_float() const { return std::get<double>(data_); }

    /// Integer or float, widened to double
    double as_number() const;

    const Atom& as_atom() const { return std::get<Atom>(data_); }

    const std::string& as_string() const;

    const ListData& as_list() const;

    const TupleData& as_tuple() const;

    const MapData& as_map() const;

    const FunctionData& as_function() const;

    /// Elements of a list or tuple
    const std::vector<Value>& elements() const;

    /// 0 for scalars, 1 + deepest element for containers and closures
    std::size_t depth() const;

    /// Structural equality; integers and floats compare numerically
    bool operator==(const Value& rhs) const;

private:
    using Storage = std::variant<std::monostate, bool, std::int64_t, double, std::shared_ptr<const StringData>, Atom,
                                 std::shared_ptr<const ListData>, std::shared_ptr<const TupleData>,
                                 std::shared_ptr<const MapData>, std::shared_ptr<const FunctionData>>;

    explicit Value(Storage data)
        : data_{std::move(data)} {}

    Storage data_;
};

struct StringData
{
    std::string text;
    MemoryBudget::Reservation reservation;
};

struct ListData
{
    std::vector<Value> items;
    std::size_t depth = 1;
    MemoryBudget::Reservation reservation;
};

struct TupleData
{
    std::vector<Value> items;
    std::size_t depth = 1;
    MemoryBudget::Reservation reservation;
};

/// Insertion ordered; keys are unique
struct MapData
{
    std::vector<std::pair<Value, Value>> entries;
    std::size_t depth = 1;
    MemoryBudget::Reservation reservation;

    const Value* find(const Value& key) const;
};

struct FunctionData
{
    std::string name; ///< empty for anonymous ``fn``
    std::vector<std::string> params;
    NodePtr body;
    /// Closure environment, captured by value at creation. Empty for named definitions.
    std::vector<std::pair<std::string, Value>> captured;
    std::size_t depth = 1;
    MemoryBudget::Reservation reservation;
};

// Factories. A null budget means the value is not accounted (e.g., literals in the AST).
// All of these may throw ResourceLimitError or NestingLimitError.
Value make_string(std::string text, MemoryBudget* budget = nullptr);
Value make_list(std::vector<Value> items, MemoryBudget* budget = nullptr);
Value make_tuple(std::vector<Value> items, MemoryBudget* budget = nullptr);
/// Later duplicates of a key replace the earlier value in place
Value make_map(std::vector<std::pair<Value, Value>> entries, MemoryBudget* budget = nullptr);
Value make_function(std::string name, std::vector<std::string> params, NodePtr body,
                    std::vector<std::pair<std::string, Value>> captured, MemoryBudget* budget = nullptr);

/// Approximate bytes a list of ``count`` elements accounts for
std::size_t list_footprint(std::size_t count);

/// "integer", "string", ...
std::string_view type_name(const Value& value);

/// Ordering for two numbers or two strings; nullopt when the values are not comparable
std::optional<std::partial_ordering> compare(const Value& lhs, const Value& rhs);

/// Canonical source-like rendering: strings quoted, atoms with ':'
std::string inspect(const Value& value);

/// Rendering used by IO.puts and to_string: strings raw, everything else inspected
std::string to_display_string(const Value& value);

/// Shortest round-trip rendering that always reads back as a float ("3.0", "0.1", "1.0e20")
std::string format_float(double value);

} // namespace codekata::lang

FMT_SERIALIZE_ENUM(::codekata::lang::Value::Type, Nil, Boolean, Integer, Float, String, Atom, List, Tuple, Map,
                   Function);
