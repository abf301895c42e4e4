#include "sandbox/report_codec.hpp"

#include <codekata/classified_error.hpp>
#include <codekata/common/error_types.hpp>
#include <codekata/common/expected.hpp>
#include <codekata/lang/value.hpp>

#include <fmt/format.h>
#include <gsl/narrow>

#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace codekata {

namespace {

constexpr std::string_view MAGIC = "CKR1";
constexpr char VALUE_TAG = 'V';
constexpr char ERROR_TAG = 'E';

using lang::Value;

struct DecodeError
{
    std::string reason;
};

template <typename T>
using Decoded = Expected<T, DecodeError>;

template <typename... Args>
DecodeError decode_error(fmt::format_string<Args...> fmt, Args&&... args) {
    return {fmt::format(fmt, std::forward<Args>(args)...)};
}

class Encoder
{
public:
    void raw(std::string_view bytes) { out_ += bytes; }

    template <typename T>
    void scalar(T val) {
        char bytes[sizeof(T)];
        std::memcpy(bytes, &val, sizeof(T));
        out_.append(bytes, sizeof(T));
    }

    void str(std::string_view text) {
        scalar(gsl::narrow<std::uint32_t>(text.size()));
        raw(text);
    }

    void value(const Value& val) {
        scalar(static_cast<std::uint8_t>(val.type()));

        switch (val.type()) {
        case Value::Type::Nil:
            break;
        case Value::Type::Boolean:
            scalar(static_cast<std::uint8_t>(val.as_bool()));
            break;
        case Value::Type::Integer:
            scalar(val.as_int());
            break;
        case Value::Type::Float:
            scalar(std::bit_cast<std::uint64_t>(val.as_float()));
            break;
        case Value::Type::String:
            str(val.as_string());
            break;
        case Value::Type::Atom:
            str(val.as_atom().name);
            break;
        case Value::Type::List:
        case Value::Type::Tuple:
            scalar(gsl::narrow<std::uint32_t>(val.elements().size()));
            for (const auto& item : val.elements()) {
                value(item);
            }
            break;
        case Value::Type::Map:
            scalar(gsl::narrow<std::uint32_t>(val.as_map().entries.size()));
            for (const auto& [key, item] : val.as_map().entries) {
                value(key);
                value(item);
            }
            break;
        case Value::Type::Function:
            str(val.as_function().name);
            scalar(gsl::narrow<std::uint32_t>(val.as_function().params.size()));
            break;
        }
    }

    std::string take() { return std::move(out_); }

private:
    std::string out_;
};

class Decoder
{
public:
    explicit Decoder(std::string_view data)
        : data_{data} {}

    bool at_end() const { return pos_ == data_.size(); }

    std::size_t position() const { return pos_; }

    Decoded<std::string_view> raw(std::size_t count) {
        if (count > data_.size() - pos_) {
            return decode_error("truncated report: wanted {} bytes at offset {}, {} left", count, pos_,
                               data_.size() - pos_);
        }
        auto bytes = data_.substr(pos_, count);
        pos_ += count;
        return bytes;
    }

    template <typename T>
    Decoded<T> scalar() {
        auto bytes = TRY(raw(sizeof(T)));
        T val{};
        std::memcpy(&val, bytes.data(), sizeof(T));
        return val;
    }

    Decoded<std::string> str() {
        auto size = TRY(scalar<std::uint32_t>());
        return std::string{TRY(raw(size))};
    }

    Decoded<Value> value(std::size_t depth = 0) {
        if (depth > lang::MAX_VALUE_DEPTH) {
            return decode_error("report value is nested too deeply");
        }

        auto tag = TRY(scalar<std::uint8_t>());

        switch (static_cast<Value::Type>(tag)) {
        case Value::Type::Nil:
            return Value{};
        case Value::Type::Boolean:
            return Value::boolean(TRY(scalar<std::uint8_t>()) != 0);
        case Value::Type::Integer:
            return Value::integer(TRY(scalar<std::int64_t>()));
        case Value::Type::Float:
            return Value::floating(std::bit_cast<double>(TRY(scalar<std::uint64_t>())));
        case Value::Type::String:
            return lang::make_string(TRY(str()));
        case Value::Type::Atom:
            return Value::atom(TRY(str()));
        case Value::Type::List:
        case Value::Type::Tuple: {
            auto items = TRY(sequence(depth));
            return static_cast<Value::Type>(tag) == Value::Type::List ? lang::make_list(std::move(items))
                                                                      : lang::make_tuple(std::move(items));
        }
        case Value::Type::Map: {
            auto count = TRY(element_count(2));
            std::vector<std::pair<Value, Value>> entries;
            entries.reserve(count);
            for (std::uint32_t i = 0; i < count; ++i) {
                auto key = TRY(value(depth + 1));
                auto item = TRY(value(depth + 1));
                entries.emplace_back(std::move(key), std::move(item));
            }
            return lang::make_map(std::move(entries));
        }
        case Value::Type::Function: {
            auto name = TRY(str());
            auto arity = TRY(element_count(0));
            return lang::make_function(std::move(name), std::vector<std::string>(arity, "_"), nullptr, {});
        }
        }

        return decode_error("unknown value tag {} at offset {}", tag, pos_ - 1);
    }

private:
    /// Reads an element count and rejects counts that cannot fit in what is left
    Decoded<std::uint32_t> element_count(std::size_t min_bytes_each) {
        auto count = TRY(scalar<std::uint32_t>());
        if (min_bytes_each != 0 && count > (data_.size() - pos_) / min_bytes_each) {
            return decode_error("element count {} exceeds the remaining report size", count);
        }
        return count;
    }

    Decoded<std::vector<Value>> sequence(std::size_t depth) {
        auto count = TRY(element_count(1));
        std::vector<Value> items;
        items.reserve(count);
        for (std::uint32_t i = 0; i < count; ++i) {
            items.push_back(TRY(value(depth + 1)));
        }
        return items;
    }

    std::string_view data_;
    std::size_t pos_ = 0;
};

} // namespace

std::string encode_report(const WorkerReport& report) {
    Encoder enc;
    enc.raw(MAGIC);

    if (const auto* val = std::get_if<Value>(&report.outcome)) {
        enc.raw(std::string_view{&VALUE_TAG, 1});
        enc.value(*val);
    } else {
        const auto& err = std::get<ClassifiedError>(report.outcome);
        enc.raw(std::string_view{&ERROR_TAG, 1});
        enc.scalar(static_cast<std::uint8_t>(err.category));
        enc.str(err.message);
    }

    return enc.take();
}

namespace {

Decoded<WorkerReport> decode_impl(std::string_view data) {
    Decoder dec{data};

    if (TRY(dec.raw(MAGIC.size())) != MAGIC) {
        return decode_error("report does not start with the expected magic");
    }

    auto tag = TRY(dec.raw(1));
    WorkerReport report;

    if (tag.front() == VALUE_TAG) {
        report.outcome = TRY(dec.value());
    } else if (tag.front() == ERROR_TAG) {
        auto category = TRY(dec.scalar<std::uint8_t>());
        if (category > static_cast<std::uint8_t>(ErrorCategory::UnknownRuntimeError)) {
            return decode_error("unknown error category {}", category);
        }
        auto message = TRY(dec.str());
        report.outcome = ClassifiedError{static_cast<ErrorCategory>(category), std::move(message)};
    } else {
        return decode_error("unknown report kind {:#x}", static_cast<unsigned char>(tag.front()));
    }

    if (!dec.at_end()) {
        return decode_error("{} trailing bytes after report", data.size() - dec.position());
    }

    return report;
}

} // namespace

Expected<WorkerReport, std::string> decode_report(std::string_view data) {
    auto decoded = decode_impl(data);

    if (!decoded) {
        return {unexpected, decoded.error().reason};
    }

    return std::move(decoded).value();
}

} // namespace codekata
