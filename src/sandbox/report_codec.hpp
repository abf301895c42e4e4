#pragma once

#include <codekata/classified_error.hpp>
#include <codekata/common/expected.hpp>
#include <codekata/lang/value.hpp>

#include <string>
#include <string_view>
#include <variant>

namespace codekata {

/// What a worker hands back to its parent once the program has finished.
/// Program output is not part of the report; it streams over its own pipe.
struct WorkerReport
{
    std::variant<lang::Value, ClassifiedError> outcome;
};

/// Compact tagged binary encoding:
///
///   "CKR1" ('V' value | 'E' u8 category, str message)
///
/// Values are a one byte type tag followed by the payload. Integers and floats are 8 bytes,
/// strings and atoms a u32 length then raw bytes, lists and tuples a u32 count then the
/// elements, maps a u32 count then alternating keys and values. Functions only keep their
/// name and arity.
///
/// Both ends run on the same host, so native byte order is used.
/// Throws gsl::narrowing_error for a length that does not fit in 32 bits.
std::string encode_report(const WorkerReport& report);

/// Never trusts its input; any inconsistency is described in the error
Expected<WorkerReport, std::string> decode_report(std::string_view data);

} // namespace codekata
