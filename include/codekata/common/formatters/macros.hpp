#pragma once

#include <codekata/common/formatters/enum.hpp>
#include <codekata/common/static_string.hpp>

#include <boost/preprocessor/punctuation/comma_if.hpp>
#include <boost/preprocessor/seq/for_each_i.hpp>
#include <boost/preprocessor/stringize.hpp>
#include <boost/preprocessor/tuple/size.hpp>
#include <boost/preprocessor/tuple/to_seq.hpp>
#include <fmt/format.h>

#include <utility>

#define FMT_SERIALIZE_ENUMERATOR_IMPL(r, enum_name, i, ident)                                                          \
    BOOST_PP_COMMA_IF(i) std::pair {                                                                                   \
        ::codekata::StaticString{BOOST_PP_STRINGIZE(ident)}, enum_name::ident                                          \
    }

/// Generates a fmt::formatter for an enum that prints enumerator names.
/// ``{:?}`` additionally prefixes the enum's name, e.g. ``ErrorKind{TimedOut}``
#define FMT_SERIALIZE_ENUM(enum_name, ... /*enumerators*/)                                                             \
    template <>                                                                                                        \
    struct fmt::formatter<enum_name>                                                                                   \
        : ::codekata::detail::EnumFormatter<enum_name, #enum_name                                                     \
                                            __VA_OPT__(, BOOST_PP_SEQ_FOR_EACH_I(                                        \
                                                FMT_SERIALIZE_ENUMERATOR_IMPL, enum_name,                              \
                                                BOOST_PP_TUPLE_TO_SEQ(BOOST_PP_TUPLE_SIZE((__VA_ARGS__)),              \
                                                                      (__VA_ARGS__))))>                                \
    {                                                                                                                  \
    }
