// Heavily inspired by: https://blog.ganets.ky/StaticString/
// In accordance with above mentioned site's licensing:
//
// The MIT License (MIT)
// Copyright (c) 2013-2018 Blackrock Digital LLC
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#pragma once

#include <fmt/format.h>
#include <range/v3/algorithm/copy_n.hpp>

#include <array>
#include <cstddef>
#include <iterator>
#include <string>
#include <string_view>
#include <type_traits>

namespace codekata {

/// A compile-time string usable as a non-type template parameter
/// Guaranteed to be null-terminated
template <std::size_t Size>
class StaticString
{
public:
    constexpr StaticString() = default;

    // NOLINTNEXTLINE(google-explicit-constructor,*-avoid-c-arrays)
    constexpr /*implicit*/ StaticString(const char (&input)[Size + 1]) {
        ranges::copy_n(std::data(input), Size + 1, data.begin());
    }

    std::array<char, Size + 1> data{};

    constexpr std::size_t size() const { return Size; }

    constexpr auto begin() const { return data.cbegin(); }

    constexpr auto end() const { return data.cend() - 1; }

    // NOLINTNEXTLINE(google-explicit-constructor)
    constexpr /*implicit*/ operator std::string_view() const { return {data.data(), Size}; }

    std::string str() const { return data.data(); }

    template <std::size_t OtherSize>
    constexpr bool operator==(const StaticString<OtherSize>& rhs) const {
        return std::string_view{*this} == std::string_view{rhs};
    }

    constexpr bool operator==(std::string_view rhs) const { return std::string_view{*this} == rhs; }
};

// Deduction guide
template <std::size_t N>
// NOLINTNEXTLINE(*-avoid-c-arrays)
StaticString(const char (&input)[N]) -> StaticString<N - 1>;

template <std::size_t N>
constexpr std::string_view format_as(const StaticString<N>& str) {
    return str;
}

} // namespace codekata

// Disable range formatting for StaticString to prevent ambiguity
template <std::size_t N, typename CharType>
struct fmt::is_range<codekata::StaticString<N>, CharType> : std::false_type
{
};
