/* This file is part of numformat
 * Copyright 2026 The numformat authors
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */
#ifndef NUMFORMAT_FORMAT_HPP
#define NUMFORMAT_FORMAT_HPP

#include "bounded_string.hpp"
#include "grouping.hpp"

#include <type_traits>  // is_convertible, integral_constant
#include <utility>      // declval

// A format description is any type with these const member functions:
//
//   decimal_string     decimal() const;
//   grouping_policy    grouping() const;
//   infinity_string    infinity() const;
//   minus_sign_string  minus_sign() const;
//   nan_string         nan() const;
//   plus_sign_string   plus_sign() const;
//   separator_string   separator() const;
//
// Returning a const reference works as well. numformat::locale,
// numformat::system_locale and numformat::custom_format are the three
// implementations that come with the library, but users can provide their own,
// e.g. one that picks symbols from application settings. Since the symbols are
// bounded strings they have already been validated by the time the format
// description exists.

namespace numformat {

namespace detail {

template <class Format>
class is_format_helper {
private:
    template <class F>
    static typename std::integral_constant<bool,
        std::is_convertible<decltype(std::declval<F const&>().decimal()), decimal_string const&>::value &&
        std::is_convertible<decltype(std::declval<F const&>().grouping()), grouping_policy>::value &&
        std::is_convertible<decltype(std::declval<F const&>().infinity()), infinity_string const&>::value &&
        std::is_convertible<decltype(std::declval<F const&>().minus_sign()), minus_sign_string const&>::value &&
        std::is_convertible<decltype(std::declval<F const&>().nan()), nan_string const&>::value &&
        std::is_convertible<decltype(std::declval<F const&>().plus_sign()), plus_sign_string const&>::value &&
        std::is_convertible<decltype(std::declval<F const&>().separator()), separator_string const&>::value
        >::type test(int);

    template <class F>
    static std::false_type test(...);

public:
    typedef decltype(test<Format>(0)) type;
};

}   // namespace detail

template <class Format>
struct is_format : public detail::is_format_helper<Format>::type
{
};

}   // namespace numformat

#endif  // NUMFORMAT_FORMAT_HPP
