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
#ifndef NUMFORMAT_ERROR_HPP
#define NUMFORMAT_ERROR_HPP

#include <string>
#include <system_error>     // error_code, error_condition, system_error
#include <type_traits>      // true_type

namespace numformat {

// All validation happens when a symbol, a custom format or a locale is
// constructed. Once a format description exists, formatting with it cannot
// fail.
enum class errc
{
    // A symbol is longer than its bounded string type can hold.
    exceeds_maximum_length = 1,
    // A symbol contains a digit, a NUL byte or malformed UTF-8, or is empty
    // where the symbol is required.
    contains_forbidden_character = 2,
    // Every symbol is valid on its own but the combination is ambiguous,
    // e.g. the separator is the same as the decimal point.
    invalid_combination = 3,
    // The operating system could not supply a locale.
    provider_unavailable = 4,
    // Lookup of a locale name that does not exist.
    unknown_locale_name = 5
};

std::error_category const& error_category();

inline std::error_code make_error_code(errc ec)
{
    return std::error_code(static_cast<int>(ec), error_category());
}

inline std::error_condition make_error_condition(errc ec)
{
    return std::error_condition(static_cast<int>(ec), error_category());
}

// Thrown by the throwing variants of every fallible operation. The
// non-throwing variants report the same code through an std::error_code&
// parameter.
class error : public std::system_error {
public:
    explicit error(std::error_code const& ec) :
        system_error(ec)
    {
    }

    error(std::error_code const& ec, std::string const& what_arg) :
        system_error(ec, what_arg)
    {
    }
};

}   // namespace numformat

namespace std
{
    template <>
    struct is_error_code_enum<numformat::errc> : public true_type {};
}

#endif  // NUMFORMAT_ERROR_HPP
