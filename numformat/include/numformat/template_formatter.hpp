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
#ifndef NUMFORMAT_TEMPLATE_FORMATTER_HPP
#define NUMFORMAT_TEMPLATE_FORMATTER_HPP

#include "buffer.hpp"
#include "format.hpp"

#include <string>
#include <type_traits>  // enable_if, is_integral, is_same, decay
#include <utility>      // forward

namespace numformat {

namespace detail {

// Each format_argument overload looks at the conversion specifier at pformat
// (the character after '%'). It returns a pointer past the specifier, or
// nullptr if it can not handle that specifier for its argument type.
template <class Format, class Integer>
typename std::enable_if<std::is_integral<Integer>::value
        && !std::is_same<Integer, bool>::value, char const*>::type
format_argument(std::string* pout, Format const& format, char const* pformat,
        Integer v)
{
    if(*pformat != 'd')
        return nullptr;
    buffer buf;
    buf.write_formatted(v, format);
    pout->append(buf.data(), buf.size());
    return pformat + 1;
}

template <class Format>
char const* format_argument(std::string* pout, Format const&,
        char const* pformat, char const* v)
{
    if(*pformat != 's')
        return nullptr;
    pout->append(v);
    return pformat + 1;
}

template <class Format>
char const* format_argument(std::string* pout, Format const&,
        char const* pformat, std::string const& v)
{
    if(*pformat != 's')
        return nullptr;
    pout->append(v);
    return pformat + 1;
}

}   // namespace detail

// Expands a printf-like template. "%d" takes an integer argument and writes
// it grouped according to the format description, "%s" takes a string and
// "%%" gives a single '%'. A specifier that does not suit its argument is
// copied verbatim and the argument is skipped. Specifiers left over when the
// arguments run out are copied verbatim as well.
class template_formatter {
public:
    template <class Format>
    static void format(std::string* pout, Format const&, char const* pformat)
    {
        while((pformat = next_specifier(pout, pformat)) != nullptr)
            append_percent(pout);
    }

    template <class Format, typename T, typename... Args>
    static void format(std::string* pout, Format const& format,
            char const* pformat, T&& value, Args&&... args)
    {
        static_assert(is_format<Format>::value,
            "Format does not provide the symbols of a format description");
        pformat = next_specifier(pout, pformat);
        if(!pformat)
            return;

        char const* pnext_format = detail::format_argument(pout, format,
                pformat, std::forward<T>(value));
        if(pnext_format)
            pformat = pnext_format;
        else
            append_percent(pout);
        return template_formatter::format(pout, format, pformat,
                std::forward<Args>(args)...);
    }

private:
    static void append_percent(std::string* pout);
    // Copies text up to the next conversion specifier and returns a pointer
    // to the character after its '%', or nullptr at the end of the template.
    static char const* next_specifier(std::string* pout, char const* pformat);
};

template <class Format, typename... Args>
std::string format_template(Format const& format, char const* pformat,
        Args&&... args)
{
    std::string s;
    template_formatter::format(&s, format, pformat,
            std::forward<Args>(args)...);
    return s;
}

}   // namespace numformat

#endif  // NUMFORMAT_TEMPLATE_FORMATTER_HPP
