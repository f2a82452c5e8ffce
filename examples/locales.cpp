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
// Formats the same number with every built-in locale, then with the locale
// of the operating system.
#include <numformat/locale.hpp>
#include <numformat/system_locale.hpp>
#include <numformat/template_formatter.hpp>

#include <iostream>

int main()
{
    long long const value = -1234567890;
    for(std::string const& name : numformat::locale::available_names()) {
        numformat::locale loc = numformat::locale::from_name(name);
        std::cout << numformat::format_template(loc, "%s\t%d", name, value)
            << std::endl;
    }

    std::error_code ec;
    numformat::system_locale sys = numformat::system_locale::default_locale(ec);
    if(ec) {
        std::cout << "no system locale: " << ec.message() << std::endl;
        return 1;
    }
    std::cout << numformat::format_template(sys, "%s (system)\t%d",
        sys.name(), value) << std::endl;
    return 0;
}
