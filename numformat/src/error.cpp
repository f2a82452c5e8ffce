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
#include <numformat/error.hpp>

#include <stdexcept>    // invalid_argument

namespace numformat {

namespace {
class error_category_t : public std::error_category {
public:
    char const* name() const noexcept override;
    std::string message(int condition) const override;
};

char const* error_category_t::name() const noexcept
{
    return "numformat";
}

std::string error_category_t::message(int condition) const
{
    switch(static_cast<errc>(condition)) {
    case errc::exceeds_maximum_length:
        return "symbol exceeds maximum length";
    case errc::contains_forbidden_character:
        return "symbol contains forbidden character";
    case errc::invalid_combination:
        return "invalid combination of symbols";
    case errc::provider_unavailable:
        return "locale provider unavailable";
    case errc::unknown_locale_name:
        return "unknown locale name";
    }
    throw std::invalid_argument("invalid condition code");
}

}   // anonymous namespace

std::error_category const& error_category()
{
    static error_category_t ec;
    return ec;
}

}   // namespace numformat
