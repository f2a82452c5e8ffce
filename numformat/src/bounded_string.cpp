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
#include <numformat/bounded_string.hpp>

#include <cstdint>  // uint32_t

namespace numformat {

constexpr std::size_t decimal_kind::max_size;
constexpr std::size_t separator_kind::max_size;
constexpr std::size_t minus_sign_kind::max_size;
constexpr std::size_t plus_sign_kind::max_size;
constexpr std::size_t infinity_kind::max_size;
constexpr std::size_t nan_kind::max_size;

namespace detail {

bool is_valid_utf8(char const* s, std::size_t size) noexcept
{
    // Smallest code point that may be encoded with a sequence of the given
    // number of continuation bytes. Anything below is an overlong encoding.
    static std::uint32_t const minimum_code_point[] = {0, 0x80, 0x800, 0x10000};

    unsigned char const* p = reinterpret_cast<unsigned char const*>(s);
    std::size_t pos = 0;
    while(pos != size) {
        unsigned char c = p[pos];
        if(c < 0x80) {
            ++pos;
            continue;
        }

        std::size_t continuation;
        std::uint32_t code_point;
        if((c & 0xe0) == 0xc0) {
            continuation = 1;
            code_point = c & 0x1f;
        } else if((c & 0xf0) == 0xe0) {
            continuation = 2;
            code_point = c & 0x0f;
        } else if((c & 0xf8) == 0xf0) {
            continuation = 3;
            code_point = c & 0x07;
        } else {
            return false;
        }

        if(size - pos - 1 < continuation)
            return false;
        for(std::size_t i=1; i<=continuation; ++i) {
            unsigned char cc = p[pos + i];
            if((cc & 0xc0) != 0x80)
                return false;
            code_point = (code_point << 6) | (cc & 0x3f);
        }

        if(code_point < minimum_code_point[continuation])
            return false;
        if(code_point > 0x10ffff)
            return false;
        if(code_point >= 0xd800 && code_point <= 0xdfff)
            return false;
        pos += continuation + 1;
    }
    return true;
}

bool validate_symbol(char const* s, std::size_t size,
        symbol_rules const& rules, std::error_code& ec) noexcept
{
    if(size > rules.max_size) {
        ec = make_error_code(errc::exceeds_maximum_length);
        return false;
    }
    if(size == 0 && !rules.allow_empty) {
        ec = make_error_code(errc::contains_forbidden_character);
        return false;
    }
    // The symbol is handed out as a C string, so an embedded NUL would
    // silently truncate it.
    if(std::memchr(s, '\0', size) != nullptr) {
        ec = make_error_code(errc::contains_forbidden_character);
        return false;
    }
    if(!is_valid_utf8(s, size)) {
        ec = make_error_code(errc::contains_forbidden_character);
        return false;
    }
    if(!rules.allow_digits) {
        for(std::size_t i=0; i!=size; ++i) {
            if(s[i] >= '0' && s[i] <= '9') {
                ec = make_error_code(errc::contains_forbidden_character);
                return false;
            }
        }
    }
    ec.clear();
    return true;
}

}   // namespace detail
}   // namespace numformat
