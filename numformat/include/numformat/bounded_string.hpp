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
#ifndef NUMFORMAT_BOUNDED_STRING_HPP
#define NUMFORMAT_BOUNDED_STRING_HPP

#include "config.hpp"
#include "error.hpp"

#include <cstddef>  // size_t
#include <cstring>  // strlen, memcpy, memcmp
#include <string>
#include <system_error>     // error_code

namespace numformat {

namespace detail {

struct symbol_rules {
    std::size_t max_size;
    bool allow_empty;
    bool allow_digits;
};

// Returns false and sets ec if the given bytes can not be used as a symbol
// under the given rules. Clears ec otherwise.
bool validate_symbol(char const* s, std::size_t size,
        symbol_rules const& rules, std::error_code& ec) noexcept;

bool is_valid_utf8(char const* s, std::size_t size) noexcept;

}   // namespace detail

// Kinds of locale symbol. Each kind fixes the maximum size, whether the
// symbol may be empty or contain ASCII digits, and the fallback used when a
// symbol is default constructed.
struct decimal_kind {
    static constexpr std::size_t max_size = NUMFORMAT_MAX_DECIMAL_SIZE;
    static constexpr bool allow_empty = false;
    static constexpr bool allow_digits = false;
    static char const* name() { return "decimal"; }
    static char const* fallback() { return "."; }
};

struct separator_kind {
    static constexpr std::size_t max_size = NUMFORMAT_MAX_SEPARATOR_SIZE;
    static constexpr bool allow_empty = true;
    static constexpr bool allow_digits = false;
    static char const* name() { return "separator"; }
    static char const* fallback() { return ","; }
};

struct minus_sign_kind {
    static constexpr std::size_t max_size = NUMFORMAT_MAX_MINUS_SIGN_SIZE;
    static constexpr bool allow_empty = false;
    static constexpr bool allow_digits = false;
    static char const* name() { return "minus sign"; }
    static char const* fallback() { return "-"; }
};

// An empty plus sign means positive numbers are never signed, even when the
// caller asks for explicit signs.
struct plus_sign_kind {
    static constexpr std::size_t max_size = NUMFORMAT_MAX_PLUS_SIGN_SIZE;
    static constexpr bool allow_empty = true;
    static constexpr bool allow_digits = false;
    static char const* name() { return "plus sign"; }
    static char const* fallback() { return ""; }
};

struct infinity_kind {
    static constexpr std::size_t max_size = NUMFORMAT_MAX_INFINITY_SIZE;
    static constexpr bool allow_empty = false;
    static constexpr bool allow_digits = true;
    static char const* name() { return "infinity"; }
    static char const* fallback() { return "inf"; }
};

struct nan_kind {
    static constexpr std::size_t max_size = NUMFORMAT_MAX_NAN_SIZE;
    static constexpr bool allow_empty = false;
    static constexpr bool allow_digits = true;
    static char const* name() { return "nan"; }
    static char const* fallback() { return "NaN"; }
};

// Immutable symbol of at most Kind::max_size bytes, validated on
// construction. There is no way to construct one that bypasses validation,
// which is what makes formatting with any format description infallible.
template <class Kind>
class bounded_string {
public:
    static constexpr std::size_t max_size = Kind::max_size;
    static_assert(max_size < 256, "symbol size must fit in an unsigned char");

    bounded_string() noexcept
    {
        char const* s = Kind::fallback();
        assign_unchecked(s, std::strlen(s));
    }

    // Throws numformat::error if s is not a valid symbol of this kind.
    explicit bounded_string(char const* s)
    {
        construct(s, std::strlen(s));
    }

    explicit bounded_string(std::string const& s)
    {
        construct(s.data(), s.size());
    }

    bounded_string(char const* s, std::size_t size)
    {
        construct(s, size);
    }

    // On failure ec is set and the fallback symbol is returned.
    static bounded_string create(char const* s, std::size_t size,
            std::error_code& ec) noexcept
    {
        bounded_string result;
        if(validate(s, size, ec))
            result.assign_unchecked(s, size);
        return result;
    }

    static bounded_string create(std::string const& s, std::error_code& ec) noexcept
    {
        return create(s.data(), s.size(), ec);
    }

    static bool validate(char const* s, std::size_t size, std::error_code& ec) noexcept
    {
        detail::symbol_rules const rules = {
            Kind::max_size, Kind::allow_empty, Kind::allow_digits};
        return detail::validate_symbol(s, size, rules, ec);
    }

    char const* data() const noexcept
    {
        return data_;
    }

    char const* c_str() const noexcept
    {
        return data_;
    }

    std::size_t size() const noexcept
    {
        return size_;
    }

    bool empty() const noexcept
    {
        return size_ == 0;
    }

    std::string str() const
    {
        return std::string(data_, size_);
    }

private:
    void construct(char const* s, std::size_t size)
    {
        std::error_code ec;
        if(!validate(s, size, ec))
            throw error(ec, std::string("invalid ") + Kind::name() + " symbol");
        assign_unchecked(s, size);
    }

    void assign_unchecked(char const* s, std::size_t size) noexcept
    {
        std::memcpy(data_, s, size);
        data_[size] = '\0';
        size_ = static_cast<unsigned char>(size);
    }

    char data_[max_size + 1];
    unsigned char size_;
};

template <class Kind>
constexpr std::size_t bounded_string<Kind>::max_size;

template <class Kind>
bool operator==(bounded_string<Kind> const& lhs, bounded_string<Kind> const& rhs)
{
    return lhs.size() == rhs.size()
        && std::memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

template <class Kind>
bool operator!=(bounded_string<Kind> const& lhs, bounded_string<Kind> const& rhs)
{
    return !(lhs == rhs);
}

template <class Kind>
bool operator==(bounded_string<Kind> const& lhs, char const* rhs)
{
    return lhs.size() == std::strlen(rhs)
        && std::memcmp(lhs.data(), rhs, lhs.size()) == 0;
}

template <class Kind>
bool operator==(char const* lhs, bounded_string<Kind> const& rhs)
{
    return rhs == lhs;
}

template <class Kind>
bool operator!=(bounded_string<Kind> const& lhs, char const* rhs)
{
    return !(lhs == rhs);
}

template <class Kind>
bool operator!=(char const* lhs, bounded_string<Kind> const& rhs)
{
    return !(rhs == lhs);
}

typedef bounded_string<decimal_kind> decimal_string;
typedef bounded_string<separator_kind> separator_string;
typedef bounded_string<minus_sign_kind> minus_sign_string;
typedef bounded_string<plus_sign_kind> plus_sign_string;
typedef bounded_string<infinity_kind> infinity_string;
typedef bounded_string<nan_kind> nan_string;

}   // namespace numformat

#endif  // NUMFORMAT_BOUNDED_STRING_HPP
