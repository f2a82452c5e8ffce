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
#ifndef NUMFORMAT_GROUPING_HPP
#define NUMFORMAT_GROUPING_HPP

#include <string>
#include <vector>

namespace numformat {

enum class grouping_policy
{
    // 1,000,000
    standard,
    // 10,00,000: a first group of three digits, then groups of two.
    indian,
    // 1000000
    posix
};

// Number of separators inserted between digit_count digits.
constexpr unsigned separator_count(grouping_policy policy, unsigned digit_count)
{
    return policy == grouping_policy::standard?
            (digit_count == 0? 0 : (digit_count - 1)/3) :
        policy == grouping_policy::indian?
            (digit_count <= 3? 0 : (digit_count - 2)/2) :
        0;
}

// Offsets, counted in digits from the least significant digit, at which a
// separator is inserted for a number with digit_count digits. A separator is
// only ever placed between two digits, so the offsets are all less than
// digit_count.
std::vector<unsigned> group_positions(grouping_policy policy, unsigned digit_count);

char const* to_string(grouping_policy policy);

// Accepts "standard", "indian", "posix" and "none". Returns false and leaves
// *ppolicy alone for any other name.
bool from_string(std::string const& name, grouping_policy* ppolicy);

namespace detail {

// True if a separator belongs to the left of the first digits_written
// digits, provided another digit follows.
inline bool is_group_boundary(grouping_policy policy, unsigned digits_written)
{
    switch(policy) {
    case grouping_policy::standard:
        return digits_written % 3 == 0;
    case grouping_policy::indian:
        return digits_written >= 3 && (digits_written - 3) % 2 == 0;
    case grouping_policy::posix:
        return false;
    }
    return false;
}

// Interpret the grouping member of a POSIX struct lconv. Returns false if the
// layout is not one that the grouping policies can express.
bool grouping_from_lconv(char const* grouping, grouping_policy* ppolicy);

// Interpret a Windows LOCALE_SGROUPING string, e.g. "3;0" or "3;2;0".
bool grouping_from_win32(char const* grouping, grouping_policy* ppolicy);

}   // namespace detail

}   // namespace numformat

#endif  // NUMFORMAT_GROUPING_HPP
