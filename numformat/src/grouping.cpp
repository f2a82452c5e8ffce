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
#include <numformat/grouping.hpp>

#include <climits>  // CHAR_MAX
#include <cstdlib>  // strtoul

namespace numformat {

namespace {

// Both the POSIX and the Windows grouping descriptions boil down to a list of
// group sizes, starting with the least significant group, and a flag telling
// whether the last size repeats for the remaining digits.
bool classify(std::vector<unsigned> const& sizes, bool repeat_last,
        grouping_policy* ppolicy)
{
    if(sizes.empty() || sizes[0] == 0) {
        *ppolicy = grouping_policy::posix;
        return true;
    }
    // A locale that only groups the lowest few digits is not something any
    // of the policies can reproduce.
    if(!repeat_last)
        return false;
    if(sizes[0] != 3)
        return false;

    bool all_threes = true;
    bool tail_of_twos = sizes.size() > 1;
    for(std::size_t i=1; i!=sizes.size(); ++i) {
        if(sizes[i] != 3)
            all_threes = false;
        if(sizes[i] != 2)
            tail_of_twos = false;
    }
    if(all_threes) {
        *ppolicy = grouping_policy::standard;
        return true;
    } else if(tail_of_twos) {
        *ppolicy = grouping_policy::indian;
        return true;
    } else {
        return false;
    }
}

}   // anonymous namespace

std::vector<unsigned> group_positions(grouping_policy policy, unsigned digit_count)
{
    std::vector<unsigned> positions;
    positions.reserve(separator_count(policy, digit_count));
    for(unsigned digits=1; digits < digit_count; ++digits) {
        if(detail::is_group_boundary(policy, digits))
            positions.push_back(digits);
    }
    return positions;
}

char const* to_string(grouping_policy policy)
{
    switch(policy) {
    case grouping_policy::standard:
        return "standard";
    case grouping_policy::indian:
        return "indian";
    case grouping_policy::posix:
        return "posix";
    }
    return "unknown";
}

bool from_string(std::string const& name, grouping_policy* ppolicy)
{
    if(name == "standard")
        *ppolicy = grouping_policy::standard;
    else if(name == "indian")
        *ppolicy = grouping_policy::indian;
    else if(name == "posix" || name == "none")
        *ppolicy = grouping_policy::posix;
    else
        return false;
    return true;
}

namespace detail {

bool grouping_from_lconv(char const* grouping, grouping_policy* ppolicy)
{
    // Each byte is the size of a group. A terminating NUL means the last
    // size repeats; CHAR_MAX means no further grouping is done.
    std::vector<unsigned> sizes;
    bool repeat_last = true;
    for(char const* p = grouping; *p; ++p) {
        if(*p == CHAR_MAX || *p < 0) {
            repeat_last = false;
            break;
        }
        sizes.push_back(static_cast<unsigned>(*p));
    }
    return classify(sizes, repeat_last, ppolicy);
}

bool grouping_from_win32(char const* grouping, grouping_policy* ppolicy)
{
    // Semicolon-separated sizes. A trailing 0 means the previous size
    // repeats; without it the digits past the listed groups stay ungrouped.
    std::vector<unsigned> sizes;
    bool repeat_last = false;
    char const* p = grouping;
    while(*p) {
        char* pend;
        unsigned long size = std::strtoul(p, &pend, 10);
        if(pend == p)
            return false;
        if(size == 0 && !sizes.empty()) {
            repeat_last = true;
            if(*pend != '\0')
                return false;
            break;
        }
        sizes.push_back(static_cast<unsigned>(size));
        p = pend;
        if(*p == ';')
            ++p;
        else if(*p != '\0')
            return false;
    }
    return classify(sizes, repeat_last, ppolicy);
}

}   // namespace detail

}   // namespace numformat
