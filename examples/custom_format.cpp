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
// Example of a custom format description with multi-byte symbols.
#include <numformat/custom_format.hpp>
#include <numformat/stdout_writer.hpp>
#include <numformat/write_formatted.hpp>

numformat::stdout_writer writer;

int main()
{
    numformat::custom_format format = numformat::custom_format::builder()
        .grouping(numformat::grouping_policy::indian)
        .minus_sign("\xf0\x9f\x99\x8c")
        .separator("\xf0\x9f\x98\x80")
        .build();

    // Prints 🙌10😀00😀000
    std::error_code ec;
    numformat::write_formatted(&writer, -1000000, format, ec);
    if(!ec)
        writer.write("\n", 1, ec);
    return ec? 1 : 0;
}
