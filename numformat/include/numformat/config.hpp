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
#ifndef NUMFORMAT_CONFIG_HPP
#define NUMFORMAT_CONFIG_HPP

// Maximum size in bytes of each kind of locale symbol. numformat::buffer is
// sized for the worst combination of these, so raising any of them makes
// every buffer larger. They must all stay below 256.

// 8 bytes leaves room for two three-byte code points, e.g. a directional
// mark followed by a narrow no-break space.
#ifndef NUMFORMAT_MAX_DECIMAL_SIZE
#define NUMFORMAT_MAX_DECIMAL_SIZE 8u
#endif

#ifndef NUMFORMAT_MAX_SEPARATOR_SIZE
#define NUMFORMAT_MAX_SEPARATOR_SIZE 8u
#endif

#ifndef NUMFORMAT_MAX_MINUS_SIGN_SIZE
#define NUMFORMAT_MAX_MINUS_SIGN_SIZE 8u
#endif

#ifndef NUMFORMAT_MAX_PLUS_SIGN_SIZE
#define NUMFORMAT_MAX_PLUS_SIGN_SIZE 8u
#endif

#ifndef NUMFORMAT_MAX_INFINITY_SIZE
#define NUMFORMAT_MAX_INFINITY_SIZE 128u
#endif

#ifndef NUMFORMAT_MAX_NAN_SIZE
#define NUMFORMAT_MAX_NAN_SIZE 64u
#endif

#endif  // NUMFORMAT_CONFIG_HPP
