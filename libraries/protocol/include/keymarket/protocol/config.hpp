/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#pragma once

#define KEYMARKET_SYMBOL "KEY"
#define KEYMARKET_ADDRESS_PREFIX "KEY"

/** Number of ledger units per USD-equivalent unit quoted by the fixed ratio oracle */
#define KEYMARKET_TOKEN_DECIMAL_SCALE        int64_t( 1000000000 )
#define KEYMARKET_TOKEN_DECIMAL_DIGITS       9

#define KEYMARKET_MAX_SHARE_SUPPLY int64_t(1000000000000000000ll)

#define KEYMARKET_100_PERCENT                                 10000
#define KEYMARKET_1_PERCENT                                   (KEYMARKET_100_PERCENT/100)

#define KEYMARKET_DEFAULT_PURCHASE_FEE_RATE                   (KEYMARKET_1_PERCENT)
#define KEYMARKET_DEFAULT_SUBMISSION_FEE_USD                  10

/** Keys of every description map are ISO 639-1 language codes */
#define KEYMARKET_LANGUAGE_CODE_LENGTH                        2

#define KEYMARKET_MAX_GAME_KEY_LENGTH                         127
#define KEYMARKET_MAX_URL_LENGTH                              2047

#define KEYMARKET_MAX_UNDO_HISTORY                            1024
