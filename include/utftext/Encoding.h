/*
 * Copyright (C) 2024 The Android Open Source Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef UTFTEXT_ENCODING_H
#define UTFTEXT_ENCODING_H

#include <cstdint>
#include <string>
#include <vector>

#include "utftext/U16StringPiece.h"

namespace utftext {

// Appends the UTF-16 encoding of a code point. Code points up to U+FFFF, including lone
// surrogate values, are written as one code unit. Code points above U+10FFFF are written as
// U+FFFD.
void appendCodePoint(uint32_t codePoint, std::u16string* out);

std::u16string codePointToString(uint32_t codePoint);
std::u16string codePointsToString(const std::vector<uint32_t>& codePoints);

// Big-endian, two bytes per code unit.
std::vector<uint8_t> stringToBytes(const U16StringPiece& text);

// Big-endian, two bytes per code unit. An odd trailing byte becomes the high byte of a last
// code unit whose low byte is zero.
std::u16string bytesToString(const std::vector<uint8_t>& bytes);

}  // namespace utftext

#endif  // UTFTEXT_ENCODING_H
