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

#ifndef UTFTEXT_CHARACTERS_H
#define UTFTEXT_CHARACTERS_H

#include <cstdint>

namespace utftext {

constexpr uint32_t CHAR_NUL = 0x0000;
constexpr uint32_t CHAR_REPLACEMENT_CHARACTER = 0xFFFD;
constexpr uint32_t CHAR_MAX_BMP = 0xFFFF;
constexpr uint32_t CHAR_MAX_CODE_POINT = 0x10FFFF;

// Returned by code point accessors when there is no code point at the requested position.
constexpr uint32_t CHAR_NOT_A_CODE_POINT = 0xFFFFFFFF;

}  // namespace utftext

#endif  // UTFTEXT_CHARACTERS_H
