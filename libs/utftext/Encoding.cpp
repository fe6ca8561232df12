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

#define LOG_TAG "UtfText"

#include "utftext/Encoding.h"

#include <unicode/utf16.h>

#include "utftext/Characters.h"

#include "UtfTextInternal.h"

namespace utftext {

void appendCodePoint(uint32_t codePoint, std::u16string* out) {
    if (codePoint <= CHAR_MAX_BMP) {
        out->push_back(static_cast<char16_t>(codePoint));
        return;
    }
    if (codePoint > CHAR_MAX_CODE_POINT) {
        ALOGW("Code point 0x%X is out of the Unicode range, replaced with U+FFFD.", codePoint);
        out->push_back(static_cast<char16_t>(CHAR_REPLACEMENT_CHARACTER));
        return;
    }
    out->push_back(static_cast<char16_t>(U16_LEAD(codePoint)));
    out->push_back(static_cast<char16_t>(U16_TRAIL(codePoint)));
}

std::u16string codePointToString(uint32_t codePoint) {
    std::u16string result;
    appendCodePoint(codePoint, &result);
    return result;
}

std::u16string codePointsToString(const std::vector<uint32_t>& codePoints) {
    std::u16string result;
    result.reserve(codePoints.size());
    for (uint32_t codePoint : codePoints) {
        appendCodePoint(codePoint, &result);
    }
    return result;
}

std::vector<uint8_t> stringToBytes(const U16StringPiece& text) {
    std::vector<uint8_t> result;
    result.reserve(text.size() * 2);
    for (char16_t c : text) {
        result.push_back(static_cast<uint8_t>(c >> 8));
        result.push_back(static_cast<uint8_t>(c & 0xFF));
    }
    return result;
}

std::u16string bytesToString(const std::vector<uint8_t>& bytes) {
    if (bytes.size() % 2 != 0) {
        ALOGW("Odd length UTF-16 byte array (%zu bytes), the last code unit is incomplete.",
              bytes.size());
    }
    std::u16string result;
    result.reserve((bytes.size() + 1) / 2);
    for (size_t i = 0; i < bytes.size(); i += 2) {
        const uint16_t hi = bytes[i];
        const uint16_t low = i + 1 < bytes.size() ? bytes[i + 1] : 0;
        result.push_back(static_cast<char16_t>((hi << 8) | low));
    }
    return result;
}

}  // namespace utftext
