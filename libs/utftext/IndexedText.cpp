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

#include "utftext/IndexedText.h"

#include <unicode/ustring.h>

#include <algorithm>
#include <limits>

#include "utftext/Encoding.h"

#include "FeatureFlags.h"
#include "UtfTextInternal.h"

namespace utftext {

IndexedText::IndexedText(std::u16string text) : mText(std::move(text)), mHasClusters(false) {
    UTFTEXT_ASSERT(isIndexable(mText.size()), "Text of %zu code units cannot be indexed.",
                   mText.size());
    mHasClusters = containsCluster(mText);
}

// static
IndexedText IndexedText::fromCodePoint(uint32_t codePoint) {
    return IndexedText(stringFromCodePoint(codePoint));
}

// static
IndexedText IndexedText::fromCodePoints(const std::vector<uint32_t>& codePoints) {
    return IndexedText(codePointsToString(codePoints));
}

// static
IndexedText IndexedText::fromBytes(const std::vector<uint8_t>& bytes) {
    return IndexedText(bytesToString(bytes));
}

std::optional<uint32_t> IndexedText::scanToChar(int32_t charIndex, ClusterRule rule) const {
    if (charIndex < 0) {
        return std::nullopt;
    }
    const uint32_t target = static_cast<uint32_t>(charIndex);
    if (!mHasClusters) {
        // Every code unit is a character.
        return target < mText.size() ? std::optional<uint32_t>(target) : std::nullopt;
    }
    uint32_t current = 0;
    for (const Range& cluster : ClusterText(mText, rule)) {
        if (current == target) {
            return cluster.getStart();
        }
        current++;
    }
    return std::nullopt;
}

std::optional<uint32_t> IndexedText::byteIndexOf(int32_t charIndex) const {
    return scanToChar(charIndex, ClusterRule::DISPLAY);
}

std::optional<uint32_t> IndexedText::charIndexOf(int32_t byteIndex) const {
    if (byteIndex < 0 || static_cast<uint32_t>(byteIndex) >= mText.size()) {
        return std::nullopt;
    }
    const uint32_t target = static_cast<uint32_t>(byteIndex);
    if (!mHasClusters) {
        return target;
    }
    // The character containing target is the first cluster that ends after it.
    uint32_t charCount = 0;
    for (const Range& cluster : ClusterText(mText)) {
        if (cluster.getEnd() > target) {
            break;
        }
        charCount++;
    }
    return charCount;
}

int32_t IndexedText::findByteIndex(int32_t charIndex) const {
    return toPublicIndex(byteIndexOf(charIndex));
}

int32_t IndexedText::findCharIndex(int32_t byteIndex) const {
    return toPublicIndex(charIndexOf(byteIndex));
}

int32_t IndexedText::length() const {
    const std::optional<uint32_t> last = charIndexOf(static_cast<int32_t>(mText.size()) - 1);
    return last ? static_cast<int32_t>(*last) + 1 : 0;
}

std::u16string IndexedText::charAt(int32_t index) const {
    const std::optional<uint32_t> byteIndex = byteIndexOf(index);
    if (!byteIndex) {
        return std::u16string();
    }
    const U16StringPiece text(mText);
    return text.substr(nextCluster(text, *byteIndex)).toString();
}

uint32_t IndexedText::charCodeAt(int32_t index) const {
    const std::optional<uint32_t> byteIndex = scanToChar(index, ClusterRule::CODE_POINT);
    if (!byteIndex) {
        return CHAR_NOT_A_CODE_POINT;
    }
    return U16StringPiece(mText).codePointAt(*byteIndex);
}

int32_t IndexedText::indexOf(const U16StringPiece& searchValue, int32_t start) const {
    const std::optional<uint32_t> startByte = byteIndexOf(start);
    if (!startByte) {
        return kNotFound;
    }
    const size_t found = mText.find(searchValue.view(), *startByte);
    if (found == std::u16string::npos) {
        return kNotFound;
    }
    return findCharIndex(static_cast<int32_t>(found));
}

int32_t IndexedText::lastIndexOf(const U16StringPiece& searchValue) const {
    const size_t found = mText.rfind(searchValue.view());
    if (found == std::u16string::npos) {
        return kNotFound;
    }
    return findCharIndex(static_cast<int32_t>(found));
}

int32_t IndexedText::lastIndexOf(const U16StringPiece& searchValue, int32_t start) const {
    const std::optional<uint32_t> startByte = byteIndexOf(start);
    if (!startByte) {
        return kNotFound;
    }
    const size_t found = mText.rfind(searchValue.view(), *startByte);
    if (found == std::u16string::npos) {
        return kNotFound;
    }
    return findCharIndex(static_cast<int32_t>(found));
}

IndexedText IndexedText::slice(int32_t start) const {
    const uint32_t startByte = byteIndexOf(start).value_or(mText.size());
    return IndexedText(mText.substr(startByte));
}

IndexedText IndexedText::slice(int32_t start, int32_t end) const {
    const uint32_t startByte = byteIndexOf(start).value_or(mText.size());
    const uint32_t endByte = byteIndexOf(end).value_or(mText.size());
    if (endByte <= startByte) {
        return IndexedText();
    }
    return IndexedText(mText.substr(startByte, endByte - startByte));
}

IndexedText IndexedText::substr(int32_t start) const {
    if (start < 0) {
        start = length() + start;
    }
    return slice(start);
}

IndexedText IndexedText::substr(int32_t start, int32_t length) const {
    if (start < 0) {
        start = this->length() + start;
    }
    const int64_t end = std::clamp<int64_t>(static_cast<int64_t>(start) + length,
                                            std::numeric_limits<int32_t>::min(),
                                            std::numeric_limits<int32_t>::max());
    return slice(start, static_cast<int32_t>(end));
}

std::vector<uint32_t> IndexedText::toCodePoints() const {
    return stringToCodePoints(mText);
}

std::vector<uint8_t> IndexedText::toBytes() const {
    return stringToBytes(mText);
}

std::vector<std::u16string> IndexedText::toCharArray() const {
    return stringToCharArray(mText);
}

// static
std::u16string IndexedText::stringFromCodePoint(uint32_t codePoint) {
    return codePointToString(codePoint);
}

// static
std::u16string IndexedText::codePointsToString(const std::vector<uint32_t>& codePoints) {
    return utftext::codePointsToString(codePoints);
}

// static
std::vector<uint32_t> IndexedText::stringToCodePoints(const U16StringPiece& text) {
    // Same sequence as calling charCodeAt() for successive indices, in a single pass.
    std::vector<uint32_t> result;
    for (const Range& cluster : ClusterText(text, ClusterRule::CODE_POINT)) {
        const uint32_t codePoint = text.codePointAt(cluster.getStart());
        if (codePoint == CHAR_NUL && features::nul_terminates_code_points()) {
            break;
        }
        result.push_back(codePoint);
    }
    return result;
}

// static
std::vector<uint8_t> IndexedText::stringToBytes(const U16StringPiece& text) {
    return utftext::stringToBytes(text);
}

// static
std::u16string IndexedText::bytesToString(const std::vector<uint8_t>& bytes) {
    return utftext::bytesToString(bytes);
}

// static
std::vector<std::u16string> IndexedText::stringToCharArray(const U16StringPiece& text) {
    std::vector<std::u16string> result;
    for (const Range& cluster : ClusterText(text)) {
        result.push_back(text.substr(cluster).toString());
    }
    return result;
}

std::ostream& operator<<(std::ostream& os, const IndexedText& text) {
    const std::u16string& src = text.text();
    UErrorCode status = U_ZERO_ERROR;
    int32_t utf8Length = 0;
    u_strToUTF8WithSub(nullptr, 0, &utf8Length, src.data(), static_cast<int32_t>(src.size()),
                       CHAR_REPLACEMENT_CHARACTER, nullptr, &status);
    if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) {
        return os << "<unprintable text of " << src.size() << " code units>";
    }
    std::string utf8(utf8Length, '\0');
    status = U_ZERO_ERROR;
    u_strToUTF8WithSub(utf8.data(), utf8Length, nullptr, src.data(),
                       static_cast<int32_t>(src.size()), CHAR_REPLACEMENT_CHARACTER, nullptr,
                       &status);
    if (U_FAILURE(status)) {
        return os << "<unprintable text of " << src.size() << " code units>";
    }
    return os << "\"" << utf8 << "\"";
}

}  // namespace utftext
