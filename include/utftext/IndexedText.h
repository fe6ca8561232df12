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

#ifndef UTFTEXT_INDEXED_TEXT_H
#define UTFTEXT_INDEXED_TEXT_H

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "utftext/Characters.h"
#include "utftext/ClusterScanner.h"
#include "utftext/U16StringPiece.h"

namespace utftext {

/**
 * Immutable UTF-16 text indexed by logical character instead of by code unit.
 *
 * A logical character is a single code unit, a surrogate pair, or a pair of regional
 * indicator symbols (a flag). Nothing else is clustered: this is not grapheme segmentation.
 *
 * Code point access is narrower than character access. charCodeAt() only combines surrogate
 * pairs, so a flag is one character for charAt(), slice() and length(), but two code points
 * for charCodeAt() and toCodePoints().
 *
 * Out-of-range input never throws. Index lookups return -1, charAt() returns an empty string,
 * charCodeAt() returns CHAR_NOT_A_CODE_POINT and slicing clamps to the end of text.
 *
 * Instances are never modified after construction and can be read from multiple threads.
 */
class IndexedText {
public:
    IndexedText() : IndexedText(std::u16string()) {}
    explicit IndexedText(std::u16string text);
    explicit IndexedText(const U16StringPiece& text) : IndexedText(text.toString()) {}
    explicit IndexedText(const char16_t* text) : IndexedText(std::u16string(text)) {}

    IndexedText(const IndexedText&) = default;
    IndexedText& operator=(const IndexedText&) = default;
    IndexedText(IndexedText&&) = default;
    IndexedText& operator=(IndexedText&&) = default;

    static IndexedText fromCodePoint(uint32_t codePoint);
    static IndexedText fromCodePoints(const std::vector<uint32_t>& codePoints);
    static IndexedText fromBytes(const std::vector<uint8_t>& bytes);

    // Character access.
    std::u16string charAt(int32_t index) const;
    // A lead surrogate is only combined with a following trail surrogate. Any unpaired
    // surrogate, including a lead at the end of text, is returned as its own value, so
    // fromCodePoints(toCodePoints()) gives back the same text.
    uint32_t charCodeAt(int32_t index) const;

    // Number of logical characters.
    int32_t length() const;

    // Search. Returned positions are character indices, -1 if not found.
    int32_t indexOf(const U16StringPiece& searchValue, int32_t start = 0) const;
    int32_t lastIndexOf(const U16StringPiece& searchValue) const;
    int32_t lastIndexOf(const U16StringPiece& searchValue, int32_t start) const;

    // Extraction. Out-of-range bounds clamp to the end of text.
    IndexedText slice(int32_t start) const;
    IndexedText slice(int32_t start, int32_t end) const;
    // A negative start counts back from the end of text.
    IndexedText substr(int32_t start) const;
    IndexedText substr(int32_t start, int32_t length) const;
    IndexedText substring(int32_t start) const { return substr(start); }
    IndexedText substring(int32_t start, int32_t length) const { return substr(start, length); }

    // Conversion.
    std::vector<uint32_t> toCodePoints() const;
    std::vector<uint8_t> toBytes() const;
    std::vector<std::u16string> toCharArray() const;

    // Index translation between character indices and code unit offsets.
    int32_t findByteIndex(int32_t charIndex) const;
    int32_t findCharIndex(int32_t byteIndex) const;

    const std::u16string& text() const { return mText; }
    uint32_t codeUnitLength() const { return static_cast<uint32_t>(mText.size()); }
    bool empty() const { return mText.empty(); }

    inline bool operator==(const IndexedText& o) const { return mText == o.mText; }
    inline bool operator!=(const IndexedText& o) const { return !(*this == o); }

    // Helpers operating on raw UTF-16 strings.
    static std::u16string stringFromCodePoint(uint32_t codePoint);
    static std::u16string codePointsToString(const std::vector<uint32_t>& codePoints);
    static std::vector<uint32_t> stringToCodePoints(const U16StringPiece& text);
    static std::vector<uint8_t> stringToBytes(const U16StringPiece& text);
    static std::u16string bytesToString(const std::vector<uint8_t>& bytes);
    static std::vector<std::u16string> stringToCharArray(const U16StringPiece& text);

private:
    // Code unit offset of the character at charIndex, counting clusters under the given rule.
    std::optional<uint32_t> scanToChar(int32_t charIndex, ClusterRule rule) const;
    std::optional<uint32_t> byteIndexOf(int32_t charIndex) const;
    std::optional<uint32_t> charIndexOf(int32_t byteIndex) const;

    std::u16string mText;
    // True if mText has any multi-unit cluster. Otherwise indices are code unit offsets.
    bool mHasClusters;
};

std::ostream& operator<<(std::ostream& os, const IndexedText& text);

}  // namespace utftext

#endif  // UTFTEXT_INDEXED_TEXT_H
