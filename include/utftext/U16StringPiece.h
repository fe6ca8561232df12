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

#ifndef UTFTEXT_U16STRING_PIECE_H
#define UTFTEXT_U16STRING_PIECE_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "utftext/Range.h"

namespace utftext {

// A non-owning view of UTF-16 code units. The referenced buffer must outlive the piece.
class U16StringPiece {
public:
    U16StringPiece() : mData(nullptr), mLength(0) {}
    U16StringPiece(const char16_t* data, uint32_t length) : mData(data), mLength(length) {}
    U16StringPiece(const std::u16string& str)
            : mData(str.data()), mLength(static_cast<uint32_t>(str.size())) {}
    U16StringPiece(std::u16string_view str)
            : mData(str.data()), mLength(static_cast<uint32_t>(str.size())) {}
    U16StringPiece(const std::vector<char16_t>& v)
            : mData(v.data()), mLength(static_cast<uint32_t>(v.size())) {}
    // Null-terminated string, e.g. u"abc". The terminator is not part of the piece.
    U16StringPiece(const char16_t* str)
            : mData(str), mLength(static_cast<uint32_t>(std::char_traits<char16_t>::length(str))) {}

    inline const char16_t* data() const { return mData; }
    inline uint32_t size() const { return mLength; }
    inline bool empty() const { return mLength == 0; }

    inline char16_t operator[](uint32_t i) const { return mData[i]; }
    inline const char16_t* begin() const { return mData; }
    inline const char16_t* end() const { return mData + mLength; }

    inline U16StringPiece substr(const Range& range) const {
        return U16StringPiece(mData + range.getStart(), range.getLength());
    }

    inline std::u16string_view view() const { return std::u16string_view(mData, mLength); }
    inline std::u16string toString() const { return std::u16string(mData, mLength); }

    // Returns the code point starting at pos. An unpaired surrogate is returned as is.
    uint32_t codePointAt(uint32_t pos) const;

private:
    const char16_t* mData;
    uint32_t mLength;
};

}  // namespace utftext

#endif  // UTFTEXT_U16STRING_PIECE_H
