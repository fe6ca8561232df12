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

#include "utftext/ClusterScanner.h"

#include <unicode/uchar.h>
#include <unicode/utf16.h>

namespace utftext {

namespace {

// Returns true if a surrogate pair starts at pos.
inline bool isSurrogatePairAt(const U16StringPiece& text, uint32_t pos) {
    return pos + 1 < text.size() && U16_IS_LEAD(text[pos]) && U16_IS_TRAIL(text[pos + 1]);
}

// Returns true if a surrogate pair encoding a regional indicator symbol starts at pos.
inline bool isRegionalIndicatorAt(const U16StringPiece& text, uint32_t pos) {
    if (!isSurrogatePairAt(text, pos)) {
        return false;
    }
    const UChar32 cp = U16_GET_SUPPLEMENTARY(text[pos], text[pos + 1]);
    return u_hasBinaryProperty(cp, UCHAR_REGIONAL_INDICATOR);
}

}  // namespace

Range nextCluster(const U16StringPiece& text, uint32_t pos, ClusterRule rule) {
    const uint32_t size = text.size();
    if (pos >= size) {
        return Range(size, size);
    }
    if (rule == ClusterRule::DISPLAY && isRegionalIndicatorAt(text, pos) &&
        isRegionalIndicatorAt(text, pos + 2)) {
        return Range(pos, pos + 4);
    }
    if (isSurrogatePairAt(text, pos)) {
        return Range(pos, pos + 2);
    }
    return Range(pos, pos + 1);
}

bool containsCluster(const U16StringPiece& text) {
    for (uint32_t i = 0; i + 1 < text.size(); ++i) {
        if (isSurrogatePairAt(text, i)) {
            return true;
        }
    }
    return false;
}

}  // namespace utftext
