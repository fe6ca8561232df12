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

#include "utftext/U16StringPiece.h"

#include <unicode/utf16.h>

namespace utftext {

uint32_t U16StringPiece::codePointAt(uint32_t pos) const {
    const char16_t c = mData[pos];
    if (!U16_IS_LEAD(c)) {
        return c;  // BMP character or isolated trail.
    }

    if (pos + 1 == mLength) {  // isolated lead at the end of text.
        return c;
    }

    const char16_t c2 = mData[pos + 1];
    if (!U16_IS_TRAIL(c2)) {  // isolated lead.
        return c;
    }

    return U16_GET_SUPPLEMENTARY(c, c2);
}

}  // namespace utftext
