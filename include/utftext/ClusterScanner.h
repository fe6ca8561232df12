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

#ifndef UTFTEXT_CLUSTER_SCANNER_H
#define UTFTEXT_CLUSTER_SCANNER_H

#include <cstdint>

#include "utftext/Range.h"
#include "utftext/U16StringPiece.h"

namespace utftext {

// Which multi-unit sequences are treated as a single logical character.
//
// This is intentionally not grapheme cluster segmentation. Combining marks, ZWJ sequences
// and variation selectors are all separate characters under both rules.
enum class ClusterRule : uint8_t {
    // Surrogate pairs and regional indicator pairs (two regional indicator symbols forming a
    // flag, four code units). Used for character indexing, slicing and splitting.
    DISPLAY = 0,
    // Surrogate pairs only. Used for code point access, where each regional indicator
    // symbol is its own code point.
    CODE_POINT = 1,
};

// Returns the cluster starting at pos. Returns the empty range [size, size) if pos is at or
// past the end of text. Every cluster is 1, 2 or 4 code units long.
Range nextCluster(const U16StringPiece& text, uint32_t pos,
                  ClusterRule rule = ClusterRule::DISPLAY);

// Returns true if the text has at least one multi-unit cluster under the DISPLAY rule.
// Since a regional indicator pair is made of surrogate pairs, this is the same as asking for
// a surrogate pair.
bool containsCluster(const U16StringPiece& text);

// Iterates over all clusters of the text in order.
//
// for (const Range& cluster : ClusterText(text)) { ... }
class ClusterText {
public:
    class iterator {
    public:
        inline bool operator==(const iterator& o) const {
            return mPos == o.mPos && mText.data() == o.mText.data();
        }
        inline bool operator!=(const iterator& o) const { return !(*this == o); }

        inline const Range& operator*() const { return mCluster; }

        inline iterator& operator++() {
            mPos = mCluster.getEnd();
            mCluster = nextCluster(mText, mPos, mRule);
            return *this;
        }

    private:
        friend class ClusterText;

        iterator(const U16StringPiece& text, uint32_t pos, ClusterRule rule)
                : mText(text), mPos(pos), mRule(rule), mCluster(nextCluster(text, pos, rule)) {}

        U16StringPiece mText;
        uint32_t mPos;
        ClusterRule mRule;
        Range mCluster;
    };

    ClusterText(const U16StringPiece& text, ClusterRule rule = ClusterRule::DISPLAY)
            : mText(text), mRule(rule) {}

    inline iterator begin() const { return iterator(mText, 0, mRule); }
    inline iterator end() const { return iterator(mText, mText.size(), mRule); }

private:
    U16StringPiece mText;
    ClusterRule mRule;
};

}  // namespace utftext

#endif  // UTFTEXT_CLUSTER_SCANNER_H
