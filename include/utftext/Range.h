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

#ifndef UTFTEXT_RANGE_H
#define UTFTEXT_RANGE_H

#include <cstdint>
#include <ostream>

namespace utftext {

// An undirected range of code units: [start, end).
class Range {
public:
    Range(const Range&) = default;
    Range& operator=(const Range&) = default;

    constexpr Range(uint32_t start, uint32_t end) : mStart(start), mEnd(end) {}

    inline uint32_t getStart() const { return mStart; }
    inline uint32_t getEnd() const { return mEnd; }
    inline uint32_t getLength() const { return mEnd - mStart; }

    inline bool operator==(const Range& o) const { return mStart == o.mStart && mEnd == o.mEnd; }
    inline bool operator!=(const Range& o) const { return !(*this == o); }

private:
    uint32_t mStart;
    uint32_t mEnd;
};

inline std::ostream& operator<<(std::ostream& os, const Range& r) {
    return os << "(" << r.getStart() << ", " << r.getEnd() << ")";
}

}  // namespace utftext

#endif  // UTFTEXT_RANGE_H
