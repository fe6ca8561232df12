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

// Definitions internal to utftext. Include after defining LOG_TAG.

#ifndef UTFTEXT_INTERNAL_H
#define UTFTEXT_INTERNAL_H

#include <log/log.h>

#include <cstdint>
#include <limits>
#include <optional>

namespace utftext {

#define UTFTEXT_ASSERT(cond, ...) LOG_ALWAYS_FATAL_IF(!(cond), __VA_ARGS__)

constexpr int32_t kNotFound = -1;

// Converts an internal lookup result to the index returned by the public API.
inline int32_t toPublicIndex(const std::optional<uint32_t>& index) {
    return index ? static_cast<int32_t>(*index) : kNotFound;
}

// Public indices are int32_t; every code unit offset has to be representable.
inline bool isIndexable(size_t codeUnitLength) {
    return codeUnitLength <= static_cast<size_t>(std::numeric_limits<int32_t>::max());
}

}  // namespace utftext

#endif  // UTFTEXT_INTERNAL_H
