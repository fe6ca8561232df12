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

#ifndef UTFTEXT_FEATURE_FLAGS_H
#define UTFTEXT_FEATURE_FLAGS_H

// Flag values are set by the build, see the UTFTEXT_* options in CMakeLists.txt.
#ifndef UTFTEXT_NUL_TERMINATES_CODE_POINTS
#define UTFTEXT_NUL_TERMINATES_CODE_POINTS 1
#endif  // UTFTEXT_NUL_TERMINATES_CODE_POINTS

namespace features {

#define DEFINE_FEATURE_FLAG_ACCESSOR(feature_name, build_value) \
    inline bool feature_name() {                                \
        return (build_value) != 0;                              \
    }

// IndexedText::toCodePoints() stops at the first U+0000 instead of the end of text.
DEFINE_FEATURE_FLAG_ACCESSOR(nul_terminates_code_points, UTFTEXT_NUL_TERMINATES_CODE_POINTS);

}  // namespace features

#endif  // UTFTEXT_FEATURE_FLAGS_H
