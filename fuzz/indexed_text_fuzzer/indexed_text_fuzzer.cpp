/******************************************************************************
 *
 * Copyright (C) 2024 The Android Open Source Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at:
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
 *****************************************************************************
 */
#include <fuzzer/FuzzedDataProvider.h>

#include "utftext/IndexedText.h"
using namespace utftext;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    FuzzedDataProvider fdp(data, size);
    int32_t start = fdp.ConsumeIntegralInRange<int32_t>(-64, 1024);
    int32_t end = fdp.ConsumeIntegralInRange<int32_t>(-64, 1024);
    int32_t byteIndex = fdp.ConsumeIntegralInRange<int32_t>(-64, 1024);
    int needle_size = fdp.ConsumeIntegralInRange<int>(0, 4);
    std::u16string needle;
    for (int i = 0; i < needle_size; i++) needle.push_back(fdp.ConsumeIntegral<uint16_t>());
    std::u16string units;
    while (fdp.remaining_bytes() >= sizeof(uint16_t)) {
        units.push_back(fdp.ConsumeIntegral<uint16_t>());
    }

    IndexedText text(units);
    int32_t length = text.length();
    for (int32_t i = 0; i < length; i++) {
        int32_t b = text.findByteIndex(i);
        if (b < 0 || text.findCharIndex(b) != i) __builtin_trap();
        if (text.charAt(i).empty()) __builtin_trap();
    }
    if (!text.charAt(length).empty()) __builtin_trap();
    if (IndexedText::fromBytes(text.toBytes()) != text) __builtin_trap();

    text.findCharIndex(byteIndex);
    text.charCodeAt(start);
    text.indexOf(needle, start);
    text.lastIndexOf(needle);
    text.lastIndexOf(needle, end);
    IndexedText sliced = text.slice(start, end);
    if (sliced.codeUnitLength() > text.codeUnitLength()) __builtin_trap();
    text.substr(start, end);
    text.toCodePoints();
    text.toCharArray();
    return 0;
}
