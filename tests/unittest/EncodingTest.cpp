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

#include "utftext/Encoding.h"

#include <gtest/gtest.h>

#include "utftext/Characters.h"

#include "UnicodeUtils.h"

namespace utftext {

TEST(EncodingTest, codePointToString) {
    EXPECT_EQ(u"a", codePointToString(0x61));
    EXPECT_EQ(u"\u00E9", codePointToString(0xE9));
    EXPECT_EQ(u"\uFFFF", codePointToString(0xFFFF));

    std::u16string emoji = codePointToString(0x1F600);
    ASSERT_EQ(2u, emoji.size());
    EXPECT_EQ(0xD83D, emoji[0]);
    EXPECT_EQ(0xDE00, emoji[1]);

    std::u16string last = codePointToString(0x10FFFF);
    ASSERT_EQ(2u, last.size());
    EXPECT_EQ(0xDBFF, last[0]);
    EXPECT_EQ(0xDFFF, last[1]);

    std::u16string first = codePointToString(0x10000);
    ASSERT_EQ(2u, first.size());
    EXPECT_EQ(0xD800, first[0]);
    EXPECT_EQ(0xDC00, first[1]);
}

TEST(EncodingTest, codePointToString_surrogateValues) {
    // Surrogate code points are written as a single code unit.
    std::u16string lead = codePointToString(0xD800);
    ASSERT_EQ(1u, lead.size());
    EXPECT_EQ(0xD800, lead[0]);
}

TEST(EncodingTest, codePointToString_outOfRange) {
    std::u16string replaced = codePointToString(0x110000);
    ASSERT_EQ(1u, replaced.size());
    EXPECT_EQ(CHAR_REPLACEMENT_CHARACTER, static_cast<uint32_t>(replaced[0]));
}

TEST(EncodingTest, codePointsToString) {
    EXPECT_EQ(u"", codePointsToString({}));
    EXPECT_EQ(utf8ToUtf16("a\U0001F600b"), codePointsToString({0x61, 0x1F600, 0x62}));
    EXPECT_EQ(utf8ToUtf16("\U0001F1FA\U0001F1F8"), codePointsToString({0x1F1FA, 0x1F1F8}));
}

TEST(EncodingTest, stringToBytes) {
    EXPECT_TRUE(stringToBytes(u"").empty());

    std::vector<uint8_t> expected = {0x00, 0x61, 0xD8, 0x3D, 0xDE, 0x00, 0x00, 0x62};
    std::u16string text = utf8ToUtf16("a\U0001F600b");
    EXPECT_EQ(expected, stringToBytes(text));

    // NUL is still two bytes.
    std::u16string nul(1, u'\0');
    EXPECT_EQ(std::vector<uint8_t>({0x00, 0x00}), stringToBytes(nul));
}

TEST(EncodingTest, bytesToString) {
    EXPECT_EQ(u"", bytesToString({}));
    EXPECT_EQ(u"AB", bytesToString({0x00, 0x41, 0x00, 0x42}));
    EXPECT_EQ(utf8ToUtf16("\U0001F600"), bytesToString({0xD8, 0x3D, 0xDE, 0x00}));
    EXPECT_EQ(u"\u4E2D", bytesToString({0x4E, 0x2D}));
}

TEST(EncodingTest, bytesToString_oddLength) {
    std::u16string text = bytesToString({0x00, 0x41, 0x30});
    ASSERT_EQ(2u, text.size());
    EXPECT_EQ(u'A', text[0]);
    EXPECT_EQ(0x3000, text[1]);
}

TEST(EncodingTest, bytesRoundTrip) {
    std::u16string text =
            utf8ToUtf16("Gr\u00FC\u00DFe, \u4E16\u754C \U0001F600 \U0001F1EF\U0001F1F5");
    text.push_back(static_cast<char16_t>(0xDC00));  // unpaired trail
    text.push_back(u'\0');
    EXPECT_EQ(text, bytesToString(stringToBytes(text)));
}

}  // namespace utftext
