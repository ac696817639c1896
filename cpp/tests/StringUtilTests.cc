/** \brief Test cases for StringUtil
 *
 *  \copyright 2024 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#include <vector>
#include "StringUtil.h"
#include "UnitTest.h"


TEST(TrimWhite) {
    CHECK_EQ(StringUtil::TrimWhite("  \t abc \r\n"), "abc");
    CHECK_EQ(StringUtil::TrimWhite(" \n\t "), "");
    CHECK_EQ(StringUtil::TrimWhite("a b"), "a b");
}


TEST(StartsWithAndEndsWith) {
    CHECK_TRUE(StringUtil::StartsWith("Content-Type: text/xml", "Content-Type:"));
    CHECK_FALSE(StringUtil::StartsWith("content-type: text/xml", "Content-Type:"));
    CHECK_TRUE(StringUtil::StartsWith("content-type: text/xml", "Content-Type:", /* ignore_case = */ true));
    CHECK_TRUE(StringUtil::EndsWith("rdf:RSS", "rss", /* ignore_case = */ true));
    CHECK_FALSE(StringUtil::EndsWith("rss", "feed"));
    CHECK_TRUE(StringUtil::EndsWith("anything", ""));
}


TEST(Split) {
    std::vector<std::string> parts;
    CHECK_EQ(StringUtil::Split(std::string("a,,b,c"), ',', &parts), 3u);
    CHECK_EQ(parts[1], "b");

    CHECK_EQ(StringUtil::Split(std::string("a,,b"), ',', &parts, /* suppress_empty_components = */ false), 3u);
    CHECK_EQ(parts[1], "");

    CHECK_EQ(StringUtil::Split(std::string("x\r\ny\r\n"), std::string("\r\n"), &parts), 2u);
    CHECK_EQ(parts[1], "y");
}


TEST(ToUnsigned) {
    unsigned n;
    CHECK_TRUE(StringUtil::ToUnsigned("42", &n));
    CHECK_EQ(n, 42u);
    CHECK_TRUE(StringUtil::ToUnsigned(" 7", &n));
    CHECK_EQ(n, 7u);
    CHECK_FALSE(StringUtil::ToUnsigned("-1", &n));
    CHECK_FALSE(StringUtil::ToUnsigned("12a", &n));
    CHECK_FALSE(StringUtil::ToUnsigned("", &n));
}


TEST(ReplaceString) {
    std::string s("a\r\nb\r\nc");
    StringUtil::ReplaceString("\r\n", "\n", &s);
    CHECK_EQ(s, "a\nb\nc");

    std::string t("xx");
    StringUtil::ReplaceString("x", "y", &t, /* global = */ false);
    CHECK_EQ(t, "yx");
}


TEST(WordWrapBreaksBetweenWords) {
    CHECK_EQ(StringUtil::WordWrap("aaa bbb ccc", 7), "aaa bbb\nccc");
    CHECK_EQ(StringUtil::WordWrap("one two three", 12, "  Desc: ", "        "), "  Desc: one\n        two\n        three");
}


TEST(WordWrapKeepsLongWords) {
    CHECK_EQ(StringUtil::WordWrap("abcdefghij xy", 5), "abcdefghij\nxy");
}


TEST(WordWrapCountsCodePoints) {
    // Four two-byte characters fit into a line of length 9 together with a four-letter word.
    CHECK_EQ(StringUtil::WordWrap("\xC3\xA4\xC3\xB6\xC3\xBC\xC3\x9F abcd", 9), "\xC3\xA4\xC3\xB6\xC3\xBC\xC3\x9F abcd");
}


TEST(WordWrapEmptyText) {
    CHECK_EQ(StringUtil::WordWrap("", 10, "> "), "> ");
    CHECK_EQ(StringUtil::WordWrap(" \n ", 10), "");
}


TEST_MAIN(StringUtil)
