/** \brief Test cases for TextUtil
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
#include <string>
#include "TextUtil.h"
#include "UnitTest.h"


TEST(CanonizeCharset) {
    CHECK_EQ(TextUtil::CanonizeCharset("UTF-8"), TextUtil::EncodingConverter::CANONICAL_UTF8_NAME);
    CHECK_EQ(TextUtil::CanonizeCharset("utf_8"), "utf8");
    CHECK_EQ(TextUtil::CanonizeCharset("ISO-8859-1"), "iso88591");
}


TEST(IsValidUTF8) {
    CHECK_TRUE(TextUtil::IsValidUTF8("plain ASCII"));
    CHECK_TRUE(TextUtil::IsValidUTF8("Gr\xC3\xBC\xC3\x9F" "e \xE2\x82\xAC"));
    CHECK_FALSE(TextUtil::IsValidUTF8("Gr\xFC\xDF" "e"));
    CHECK_FALSE(TextUtil::IsValidUTF8("\xC0\xAF"));
    CHECK_FALSE(TextUtil::IsValidUTF8("\xE2\x82"));
}


TEST(WCharToUTF8String) {
    std::string utf8;
    CHECK_TRUE(TextUtil::WCharToUTF8String(0x41, &utf8));
    CHECK_TRUE(TextUtil::WCharToUTF8String(0xE4, &utf8));
    CHECK_TRUE(TextUtil::WCharToUTF8String(0x20AC, &utf8));
    CHECK_TRUE(TextUtil::WCharToUTF8String(0x1F600, &utf8));
    CHECK_EQ(utf8, "A\xC3\xA4\xE2\x82\xAC\xF0\x9F\x98\x80");
    CHECK_FALSE(TextUtil::WCharToUTF8String(0x110000, &utf8));
}


TEST(ConvertToUTF8) {
    std::string utf8;
    CHECK_TRUE(TextUtil::ConvertToUTF8("ISO-8859-1", "M\xFC" "nchen", &utf8));
    CHECK_EQ(utf8, "M\xC3\xBCnchen");

    CHECK_TRUE(TextUtil::ConvertToUTF8("UTF-16LE", std::string("h\0i\0", 4), &utf8));
    CHECK_EQ(utf8, "hi");

    CHECK_FALSE(TextUtil::ConvertToUTF8("no-such-charset", "abc", &utf8));
}


TEST(ByteOrderMarks) {
    std::string s("\xEF\xBB\xBF<rss/>");
    CHECK_TRUE(TextUtil::StripUTF8ByteOrderMark(&s));
    CHECK_EQ(s, "<rss/>");
    CHECK_FALSE(TextUtil::StripUTF8ByteOrderMark(&s));

    CHECK_EQ(TextUtil::GetUTF16ByteOrderMarkEncoding("\xFF\xFE<\0"), "UTF-16LE");
    CHECK_EQ(TextUtil::GetUTF16ByteOrderMarkEncoding("\xFE\xFF\0<"), "UTF-16BE");
    CHECK_EQ(TextUtil::GetUTF16ByteOrderMarkEncoding("<rss/>"), "");
}


TEST(GetXMLDeclarationEncoding) {
    CHECK_EQ(TextUtil::GetXMLDeclarationEncoding("<?xml version=\"1.0\" encoding=\"ISO-8859-1\"?><rss/>"), "ISO-8859-1");
    CHECK_EQ(TextUtil::GetXMLDeclarationEncoding("<?xml version='1.0' encoding='windows-1252'?><rss/>"), "windows-1252");
    CHECK_EQ(TextUtil::GetXMLDeclarationEncoding("<?xml version=\"1.0\"?><rss/>"), "");
    CHECK_EQ(TextUtil::GetXMLDeclarationEncoding("<rss encoding=\"latin1\"/>"), "");
}


TEST(CollapseAndTrimWhitespace) {
    CHECK_EQ(TextUtil::CollapseAndTrimWhitespace("  Hello \n\t World  "), "Hello World");
    CHECK_EQ(TextUtil::CollapseAndTrimWhitespace("a\xC2\xA0\xC2\xA0" "b"), "a b");
    CHECK_EQ(TextUtil::CollapseAndTrimWhitespace(" \r\n "), "");
}


TEST_MAIN(TextUtil)
