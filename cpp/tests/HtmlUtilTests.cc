/** \brief Test cases for HtmlUtil
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
#include "HtmlUtil.h"
#include "UnitTest.h"


TEST(DecodeEntity) {
    std::string utf8;
    CHECK_TRUE(HtmlUtil::DecodeEntity("amp", &utf8));
    CHECK_TRUE(HtmlUtil::DecodeEntity("#65", &utf8));
    CHECK_TRUE(HtmlUtil::DecodeEntity("#x42", &utf8));
    CHECK_TRUE(HtmlUtil::DecodeEntity("eacute", &utf8));
    CHECK_EQ(utf8, "&AB\xC3\xA9");

    CHECK_FALSE(HtmlUtil::DecodeEntity("bogus", &utf8));
    CHECK_FALSE(HtmlUtil::DecodeEntity("#0", &utf8));
    CHECK_FALSE(HtmlUtil::DecodeEntity("#x", &utf8));
    CHECK_FALSE(HtmlUtil::DecodeEntity("#12z", &utf8));
}


TEST(ReplaceEntities) {
    CHECK_EQ(HtmlUtil::ReplaceEntities("Tom &amp; Jerry &lt;3"), "Tom & Jerry <3");
    CHECK_EQ(HtmlUtil::ReplaceEntities("&#x263A;"), "\xE2\x98\xBA");
    CHECK_EQ(HtmlUtil::ReplaceEntities("caf&eacute;&nbsp;"), "caf\xC3\xA9\xC2\xA0");
}


TEST(ReplaceEntitiesKeepsUnmatchedAmpersands) {
    CHECK_EQ(HtmlUtil::ReplaceEntities("R&D"), "R&D");
    CHECK_EQ(HtmlUtil::ReplaceEntities("a & b; c"), "a & b; c");
    CHECK_EQ(HtmlUtil::ReplaceEntities("&&amp;"), "&&");
}


TEST(ReplaceEntitiesUnknownEntityModes) {
    CHECK_EQ(HtmlUtil::ReplaceEntities("x&bogus;y"), "x&bogus;y");
    CHECK_EQ(HtmlUtil::ReplaceEntities("x&bogus;y", HtmlUtil::REMOVE_UNKNOWN_ENTITIES), "xy");
}


TEST(StripHtmlTags) {
    CHECK_EQ(HtmlUtil::StripHtmlTags("<p>Hello</p>"), " Hello ");
    CHECK_EQ(HtmlUtil::StripHtmlTags("a<br/>b"), "a b");
    CHECK_EQ(HtmlUtil::StripHtmlTags("1 < 2"), "1 < 2");
    CHECK_EQ(HtmlUtil::StripHtmlTags("a <> b"), "a <> b");
    CHECK_EQ(HtmlUtil::StripHtmlTags("x << <b>y</b>"), "x <<  y ");
}


TEST_MAIN(HtmlUtil)
