/** \brief Test cases for HttpHeader
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
#include "HttpHeader.h"
#include "UnitTest.h"


TEST(StatusLineAndContentType) {
    const HttpHeader header("HTTP/1.1 200 OK\r\n"
                            "Server: nginx\r\n"
                            "content-type: application/rss+xml; charset=ISO-8859-1\r\n"
                            "\r\n");
    CHECK_TRUE(header.isValid());
    CHECK_EQ(header.getStatusCode(), 200u);
    CHECK_EQ(header.getStatusLine(), "OK");
    CHECK_EQ(header.getContentType(), "application/rss+xml; charset=ISO-8859-1");
    CHECK_EQ(header.getMediaType(), "application/rss+xml");
    CHECK_EQ(header.getCharset(), "ISO-8859-1");
}


TEST(BareLineFeedsAndNoReasonPhrase) {
    const HttpHeader header("HTTP/2 404\nContent-Type: Text/HTML\n");
    CHECK_TRUE(header.isValid());
    CHECK_EQ(header.getStatusCode(), 404u);
    CHECK_EQ(header.getStatusLine(), "");
    CHECK_EQ(header.getMediaType(), "text/html");
    CHECK_EQ(header.getCharset(), "");
}


TEST(InvalidHeaders) {
    CHECK_FALSE(HttpHeader("").isValid());
    CHECK_FALSE(HttpHeader("Content-Type: text/xml\r\n").isValid());
    CHECK_FALSE(HttpHeader("HTTP/1.1 abc Broken\r\n").isValid());
    CHECK_FALSE(HttpHeader().isValid());
}


TEST(GetCharsetFromContentType) {
    CHECK_EQ(HttpHeader::GetCharsetFromContentType("text/xml;charset=\"utf-8\""), "utf-8");
    CHECK_EQ(HttpHeader::GetCharsetFromContentType("text/xml; Charset=windows-1252; foo=bar"), "windows-1252");
    CHECK_EQ(HttpHeader::GetCharsetFromContentType("text/xml"), "");
}


TEST_MAIN(HttpHeader)
