/** \brief Test cases for SyndicationFormat and NormalizedFeed
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
#include <memory>
#include <string>
#include "SyndicationFormat.h"
#include "UnitTest.h"


namespace {


std::unique_ptr<NormalizedFeed> Normalize(const std::string &document, ParseError * const parse_error,
                                          const std::string &declared_charset = "")
{
    return SyndicationFormat::Normalize(document, declared_charset, parse_error);
}


const std::string RSS_EXAMPLE("<rss><channel><title>Ex</title><item><title>A</title><link>http://x/1</link></item></channel></rss>");


} // unnamed namespace


TEST(RSS20Example) {
    ParseError parse_error;
    const auto feed(Normalize(RSS_EXAMPLE, &parse_error));

    CHECK_FALSE(parse_error.isError());
    CHECK_NE(feed, nullptr);
    CHECK_EQ(feed->getDialect(), NormalizedFeed::RSS20);
    CHECK_EQ(feed->getFormatName(), "RSS 2.0");
    CHECK_EQ(*feed->getTitle(), "Ex");
    CHECK_FALSE(feed->getDescription().has_value());
    CHECK_FALSE(feed->getLink().has_value());
    CHECK_EQ(feed->size(), 1u);

    const NormalizedFeed::Entry &entry(feed->getEntries().front());
    CHECK_EQ(*entry.getTitle(), "A");
    CHECK_EQ(*entry.getLink(), "http://x/1");
    CHECK_FALSE(entry.getDescription().has_value());
}


TEST(AtomPrefersAlternateLink) {
    ParseError parse_error;
    const auto feed(Normalize("<feed><entry><link rel=\"self\" href=\"http://x/s\"/><link rel=\"alternate\" href=\"http://x/a\"/>"
                              "<title>B</title></entry></feed>",
                              &parse_error));

    CHECK_NE(feed, nullptr);
    CHECK_EQ(feed->getDialect(), NormalizedFeed::ATOM);
    CHECK_EQ(feed->size(), 1u);
    CHECK_EQ(*feed->getEntries()[0].getTitle(), "B");
    CHECK_EQ(*feed->getEntries()[0].getLink(), "http://x/a");
}


TEST(AtomWithNamespace) {
    ParseError parse_error;
    const auto feed(Normalize("<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
                              "<feed xmlns=\"http://www.w3.org/2005/Atom\">\n"
                              "  <title>  My   Blog </title>\n"
                              "  <subtitle>All about  things</subtitle>\n"
                              "  <link rel=\"self\" href=\"http://blog/feed\"/>\n"
                              "  <link href=\"http://blog/\"/>\n"
                              "  <entry>\n"
                              "    <title>Post</title>\n"
                              "    <link href=\"http://blog/post\"/>\n"
                              "    <summary>  Short </summary>\n"
                              "    <content>Long</content>\n"
                              "  </entry>\n"
                              "  <entry>\n"
                              "    <title>Other</title>\n"
                              "    <content type=\"html\">&lt;p&gt;Body&lt;/p&gt;</content>\n"
                              "  </entry>\n"
                              "</feed>\n",
                              &parse_error));

    CHECK_NE(feed, nullptr);
    CHECK_EQ(*feed->getTitle(), "My Blog");
    CHECK_EQ(*feed->getDescription(), "All about  things");
    CHECK_EQ(*feed->getLink(), "http://blog/");
    CHECK_EQ(feed->size(), 2u);
    CHECK_EQ(*feed->getEntries()[0].getDescription(), "Short");
    CHECK_EQ(*feed->getEntries()[1].getDescription(), "<p>Body</p>");
    CHECK_FALSE(feed->getEntries()[1].getLink().has_value());
}


TEST(AtomXhtmlContent) {
    ParseError parse_error;
    const auto feed(Normalize("<feed xmlns=\"http://www.w3.org/2005/Atom\"><entry><title>X</title>"
                              "<content type=\"xhtml\"><div xmlns=\"http://www.w3.org/1999/xhtml\"><b>bold</b></div></content>"
                              "</entry></feed>",
                              &parse_error));

    CHECK_NE(feed, nullptr);
    CHECK_EQ(*feed->getEntries()[0].getDescription(), "<div xmlns=\"http://www.w3.org/1999/xhtml\"><b>bold</b></div>");
}


TEST(AtomEmptySummaryFallsBackToContent) {
    ParseError parse_error;
    const auto feed(Normalize("<feed xmlns=\"http://www.w3.org/2005/Atom\">"
                              "<entry><title>Blank</title><summary>   </summary><content> From content </content></entry>"
                              "<entry><title>Empty</title><summary/><content>Also content</content></entry>"
                              "<entry><title>Neither</title><summary/><content>\n</content></entry>"
                              "</feed>",
                              &parse_error));

    CHECK_NE(feed, nullptr);
    CHECK_EQ(feed->size(), 3u);
    CHECK_EQ(*feed->getEntries()[0].getDescription(), "From content");
    CHECK_EQ(*feed->getEntries()[1].getDescription(), "Also content");
    CHECK_FALSE(feed->getEntries()[2].getDescription().has_value());
}


TEST(PrefixedAtomRoot) {
    ParseError parse_error;
    const auto feed(Normalize("<a:feed xmlns:a=\"http://www.w3.org/2005/Atom\"><a:title>T</a:title>"
                              "<a:entry><a:title>E</a:title></a:entry></a:feed>",
                              &parse_error));

    CHECK_NE(feed, nullptr);
    CHECK_EQ(*feed->getTitle(), "T");
    CHECK_EQ(feed->size(), 1u);
}


TEST(RSSLinkTextAndWhitespace) {
    ParseError parse_error;
    const auto feed(Normalize("<rss version=\"2.0\"><channel>\n"
                              "<title>\n   </title>\n"
                              "<link>\n  http://site/  \n</link>\n"
                              "<description>  <![CDATA[<p>Hello &amp; welcome</p>]]>  </description>\n"
                              "<item><title>  Spaced \n  out </title><description>  D  </description></item>\n"
                              "</channel></rss>",
                              &parse_error));

    CHECK_NE(feed, nullptr);
    CHECK_FALSE(feed->getTitle().has_value());
    CHECK_EQ(*feed->getLink(), "http://site/");
    CHECK_EQ(*feed->getDescription(), "<p>Hello &amp; welcome</p>");
    CHECK_EQ(*feed->getEntries()[0].getTitle(), "Spaced out");
    CHECK_EQ(*feed->getEntries()[0].getDescription(), "D");
}


TEST(EntriesWithoutTitleAndLinkAreDropped) {
    ParseError parse_error;
    const auto feed(Normalize("<rss><channel><title>T</title>"
                              "<item><description>only a description</description></item>"
                              "<item><title> </title><link/></item>"
                              "<item><link>http://x/2</link></item>"
                              "</channel></rss>",
                              &parse_error));

    CHECK_NE(feed, nullptr);
    CHECK_EQ(feed->size(), 1u);
    CHECK_FALSE(feed->getEntries()[0].getTitle().has_value());
    CHECK_EQ(*feed->getEntries()[0].getLink(), "http://x/2");
}


TEST(EmptyFeed) {
    ParseError parse_error;
    const auto feed(Normalize("<rss><channel><title>Quiet</title></channel></rss>", &parse_error));

    CHECK_NE(feed, nullptr);
    CHECK_TRUE(feed->empty());
}


TEST(NormalizeIsDeterministic) {
    ParseError parse_error1, parse_error2;
    const auto feed1(Normalize(RSS_EXAMPLE, &parse_error1));
    const auto feed2(Normalize(RSS_EXAMPLE, &parse_error2));

    CHECK_TRUE(feed1 != nullptr and feed2 != nullptr);
    CHECK_TRUE(*feed1 == *feed2);
}


TEST(UnknownDialect) {
    ParseError parse_error;
    CHECK_EQ(Normalize("<foo><bar/></foo>", &parse_error), nullptr);
    CHECK_EQ(parse_error.getKind(), ParseError::UNKNOWN_DIALECT);
    CHECK_EQ(parse_error.toString(), "unknown feed dialect: root element is \"foo\"");
}


TEST(Malformed) {
    ParseError parse_error;
    CHECK_EQ(Normalize("<rss><channel><title>Oops</channel></rss>", &parse_error), nullptr);
    CHECK_EQ(parse_error.getKind(), ParseError::MALFORMED);

    CHECK_EQ(Normalize("<rss><channel><x:title>T</x:title></channel></rss>", &parse_error), nullptr);
    CHECK_EQ(parse_error.getKind(), ParseError::MALFORMED);

    CHECK_EQ(Normalize("", &parse_error), nullptr);
    CHECK_EQ(parse_error.getKind(), ParseError::MALFORMED);

    CHECK_EQ(Normalize(" \r\n ", &parse_error), nullptr);
    CHECK_EQ(parse_error.getKind(), ParseError::MALFORMED);
}


TEST(MissingChannel) {
    ParseError parse_error;
    CHECK_EQ(Normalize("<rss version=\"2.0\"><item><title>A</title></item></rss>", &parse_error), nullptr);
    CHECK_EQ(parse_error.getKind(), ParseError::MISSING_CHANNEL);
}


TEST(DeclaredEncodings) {
    ParseError parse_error;
    const auto feed(Normalize("<?xml version=\"1.0\" encoding=\"ISO-8859-1\"?><rss><channel><title>M\xE4rz</title></channel></rss>",
                              &parse_error));
    CHECK_NE(feed, nullptr);
    CHECK_EQ(*feed->getTitle(), "M\xC3\xA4rz");

    const auto feed2(Normalize("<rss><channel><title>M\xE4rz</title></channel></rss>", &parse_error, "iso-8859-1"));
    CHECK_NE(feed2, nullptr);
    CHECK_EQ(*feed2->getTitle(), "M\xC3\xA4rz");
}


TEST(UndeterminableEncoding) {
    ParseError parse_error;
    CHECK_EQ(Normalize("<rss><channel><title>M\xE4rz</title></channel></rss>", &parse_error), nullptr);
    CHECK_EQ(parse_error.getKind(), ParseError::ENCODING);
}


TEST(ByteOrderMarks) {
    ParseError parse_error;
    const auto feed(Normalize("\xEF\xBB\xBF" + RSS_EXAMPLE, &parse_error));
    CHECK_NE(feed, nullptr);

    std::string utf16le_document("\xFF\xFE");
    for (const char ch : RSS_EXAMPLE) {
        utf16le_document += ch;
        utf16le_document += '\0';
    }
    const auto feed2(Normalize(utf16le_document, &parse_error));
    CHECK_NE(feed2, nullptr);
    CHECK_TRUE(*feed == *feed2);
}


TEST(SelectLinkTiers) {
    const XMLTree tree("<links>"
                       "<link rel=\"self\" href=\"http://x/self\"/>"
                       "<link rel=\"alternate\"/>"
                       "<link rel=\"\" href=\"http://x/typeless\"/>"
                       "<link rel=\"alternate\" href=\"http://x/alternate\"/>"
                       "</links>");
    const auto links(tree.getRoot().findChildren("link", ""));

    CHECK_EQ(*SelectLink(links, HREF_THEN_TEXT), "http://x/alternate");
    CHECK_EQ(*SelectLink({ links[0], links[1], links[2] }, HREF_THEN_TEXT), "http://x/typeless");
    CHECK_EQ(*SelectLink({ links[0], links[1] }, HREF_THEN_TEXT), "http://x/self");
    CHECK_FALSE(SelectLink({ links[1] }, HREF_THEN_TEXT).has_value());
    CHECK_FALSE(SelectLink({}, TEXT_ONLY).has_value());
}


TEST(SelectLinkTextOnly) {
    const XMLTree tree("<item><link href=\"http://x/attr\">http://x/text</link></item>");
    const auto links(tree.getRoot().findChildren("link", ""));

    CHECK_EQ(*SelectLink(links, TEXT_ONLY), "http://x/text");
    CHECK_EQ(*SelectLink(links, HREF_THEN_TEXT), "http://x/attr");
}


TEST_MAIN(SyndicationFormat)
