/** \file   SyndicationFormat.cc
 *  \brief  Implementation of the syndication format classes.
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
#include "SyndicationFormat.h"
#include "Compiler.h"
#include "StringUtil.h"
#include "TextUtil.h"
#include "util.h"


std::string ParseError::KindToString(const Kind kind) {
    switch (kind) {
    case NONE:
        return "no error";
    case ENCODING:
        return "encoding error";
    case MALFORMED:
        return "malformed document";
    case UNKNOWN_DIALECT:
        return "unknown feed dialect";
    case MISSING_CHANNEL:
        return "missing channel";
    }

    LOG_ERROR("unknown kind " + std::to_string(static_cast<int>(kind)) + "!");
}


std::string ParseError::toString() const {
    if (detail_.empty())
        return KindToString(kind_);
    return KindToString(kind_) + ": " + detail_;
}


namespace {


// \return The trimmed string or std::nullopt if nothing is left after trimming.
std::optional<std::string> NonEmptyOrNothing(std::string s) {
    StringUtil::TrimWhite(&s);
    if (s.empty())
        return std::nullopt;
    return s;
}


std::optional<std::string> GetText(const XMLTree::Element * const element) {
    if (element == nullptr)
        return std::nullopt;
    return NonEmptyOrNothing(element->getText());
}


// Like GetText() but collapses internal runs of whitespace, e.g. for titles and links.
std::optional<std::string> GetCollapsedText(const XMLTree::Element * const element) {
    if (element == nullptr)
        return std::nullopt;
    return NonEmptyOrNothing(TextUtil::CollapseAndTrimWhitespace(element->getText()));
}


// Atom text constructs of type "xhtml" carry markup rather than text.
std::optional<std::string> GetTextConstruct(const XMLTree::Element * const element, const bool collapse_whitespace) {
    if (element == nullptr)
        return std::nullopt;

    if (element->getAttribute("type") == "xhtml") {
        const std::string inner_xml(element->getInnerXml());
        return NonEmptyOrNothing(collapse_whitespace ? TextUtil::CollapseAndTrimWhitespace(inner_xml) : inner_xml);
    }

    return collapse_whitespace ? GetCollapsedText(element) : GetText(element);
}


std::optional<std::string> GetLinkValue(const XMLTree::Element &link, const LinkStyle link_style) {
    if (link_style == HREF_THEN_TEXT) {
        const auto href(NonEmptyOrNothing(link.getAttribute("href")));
        if (href)
            return href;
    }

    return GetCollapsedText(&link);
}


} // unnamed namespace


std::optional<std::string> SelectLink(const std::vector<const XMLTree::Element *> &candidates, const LinkStyle link_style) {
    for (const auto candidate : candidates) {
        if (candidate->getAttribute("rel") == "alternate") {
            const auto link(GetLinkValue(*candidate, link_style));
            if (link)
                return link;
        }
    }

    for (const auto candidate : candidates) {
        if (candidate->getAttribute("rel").empty()) {
            const auto link(GetLinkValue(*candidate, link_style));
            if (link)
                return link;
        }
    }

    for (const auto candidate : candidates) {
        const auto link(GetLinkValue(*candidate, link_style));
        if (link)
            return link;
    }

    return std::nullopt;
}


const std::string SyndicationFormat::ATOM_NAMESPACE_URI("http://www.w3.org/2005/Atom");


SyndicationFormat::SyndicationFormat(const XMLTree::Element &root, const std::string &canonical_prefix): root_(root) {
    namespaces_[canonical_prefix] = root.getNamespaceURI();
}


const std::string &SyndicationFormat::getNamespaceURI(const std::string &canonical_prefix) const {
    static const std::string NO_NAMESPACE;

    const auto prefix_and_uri(namespaces_.find(canonical_prefix));
    return (prefix_and_uri == namespaces_.cend()) ? NO_NAMESPACE : prefix_and_uri->second;
}


std::unique_ptr<SyndicationFormat> SyndicationFormat::Factory(const XMLTree::Element &root, ParseError * const parse_error) {
    *parse_error = ParseError();

    if (StringUtil::EndsWith(root.getLocalName(), "feed") or root.getNamespaceURI() == ATOM_NAMESPACE_URI)
        return std::unique_ptr<SyndicationFormat>(new Atom(root));
    if (StringUtil::EndsWith(root.getLocalName(), "rss"))
        return std::unique_ptr<SyndicationFormat>(new RSS20(root));

    *parse_error = ParseError::UnknownDialect("root element is \"" + root.getQualifiedName() + "\"");
    return nullptr;
}


bool SyndicationFormat::DecodeDocument(const std::string &raw_document, const std::string &declared_charset,
                                       std::string * const utf8_document, ParseError * const parse_error)
{
    *parse_error = ParseError();
    utf8_document->clear();

    std::string document(raw_document);
    TextUtil::StripUTF8ByteOrderMark(&document);

    const std::string utf16_encoding(TextUtil::GetUTF16ByteOrderMarkEncoding(document));
    if (not utf16_encoding.empty()) {
        if (not TextUtil::ConvertToUTF8(utf16_encoding, document.substr(2), utf8_document)
            or not TextUtil::IsValidUTF8(*utf8_document))
        {
            *parse_error = ParseError::Encoding("invalid " + utf16_encoding + " data");
            return false;
        }
    } else if (TextUtil::IsValidUTF8(document))
        utf8_document->swap(document);
    else {
        const std::vector<std::string> candidate_encodings{ declared_charset,
                                                             TextUtil::GetXMLDeclarationEncoding(StringUtil::TrimWhite(document)) };
        bool converted(false);
        for (const auto &candidate_encoding : candidate_encodings) {
            // We already know that the document is not valid UTF-8.
            if (candidate_encoding.empty()
                or TextUtil::CanonizeCharset(candidate_encoding) == TextUtil::EncodingConverter::CANONICAL_UTF8_NAME)
                continue;

            if (TextUtil::ConvertToUTF8(candidate_encoding, document, utf8_document) and TextUtil::IsValidUTF8(*utf8_document)) {
                LOG_DEBUG("converted document from \"" + candidate_encoding + "\" to UTF-8.");
                converted = true;
                break;
            }
        }

        if (not converted) {
            *parse_error = ParseError::Encoding("document is not valid UTF-8 and no usable charset was declared");
            return false;
        }
    }

    StringUtil::TrimWhite(utf8_document);
    if (TextUtil::StripUTF8ByteOrderMark(utf8_document))
        StringUtil::TrimWhite(utf8_document);

    return true;
}


std::unique_ptr<NormalizedFeed> SyndicationFormat::Normalize(const std::string &raw_document, const std::string &declared_charset,
                                                             ParseError * const parse_error)
{
    std::string utf8_document;
    if (not DecodeDocument(raw_document, declared_charset, &utf8_document, parse_error))
        return nullptr;

    if (utf8_document.empty()) {
        *parse_error = ParseError::Malformed("empty document");
        return nullptr;
    }

    try {
        const XMLTree xml_tree(utf8_document);
        const auto syndication_format(Factory(xml_tree.getRoot(), parse_error));
        if (syndication_format == nullptr)
            return nullptr;

        LOG_DEBUG("detected a " + syndication_format->getFormatName() + " document.");
        return syndication_format->extract(parse_error);
    } catch (const XMLParser::Error &error) {
        *parse_error = ParseError::Malformed(error.what());
        return nullptr;
    }
}


std::unique_ptr<NormalizedFeed> RSS20::extract(ParseError * const parse_error) const {
    *parse_error = ParseError();

    const std::string &rss_namespace(getNamespaceURI("rss"));
    const XMLTree::Element * const channel(root_.findChild("channel", rss_namespace));
    if (channel == nullptr) {
        *parse_error = ParseError::MissingChannel();
        return nullptr;
    }

    std::vector<NormalizedFeed::Entry> entries;
    for (const auto item : channel->findChildren("item", rss_namespace))
        entries.emplace_back(GetCollapsedText(item->findChild("title", rss_namespace)),
                             SelectLink(item->findChildren("link", rss_namespace), TEXT_ONLY),
                             GetText(item->findChild("description", rss_namespace)));

    return std::unique_ptr<NormalizedFeed>(new NormalizedFeed(NormalizedFeed::RSS20,
                                                              GetCollapsedText(channel->findChild("title", rss_namespace)),
                                                              GetText(channel->findChild("description", rss_namespace)),
                                                              SelectLink(channel->findChildren("link", rss_namespace), TEXT_ONLY),
                                                              entries));
}


NormalizedFeed::Entry Atom::extractEntry(const XMLTree::Element &entry) const {
    const std::string &atom_namespace(getNamespaceURI("atom"));

    // The summary takes precedence over the content.
    std::optional<std::string> description(GetTextConstruct(entry.findChild("summary", atom_namespace), /* collapse_whitespace = */ false));
    if (not description)
        description = GetTextConstruct(entry.findChild("content", atom_namespace), /* collapse_whitespace = */ false);

    return NormalizedFeed::Entry(GetTextConstruct(entry.findChild("title", atom_namespace), /* collapse_whitespace = */ true),
                                 SelectLink(entry.findChildren("link", atom_namespace), HREF_THEN_TEXT), description);
}


std::unique_ptr<NormalizedFeed> Atom::extract(ParseError * const parse_error) const {
    *parse_error = ParseError();

    const std::string &atom_namespace(getNamespaceURI("atom"));
    std::vector<NormalizedFeed::Entry> entries;
    for (const auto entry : root_.findChildren("entry", atom_namespace))
        entries.emplace_back(extractEntry(*entry));

    return std::unique_ptr<NormalizedFeed>(
        new NormalizedFeed(NormalizedFeed::ATOM,
                           GetTextConstruct(root_.findChild("title", atom_namespace), /* collapse_whitespace = */ true),
                           GetTextConstruct(root_.findChild("subtitle", atom_namespace), /* collapse_whitespace = */ false),
                           SelectLink(root_.findChildren("link", atom_namespace), HREF_THEN_TEXT), entries));
}
