/** \file   SyndicationFormat.h
 *  \brief  Normalisation of RSS 2.0 and Atom documents into NormalizedFeed instances.
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
#pragma once


#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "NormalizedFeed.h"
#include "XMLTree.h"


/** \class  ParseError
 *  \brief  Describes why a feed document could not be normalised.
 */
class ParseError {
public:
    enum Kind { NONE, ENCODING, MALFORMED, UNKNOWN_DIALECT, MISSING_CHANNEL };

private:
    Kind kind_;
    std::string detail_;

public:
    ParseError(): kind_(NONE) { }

    inline Kind getKind() const { return kind_; }
    inline bool isError() const { return kind_ != NONE; }
    inline const std::string &getMessage() const { return detail_; }
    std::string toString() const;

    static std::string KindToString(const Kind kind);

    static ParseError Encoding(const std::string &detail) { return ParseError(ENCODING, detail); }
    static ParseError Malformed(const std::string &detail) { return ParseError(MALFORMED, detail); }
    static ParseError UnknownDialect(const std::string &detail) { return ParseError(UNKNOWN_DIALECT, detail); }
    static ParseError MissingChannel() { return ParseError(MISSING_CHANNEL, "no channel element"); }

private:
    ParseError(const Kind kind, const std::string &detail): kind_(kind), detail_(detail) { }
};


enum LinkStyle {
    HREF_THEN_TEXT, //< Atom: the "href" attribute, or the element text if there is no usable "href".
    TEXT_ONLY       //< RSS: the element text.
};


/** \brief  Picks the link of a feed or entry from a list of link elements.
 *  \return The value of the first candidate with rel="alternate", else of the first candidate without a "rel" attribute
 *          (an empty "rel" counts as missing), else of the first candidate at all.  Within each of these three groups,
 *          candidates without a usable value are skipped.  std::nullopt if there is no usable value at all.
 */
std::optional<std::string> SelectLink(const std::vector<const XMLTree::Element *> &candidates, const LinkStyle link_style);


class SyndicationFormat {
public:
    static const std::string ATOM_NAMESPACE_URI;

protected:
    const XMLTree::Element &root_;

    // Maps canonical prefixes, "atom" or "rss", to the namespace URI that the document uses for them.
    std::unordered_map<std::string, std::string> namespaces_;

protected:
    SyndicationFormat(const XMLTree::Element &root, const std::string &canonical_prefix);

    // \return The namespace URI registered for "canonical_prefix" or the empty string if there is none.
    const std::string &getNamespaceURI(const std::string &canonical_prefix) const;

public:
    virtual ~SyndicationFormat() = default;

    virtual NormalizedFeed::Dialect getDialect() const = 0;
    inline std::string getFormatName() const { return NormalizedFeed::DialectToString(getDialect()); }

    /** \return The normalised feed on success, or nullptr after having set "parse_error". */
    virtual std::unique_ptr<NormalizedFeed> extract(ParseError * const parse_error) const = 0;

    /** \return an instance of a subclass of SyndicationFormat on success or a nullptr upon failure.
     *  \note   The returned object refers to "root" which must outlive it.
     */
    static std::unique_ptr<SyndicationFormat> Factory(const XMLTree::Element &root, ParseError * const parse_error);

    /** \brief  Converts raw document bytes to UTF-8.
     *  \param  declared_charset  The charset declared by the transport, may be empty.
     *  \return True if a usable encoding could be determined, else false and "parse_error" will be set.
     *  \note   "utf8_document" will have been stripped of leading and trailing whitespace and byte-order marks.
     */
    static bool DecodeDocument(const std::string &raw_document, const std::string &declared_charset, std::string * const utf8_document,
                               ParseError * const parse_error);

    /** \brief  Turns a raw feed document into a NormalizedFeed.
     *  \return The normalised feed on success, or nullptr after having set "parse_error".  Never throws on bad input.
     */
    static std::unique_ptr<NormalizedFeed> Normalize(const std::string &raw_document, const std::string &declared_charset,
                                                     ParseError * const parse_error);
};


class RSS20 final : public SyndicationFormat {
public:
    explicit RSS20(const XMLTree::Element &root): SyndicationFormat(root, "rss") { }

    virtual NormalizedFeed::Dialect getDialect() const override { return NormalizedFeed::RSS20; }
    virtual std::unique_ptr<NormalizedFeed> extract(ParseError * const parse_error) const override;
};


class Atom final : public SyndicationFormat {
public:
    explicit Atom(const XMLTree::Element &root): SyndicationFormat(root, "atom") { }

    virtual NormalizedFeed::Dialect getDialect() const override { return NormalizedFeed::ATOM; }
    virtual std::unique_ptr<NormalizedFeed> extract(ParseError * const parse_error) const override;

private:
    NormalizedFeed::Entry extractEntry(const XMLTree::Element &entry) const;
};
