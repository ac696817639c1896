/** \file   XMLTree.h
 *  \brief  A namespace-aware, read-only element tree built from XMLParser events.
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
#include <string>
#include <vector>
#include "XMLParser.h"


/** \class  XMLTree
 *  \brief  Parses a complete document into memory before any of it can be inspected.
 *  \note   Element names are resolved against the "xmlns" and "xmlns:prefix" declarations in scope.  Attribute names
 *          are kept as they appear in the document.
 */
class XMLTree final {
public:
    static const std::string XML_NAMESPACE_URI;

    class Element final {
        friend class XMLTree;

        // Exactly one of "text_" and "element_" is used.
        struct Node {
            std::string text_;
            std::unique_ptr<Element> element_;
        };

        std::string qualified_name_;
        std::string local_name_;
        std::string namespace_uri_;
        XMLParser::Attributes attributes_;
        std::vector<Node> children_;

    public:
        inline const std::string &getQualifiedName() const { return qualified_name_; }
        inline const std::string &getLocalName() const { return local_name_; }

        // \return The URI of the element's namespace, empty if the element is in no namespace.
        inline const std::string &getNamespaceURI() const { return namespace_uri_; }

        std::string getAttribute(const std::string &name, const std::string &default_value = "") const;

        // \return The concatenation of all text that is an immediate child of this element.
        std::string getText() const;

        // \return The serialised content of this element, excluding its own start and end tags.
        std::string getInnerXml() const;

        // \return The first child element with the given local name and namespace or nullptr if there is none.
        const Element *findChild(const std::string &local_name, const std::string &namespace_uri) const;

        // \return All child elements with the given local name and namespace in document order.
        std::vector<const Element *> findChildren(const std::string &local_name, const std::string &namespace_uri) const;

    private:
        Element() = default;
        void serialise(std::string * const xml) const;
    };

private:
    std::unique_ptr<Element> root_;

public:
    /** \param  utf8_document  The document which must be encoded in UTF-8.  Any encoding declaration is ignored.
     *  \throws XMLParser::Error if the document is not well-formed or uses an undeclared namespace prefix.
     */
    explicit XMLTree(const std::string &utf8_document);

    inline const Element &getRoot() const { return *root_; }
};
