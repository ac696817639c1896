/** \file   XMLTree.cc
 *  \brief  Implementation of class XMLTree.
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
#include "XMLTree.h"
#include <map>
#include "StringUtil.h"
#include "XmlUtil.h"


const std::string XMLTree::XML_NAMESPACE_URI("http://www.w3.org/XML/1998/namespace");


std::string XMLTree::Element::getAttribute(const std::string &name, const std::string &default_value) const {
    const auto name_and_value(attributes_.find(name));
    return (name_and_value == attributes_.cend()) ? default_value : name_and_value->second;
}


std::string XMLTree::Element::getText() const {
    std::string text;
    for (const auto &child : children_) {
        if (child.element_ == nullptr)
            text += child.text_;
    }

    return text;
}


std::string XMLTree::Element::getInnerXml() const {
    std::string xml;
    for (const auto &child : children_) {
        if (child.element_ == nullptr)
            xml += XmlUtil::XmlEscape(child.text_);
        else
            child.element_->serialise(&xml);
    }

    return xml;
}


void XMLTree::Element::serialise(std::string * const xml) const {
    *xml += '<' + qualified_name_;
    for (const auto &attribute : attributes_)
        *xml += ' ' + attribute.first + "=\"" + XmlUtil::XmlEscape(attribute.second) + '"';

    if (children_.empty()) {
        *xml += "/>";
        return;
    }

    *xml += '>';
    *xml += getInnerXml();
    *xml += "</" + qualified_name_ + '>';
}


const XMLTree::Element *XMLTree::Element::findChild(const std::string &local_name, const std::string &namespace_uri) const {
    for (const auto &child : children_) {
        if (child.element_ != nullptr and child.element_->local_name_ == local_name and child.element_->namespace_uri_ == namespace_uri)
            return child.element_.get();
    }

    return nullptr;
}


std::vector<const XMLTree::Element *> XMLTree::Element::findChildren(const std::string &local_name,
                                                                     const std::string &namespace_uri) const
{
    std::vector<const Element *> matches;
    for (const auto &child : children_) {
        if (child.element_ != nullptr and child.element_->local_name_ == local_name and child.element_->namespace_uri_ == namespace_uri)
            matches.emplace_back(child.element_.get());
    }

    return matches;
}


namespace {


typedef std::map<std::string, std::string> PrefixToNamespaceMap; // The default namespace has the empty prefix.


PrefixToNamespaceMap DeclareNamespaces(const PrefixToNamespaceMap &enclosing_scope, const XMLParser::Attributes &attributes) {
    PrefixToNamespaceMap scope(enclosing_scope);
    for (const auto &attribute : attributes) {
        std::string prefix;
        if (attribute.first == "xmlns")
            prefix = "";
        else if (StringUtil::StartsWith(attribute.first, "xmlns:"))
            prefix = attribute.first.substr(__builtin_strlen("xmlns:"));
        else
            continue;

        if (attribute.second.empty())
            scope.erase(prefix);
        else
            scope[prefix] = attribute.second;
    }

    return scope;
}


} // unnamed namespace


XMLTree::XMLTree(const std::string &utf8_document) {
    XMLParser::Options options(XMLParser::DEFAULT_OPTIONS);
    options.ignore_whitespace_ = false;
    options.forced_encoding_ = "UTF-8";
    XMLParser parser(utf8_document, options);

    std::vector<Element *> open_elements;
    std::vector<PrefixToNamespaceMap> namespace_scopes;
    namespace_scopes.emplace_back(PrefixToNamespaceMap{ { "xml", XML_NAMESPACE_URI } });

    XMLParser::XMLPart xml_part;
    while (parser.getNext(&xml_part)) {
        if (xml_part.isOpeningTag()) {
            std::unique_ptr<Element> new_element(new Element());
            new_element->qualified_name_ = xml_part.data_;
            new_element->attributes_.swap(xml_part.attributes_);
            namespace_scopes.emplace_back(DeclareNamespaces(namespace_scopes.back(), new_element->attributes_));

            std::string prefix;
            const std::string::size_type colon_pos(new_element->qualified_name_.find(':'));
            if (colon_pos == std::string::npos)
                new_element->local_name_ = new_element->qualified_name_;
            else {
                prefix = new_element->qualified_name_.substr(0, colon_pos);
                new_element->local_name_ = new_element->qualified_name_.substr(colon_pos + 1);
            }

            const auto prefix_and_namespace(namespace_scopes.back().find(prefix));
            if (prefix_and_namespace != namespace_scopes.back().cend())
                new_element->namespace_uri_ = prefix_and_namespace->second;
            else if (not prefix.empty())
                throw XMLParser::Error("line " + std::to_string(parser.getLineNo()) + ": undeclared namespace prefix \"" + prefix
                                       + "\" on element \"" + new_element->qualified_name_ + "\"");

            Element * const element_ptr(new_element.get());
            if (open_elements.empty())
                root_ = std::move(new_element);
            else {
                Element::Node node;
                node.element_ = std::move(new_element);
                open_elements.back()->children_.emplace_back(std::move(node));
            }
            open_elements.emplace_back(element_ptr);
        } else if (xml_part.isClosingTag()) {
            if (unlikely(open_elements.empty()))
                throw XMLParser::Error("unexpected closing tag \"" + xml_part.data_ + "\"");
            open_elements.pop_back();
            namespace_scopes.pop_back();
        } else if (xml_part.isCharacters() and not open_elements.empty()) {
            auto &siblings(open_elements.back()->children_);
            if (not siblings.empty() and siblings.back().element_ == nullptr)
                siblings.back().text_ += xml_part.data_;
            else {
                Element::Node node;
                node.text_ = xml_part.data_;
                siblings.emplace_back(std::move(node));
            }
        }
    }

    if (unlikely(root_ == nullptr))
        throw XMLParser::Error("document has no root element");
    if (unlikely(not open_elements.empty()))
        throw XMLParser::Error("premature end of document inside \"" + open_elements.back()->qualified_name_ + "\"");
}
