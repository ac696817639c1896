/** \file   XMLParser.cc
 *  \brief  Implementation of class XMLParser.
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
#include "XMLParser.h"
#include <xercesc/util/PlatformUtils.hpp>
#include <xercesc/util/TransService.hpp>
#include <xercesc/util/XMLUni.hpp>
#include "Main.h"
#include "StringUtil.h"


// Perform process-level init/deinit related to Xerces library.
static int SetupXercesPlatform() {
    RegisterProgramPrologueHandler(/* priority = */ 0, []() -> void { xercesc::XMLPlatformUtils::Initialize(); });

    RegisterProgramEpilogueHandler(/* priority = */ 0, []() -> void { xercesc::XMLPlatformUtils::Terminate(); });

    return 0;
}


const int throwaway(SetupXercesPlatform());


const XMLParser::Options XMLParser::DEFAULT_OPTIONS{
    /* do_namespaces_ = */ false,
    /* do_schema_ = */ false,
    /* ignore_whitespace_ = */ true,
    /* load_external_dtds_ = */ false,
    /* forced_encoding_ = */ "",
};


void XMLParser::ConvertAndThrowException(const xercesc::RuntimeException &exc) {
    throw XMLParser::Error("Xerces RuntimeException: " + ToStdString(exc.getMessage()));
}


void XMLParser::ConvertAndThrowException(const xercesc::SAXParseException &exc) {
    throw XMLParser::Error("line " + std::to_string(exc.getLineNumber()) + ", col " + std::to_string(exc.getColumnNumber()) + ": "
                           + ToStdString(exc.getMessage()));
}


void XMLParser::ConvertAndThrowException(const xercesc::XMLException &exc) {
    throw XMLParser::Error("Xerces XMLException on line " + std::to_string(exc.getSrcLine()) + ": " + ToStdString(exc.getMessage()));
}


std::string XMLParser::ToStdString(const XMLCh * const xmlch) {
    if (xmlch == nullptr)
        return "";

    return ToStdString(xmlch, xercesc::XMLString::stringLen(xmlch));
}


std::string XMLParser::ToStdString(const XMLCh * const xmlch, const XMLSize_t length) {
    if (xmlch == nullptr or length == 0)
        return "";

    const xercesc::TranscodeToStr utf8(xmlch, length, "UTF-8");
    return std::string(reinterpret_cast<const char *>(utf8.str()), utf8.length());
}


void XMLParser::Handler::startElement(const XMLCh * const name, xercesc::AttributeList &attributes) {
    XMLPart xml_part;
    xml_part.type_ = XMLPart::OPENING_TAG;
    xml_part.data_ = XMLParser::ToStdString(name);
    for (XMLSize_t i(0); i < attributes.getLength(); ++i)
        xml_part.attributes_[XMLParser::ToStdString(attributes.getName(i))] = XMLParser::ToStdString(attributes.getValue(i));

    parser_->appendToBuffer(xml_part);
}


void XMLParser::Handler::endElement(const XMLCh * const name) {
    XMLPart xml_part;
    xml_part.type_ = XMLPart::CLOSING_TAG;
    xml_part.data_ = XMLParser::ToStdString(name);
    parser_->appendToBuffer(xml_part);
}


void XMLParser::Handler::characters(const XMLCh * const chars, const XMLSize_t length) {
    XMLPart xml_part;
    xml_part.type_ = XMLPart::CHARACTERS;
    xml_part.data_ = XMLParser::ToStdString(chars, length);
    parser_->appendToBuffer(xml_part);
}


void XMLParser::Handler::ignorableWhitespace(const XMLCh * const chars, const XMLSize_t length) {
    characters(chars, length);
}


xercesc::InputSource *XMLParser::Handler::resolveEntity(const XMLCh * const /*public_id*/, const XMLCh * const system_id) {
    LOG_DEBUG("not resolving external entity \"" + XMLParser::ToStdString(system_id) + "\".");

    // The parser takes ownership of the returned input source.
    static const XMLByte NO_CONTENT[] = { 0 };
    return new xercesc::MemBufInputSource(NO_CONTENT, 0, "external entity (suppressed)");
}


void XMLParser::Handler::setDocumentLocator(const xercesc::Locator * const locator) {
    parser_->locator_ = locator;
}


XMLParser::XMLParser(const std::string &xml_string, const Options &options)
    : parser_(new xercesc::SAXParser()), locator_(nullptr), xml_string_(xml_string), prolog_parsing_done_(false),
      body_has_more_contents_(false), options_(options), handler_(new XMLParser::Handler()),
      error_handler_(new XMLParser::ErrorHandler()), security_manager_(new xercesc::SecurityManager())
{
    handler_->parser_ = this;
    parser_->setDocumentHandler(handler_.get());
    parser_->setErrorHandler(error_handler_.get());

    // Guards against entity expansion attacks:
    parser_->setSecurityManager(security_manager_.get());

    // Feeds come from untrusted sources, so neither local files nor other URLs may be pulled in via entities:
    parser_->setEntityResolver(handler_.get());
    parser_->setDisableDefaultEntityResolution(true);
    parser_->setValidationScheme(xercesc::SAXParser::Val_Never);
}


XMLParser::~XMLParser() {
    // The parser may still refer to the input source and the handlers.
    parser_.reset();
}


void XMLParser::parseProlog() {
    parser_->setDoNamespaces(options_.do_namespaces_);
    parser_->setDoSchema(options_.do_schema_);
    parser_->setLoadExternalDTD(options_.load_external_dtds_);

    input_source_.reset(new xercesc::MemBufInputSource(reinterpret_cast<const XMLByte *>(xml_string_.data()), xml_string_.size(),
                                                       "xml_string (in memory)"));
    if (not options_.forced_encoding_.empty()) {
        XMLCh *encoding(xercesc::XMLString::transcode(options_.forced_encoding_.c_str()));
        input_source_->setEncoding(encoding);
        xercesc::XMLString::release(&encoding);
    }

    body_has_more_contents_ = parser_->parseFirst(*input_source_, token_);
    if (not body_has_more_contents_)
        throw XMLParser::Error("error parsing document header");

    prolog_parsing_done_ = true;
}


bool XMLParser::getNext(XMLPart * const next, const bool combine_consecutive_characters) {
    try {
        if (not prolog_parsing_done_)
            parseProlog();

        // A single parseNext() call may not produce any events, e.g. for comments or processing instructions.
        while (buffer_.empty() and body_has_more_contents_)
            body_has_more_contents_ = parser_->parseNext(token_);
    } catch (const xercesc::RuntimeException &exc) {
        ConvertAndThrowException(exc);
    } catch (const xercesc::XMLException &exc) {
        ConvertAndThrowException(exc);
    }

    if (buffer_.empty())
        return false;

    *next = buffer_.front();
    buffer_.pop_front();

    if (next->type_ == XMLPart::CHARACTERS and combine_consecutive_characters) {
        XMLPart peek;
        while (getNext(&peek, /* combine_consecutive_characters = */ false)) {
            if (peek.type_ != XMLPart::CHARACTERS) {
                buffer_.emplace_front(peek);
                break;
            }
            next->data_ += peek.data_;
        }
    }

    if (options_.ignore_whitespace_ and next->type_ == XMLPart::CHARACTERS and StringUtil::IsWhitespace(next->data_))
        return getNext(next, combine_consecutive_characters);

    return true;
}
