/** \file   XMLParser.h
 *  \brief  A progressive, event-based wrapper around the Xerces-C SAX parser.
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


#include <deque>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <xercesc/framework/MemBufInputSource.hpp>
#include <xercesc/framework/XMLPScanToken.hpp>
#include <xercesc/parsers/SAXParser.hpp>
#include <xercesc/sax/HandlerBase.hpp>
#include <xercesc/sax/Locator.hpp>
#include <xercesc/util/SecurityManager.hpp>
#include <xercesc/util/XMLString.hpp>
#include "util.h"


class XMLParser final {
    std::unique_ptr<xercesc::SAXParser> parser_;
    xercesc::XMLPScanToken token_;
    const xercesc::Locator *locator_;
    std::string xml_string_;
    std::unique_ptr<xercesc::MemBufInputSource> input_source_;
    bool prolog_parsing_done_;
    bool body_has_more_contents_;

public:
    class Error : public std::runtime_error {
    public:
        explicit Error(const std::string &message): std::runtime_error(message) { }
    };
    typedef std::map<std::string, std::string> Attributes;

    struct Options {
        /** \brief Parser enforces all the constraints / rules specified by the NameSpace specification (default false).*/
        bool do_namespaces_;
        /** \brief Found Schema information will only be processed if set to true (default false).*/
        bool do_schema_;
        /** \brief Defines if CHARACTERS that only contain whitespaces will be skipped (default true). */
        bool ignore_whitespace_;
        /** \brief When an external DTD is referenced load it (default false). */
        bool load_external_dtds_;
        /** \brief If non-empty, the document is read in this encoding regardless of its XML declaration (default empty). */
        std::string forced_encoding_;
    };

    static const Options DEFAULT_OPTIONS;

    struct XMLPart {
        enum Type { UNINITIALISED, OPENING_TAG, CLOSING_TAG, CHARACTERS };
        Type type_ = UNINITIALISED;
        std::string data_; // The qualified tag name or, for CHARACTERS, the UTF-8 text.
        Attributes attributes_;

        inline bool isOpeningTag() const { return type_ == OPENING_TAG; }
        inline bool isClosingTag() const { return type_ == CLOSING_TAG; }
        inline bool isCharacters() const { return type_ == CHARACTERS; }
    };

private:
    Options options_;

    [[noreturn]] static void ConvertAndThrowException(const xercesc::RuntimeException &exc);
    [[noreturn]] static void ConvertAndThrowException(const xercesc::SAXParseException &exc);
    [[noreturn]] static void ConvertAndThrowException(const xercesc::XMLException &exc);

    class Handler : public xercesc::HandlerBase {
        friend class XMLParser;
        XMLParser *parser_;

    public:
        void characters(const XMLCh * const chars, const XMLSize_t length) override;
        void endElement(const XMLCh * const name) override;
        void ignorableWhitespace(const XMLCh * const chars, const XMLSize_t length) override;
        void setDocumentLocator(const xercesc::Locator * const locator) override;
        void startElement(const XMLCh * const name, xercesc::AttributeList &attributes) override;

        // External entities are never fetched.  Every reference to one expands to nothing.
        xercesc::InputSource *resolveEntity(const XMLCh * const public_id, const XMLCh * const system_id) override;
    };

    class ErrorHandler : public xercesc::ErrorHandler {
    public:
        void warning(const xercesc::SAXParseException &exc) override { LOG_DEBUG(XMLParser::ToStdString(exc.getMessage())); }
        void error(const xercesc::SAXParseException &exc) override { LOG_DEBUG(XMLParser::ToStdString(exc.getMessage())); }
        void fatalError(const xercesc::SAXParseException &exc) override { XMLParser::ConvertAndThrowException(exc); }
        void resetErrors() override { }
    };

    std::unique_ptr<Handler> handler_;
    std::unique_ptr<ErrorHandler> error_handler_;
    std::unique_ptr<xercesc::SecurityManager> security_manager_;
    std::deque<XMLPart> buffer_;
    inline void appendToBuffer(XMLPart &xml_part) { buffer_.emplace_back(xml_part); }

    void parseProlog();

    friend class Handler;

public:
    /** \brief  converts xerces' internal string type to a UTF-8 std::string. */
    static std::string ToStdString(const XMLCh * const xmlch);
    static std::string ToStdString(const XMLCh * const xmlch, const XMLSize_t length);

public:
    /** \param xml_string  The complete document.  It will be parsed progressively as getNext() is being called. */
    explicit XMLParser(const std::string &xml_string, const Options &options = DEFAULT_OPTIONS);
    ~XMLParser();

    inline unsigned getLineNo() const { return locator_ == nullptr ? 0 : static_cast<unsigned>(locator_->getLineNumber()); }

    /** \return true if "next" has been set, false if the end of the document has been reached.
     *  \note   parsing is done in progressive mode, meaning that the document is
     *          still being parsed during consecutive getNext() calls.
     *  \throws XMLParser::Error if the document is not well-formed.
     */
    bool getNext(XMLPart * const next, const bool combine_consecutive_characters = true);
};
