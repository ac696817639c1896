/** \file    HttpHeader.h
 *  \brief   Declaration of class HttpHeader.
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


#include <string>


/** \class  HttpHeader
 *  \brief  Holds and allows access to the information in a HTTP response header.
 */
class HttpHeader {
    unsigned status_code_;
    std::string status_line_;
    std::string content_type_;
    bool is_valid_;

public:
    HttpHeader(): status_code_(0), is_valid_(false) { }

    /** \param header  A single header block, i.e. a status line followed by header fields, each terminated by CRLF or LF. */
    explicit HttpHeader(const std::string &header);

    bool isValid() const { return is_valid_; }

    inline unsigned getStatusCode() const { return status_code_; }
    const std::string &getStatusLine() const { return status_line_; }
    const std::string &getContentType() const { return content_type_; }

    /** \brief   Get the media type (a.k.a. mime type) of the body from the Content-Type header.
     *  \return  The lowercased media type, or an empty string if none can be determined. */
    std::string getMediaType() const;

    /** \brief   Get the charset of the associated body from the Content-Type header.
     *  \return  The charset, or an empty string if none can be determined. */
    std::string getCharset() const { return GetCharsetFromContentType(content_type_); }

    static std::string GetCharsetFromContentType(const std::string &content_type);
};
