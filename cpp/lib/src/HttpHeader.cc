/** \file    HttpHeader.cc
 *  \brief   Implementation of class HttpHeader.
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
#include <vector>
#include <cstring>
#include "StringUtil.h"


HttpHeader::HttpHeader(const std::string &header): status_code_(0), is_valid_(false) {
    // Some Web servers incorrectly use '\n' instead of '\r\n':
    std::string normalised_header(header);
    StringUtil::ReplaceString("\r\n", "\n", &normalised_header);

    std::vector<std::string> lines;
    StringUtil::Split(normalised_header, '\n', &lines, /* suppress_empty_components = */ true);
    if (lines.empty() or not StringUtil::StartsWith(lines.front(), "HTTP/"))
        return;

    // Read the status code from the first line (e.g. "HTTP/1.1 200 OK" or "HTTP/2 404"):
    const std::string::size_type first_space(lines.front().find(' '));
    if (first_space == std::string::npos)
        return;
    std::string status_code_and_reason(lines.front().substr(first_space + 1));
    const std::string::size_type second_space(status_code_and_reason.find(' '));
    if (not StringUtil::ToUnsigned(status_code_and_reason.substr(0, second_space), &status_code_))
        return;
    if (second_space != std::string::npos)
        status_line_ = StringUtil::TrimWhite(status_code_and_reason.substr(second_space + 1));
    is_valid_ = true;

    for (auto line(lines.cbegin() + 1); line != lines.cend(); ++line) {
        if (StringUtil::StartsWith(*line, "Content-Type:", /* ignore_case = */ true))
            content_type_ = StringUtil::TrimWhite(line->substr(__builtin_strlen("Content-Type:")));
    }
}


std::string HttpHeader::getMediaType() const {
    const std::string::size_type semicolon_pos(content_type_.find(';'));
    return StringUtil::ToLower(StringUtil::TrimWhite(content_type_.substr(0, semicolon_pos)));
}


std::string HttpHeader::GetCharsetFromContentType(const std::string &content_type) {
    const char *start(::strcasestr(content_type.c_str(), "charset="));
    if (start == nullptr)
        return "";

    std::string charset(start + __builtin_strlen("charset="));
    const std::string::size_type semicolon_pos(charset.find(';'));
    if (semicolon_pos != std::string::npos)
        charset.resize(semicolon_pos);
    StringUtil::TrimWhite(&charset);

    if (charset.length() >= 2 and (charset.front() == '"' or charset.front() == '\'') and charset.back() == charset.front())
        charset = charset.substr(1, charset.length() - 2);

    return charset;
}
