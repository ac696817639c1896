/** \file   XmlUtil.cc
 *  \brief  XML-related utility functions.
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
#include "XmlUtil.h"


namespace XmlUtil {


std::string XmlEscape(const std::string &unescaped_text) {
    std::string escaped_text;
    escaped_text.reserve(unescaped_text.size());

    for (const auto ch : unescaped_text) {
        if (ch == '<')
            escaped_text += "&lt;";
        else if (ch == '>')
            escaped_text += "&gt;";
        else if (ch == '&')
            escaped_text += "&amp;";
        else if (ch == '"')
            escaped_text += "&quot;";
        else if (ch == '\'')
            escaped_text += "&apos;";
        else
            escaped_text += ch;
    }

    return escaped_text;
}


} // namespace XmlUtil
