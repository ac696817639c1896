/** \file    HtmlUtil.h
 *  \brief   HTML-related utility functions used when rendering feed text for humans.
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


namespace HtmlUtil {


/** \brief Decodes a named or numeric entity, without the leading ampersand and the trailing semicolon, to UTF-8.
 *  \param entity_string  E.g. "amp", "#233" or "#xE9".
 *  \param utf8           The decoded character gets appended here.
 *  \return True if "entity_string" was recognised, else false.
 */
bool DecodeEntity(const std::string &entity_string, std::string * const utf8);


enum UnknownEntityMode { IGNORE_UNKNOWN_ENTITIES, REMOVE_UNKNOWN_ENTITIES };


/** \brief Replaces all HTML entities in "s" with their UTF-8 equivalents.
 *  \note  Unterminated entities, i.e. ampersands not followed by a name and a semicolon, are copied unchanged.
 */
std::string &ReplaceEntities(std::string * const s, const UnknownEntityMode unknown_entity_mode = IGNORE_UNKNOWN_ENTITIES);


inline std::string ReplaceEntities(const std::string &s, const UnknownEntityMode unknown_entity_mode = IGNORE_UNKNOWN_ENTITIES) {
    std::string temp_s(s);
    ReplaceEntities(&temp_s, unknown_entity_mode);
    return temp_s;
}


/** \brief Replaces every tag, i.e. a "<" followed by at least one character other than "<" and a closing ">", with a single space.
 *  \note  A "<" that does not start such a tag is kept.
 */
std::string StripHtmlTags(const std::string &html);


} // namespace HtmlUtil
