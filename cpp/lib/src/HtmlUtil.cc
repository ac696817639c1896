/** \file    HtmlUtil.cc
 *  \brief   Implementation of HTML-related utility functions.
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
#include "HtmlUtil.h"
#include <unordered_map>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include "TextUtil.h"


namespace HtmlUtil {


namespace {


// The HTML 4 character entities that show up in feed descriptions in practice.
const std::unordered_map<std::string, uint32_t> entity_name_to_code_point_map{
    { "quot", 34 },    { "amp", 38 },     { "apos", 39 },    { "lt", 60 },      { "gt", 62 },      { "nbsp", 160 },
    { "iexcl", 161 },  { "cent", 162 },   { "pound", 163 },  { "curren", 164 }, { "yen", 165 },    { "brvbar", 166 },
    { "sect", 167 },   { "uml", 168 },    { "copy", 169 },   { "ordf", 170 },   { "laquo", 171 },  { "not", 172 },
    { "shy", 173 },    { "reg", 174 },    { "macr", 175 },   { "deg", 176 },    { "plusmn", 177 }, { "sup2", 178 },
    { "sup3", 179 },   { "acute", 180 },  { "micro", 181 },  { "para", 182 },   { "middot", 183 }, { "cedil", 184 },
    { "sup1", 185 },   { "ordm", 186 },   { "raquo", 187 },  { "frac14", 188 }, { "frac12", 189 }, { "frac34", 190 },
    { "iquest", 191 }, { "Agrave", 192 }, { "Aacute", 193 }, { "Acirc", 194 },  { "Atilde", 195 }, { "Auml", 196 },
    { "Aring", 197 },  { "AElig", 198 },  { "Ccedil", 199 }, { "Egrave", 200 }, { "Eacute", 201 }, { "Ecirc", 202 },
    { "Euml", 203 },   { "Igrave", 204 }, { "Iacute", 205 }, { "Icirc", 206 },  { "Iuml", 207 },   { "ETH", 208 },
    { "Ntilde", 209 }, { "Ograve", 210 }, { "Oacute", 211 }, { "Ocirc", 212 },  { "Otilde", 213 }, { "Ouml", 214 },
    { "times", 215 },  { "Oslash", 216 }, { "Ugrave", 217 }, { "Uacute", 218 }, { "Ucirc", 219 },  { "Uuml", 220 },
    { "Yacute", 221 }, { "THORN", 222 },  { "szlig", 223 },  { "agrave", 224 }, { "aacute", 225 }, { "acirc", 226 },
    { "atilde", 227 }, { "auml", 228 },   { "aring", 229 },  { "aelig", 230 },  { "ccedil", 231 }, { "egrave", 232 },
    { "eacute", 233 }, { "ecirc", 234 },  { "euml", 235 },   { "igrave", 236 }, { "iacute", 237 }, { "icirc", 238 },
    { "iuml", 239 },   { "eth", 240 },    { "ntilde", 241 }, { "ograve", 242 }, { "oacute", 243 }, { "ocirc", 244 },
    { "otilde", 245 }, { "ouml", 246 },   { "divide", 247 }, { "oslash", 248 }, { "ugrave", 249 }, { "uacute", 250 },
    { "ucirc", 251 },  { "uuml", 252 },   { "yacute", 253 }, { "thorn", 254 },  { "yuml", 255 },   { "OElig", 338 },
    { "oelig", 339 },  { "Scaron", 352 }, { "scaron", 353 }, { "Yuml", 376 },   { "fnof", 402 },   { "circ", 710 },
    { "tilde", 732 },  { "ensp", 8194 },  { "emsp", 8195 },  { "thinsp", 8201 }, { "zwnj", 8204 },  { "zwj", 8205 },
    { "lrm", 8206 },   { "rlm", 8207 },   { "ndash", 8211 }, { "mdash", 8212 }, { "lsquo", 8216 }, { "rsquo", 8217 },
    { "sbquo", 8218 }, { "ldquo", 8220 }, { "rdquo", 8221 }, { "bdquo", 8222 }, { "dagger", 8224 }, { "Dagger", 8225 },
    { "bull", 8226 },  { "hellip", 8230 }, { "permil", 8240 }, { "prime", 8242 }, { "Prime", 8243 }, { "lsaquo", 8249 },
    { "rsaquo", 8250 }, { "oline", 8254 }, { "frasl", 8260 }, { "euro", 8364 },  { "trade", 8482 }, { "larr", 8592 },
    { "uarr", 8593 },  { "rarr", 8594 },  { "darr", 8595 },  { "harr", 8596 },  { "minus", 8722 }, { "le", 8804 },
    { "ge", 8805 },    { "ne", 8800 },    { "asymp", 8776 }, { "infin", 8734 },
};


const size_t MAX_ENTITY_LENGTH(10);


} // unnamed namespace


bool DecodeEntity(const std::string &entity_string, std::string * const utf8) {
    if (entity_string.empty())
        return false;

    // numeric entity?
    if (entity_string[0] == '#') { // Yes!
        const bool is_hex(entity_string.length() > 1 and (entity_string[1] == 'x' or entity_string[1] == 'X'));
        const std::string digits(entity_string.substr(is_hex ? 2 : 1));
        if (digits.empty())
            return false;

        char *end_ptr;
        errno = 0;
        const unsigned long code(std::strtoul(digits.c_str(), &end_ptr, is_hex ? 16 : 10));
        if (errno != 0 or *end_ptr != '\0' or code == 0)
            return false;

        return TextUtil::WCharToUTF8String(static_cast<uint32_t>(code > 0x10FFFFul ? 0x110000ul : code), utf8);
    }

    const auto entity_name_and_code_point(entity_name_to_code_point_map.find(entity_string));
    if (entity_name_and_code_point == entity_name_to_code_point_map.cend())
        return false;

    return TextUtil::WCharToUTF8String(entity_name_and_code_point->second, utf8);
}


std::string &ReplaceEntities(std::string * const s, const UnknownEntityMode unknown_entity_mode) {
    std::string result;
    std::string::size_type pos(0);
    while (pos < s->length()) {
        const char ch((*s)[pos]);
        if (ch != '&') {
            result += ch;
            ++pos;
            continue;
        }

        // The start of a possible entity:
        const std::string::size_type semicolon_pos(s->find(';', pos + 1));
        if (semicolon_pos == std::string::npos or semicolon_pos - pos - 1 > MAX_ENTITY_LENGTH
            or s->find('&', pos + 1) < semicolon_pos)
        {
            result += ch;
            ++pos;
            continue;
        }

        const std::string entity(s->substr(pos + 1, semicolon_pos - pos - 1));
        if (not DecodeEntity(entity, &result) and unknown_entity_mode == IGNORE_UNKNOWN_ENTITIES)
            result += "&" + entity + ";";
        pos = semicolon_pos + 1;
    }

    return *s = result;
}


std::string StripHtmlTags(const std::string &html) {
    std::string stripped_text;
    stripped_text.reserve(html.length());

    std::string::size_type pos(0);
    while (pos < html.length()) {
        if (html[pos] == '<') {
            // A tag has at least one character and no nested '<' before its closing '>'.
            const std::string::size_type tag_end(html.find_first_of("<>", pos + 1));
            if (tag_end != std::string::npos and html[tag_end] == '>' and tag_end > pos + 1) {
                stripped_text += ' ';
                pos = tag_end + 1;
                continue;
            }
        }

        stripped_text += html[pos];
        ++pos;
    }

    return stripped_text;
}


} // namespace HtmlUtil
