/** \file   StringUtil.h
 *  \brief  String utility functions.
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
#include <cstring>
#include <strings.h>


namespace StringUtil {


/** The characters considered to be white space by the functions in this namespace. */
extern const std::string WHITE_SPACE;


/** \brief  Converts ASCII letters in "s" to lowercase in place. */
std::string &ASCIIToLower(std::string * const s);


inline std::string ToLower(const std::string &s) {
    std::string temp_s(s);
    return ASCIIToLower(&temp_s);
}


inline bool IsWhitespace(const char ch) {
    return ch == ' ' or ch == '\t' or ch == '\n' or ch == '\r' or ch == '\v' or ch == '\f';
}


/** \return True if "s" is empty or only consists of white space characters. */
bool IsWhitespace(const std::string &s);


/** \brief   Remove all occurences of white space characters from either end of a string.
 *  \param   s  The string to trim.
 *  \return  The trimmed string.
 */
std::string &TrimWhite(std::string * const s);


inline std::string TrimWhite(const std::string &s) {
    std::string temp_s(s);
    return TrimWhite(&temp_s);
}


/** \brief   Does the given string start with the suggested prefix?
 *  \param   s            The string to test.
 *  \param   prefix       The prefix to test for.
 *  \param   ignore_case  If true, the match will be case-insensitive.
 *  \return  True if the string "s" equals or starts with the prefix "prefix."
 */
inline bool StartsWith(const std::string &s, const std::string &prefix, const bool ignore_case = false) {
    return prefix.empty()
           or (s.length() >= prefix.length()
               and (ignore_case ? (::strncasecmp(s.c_str(), prefix.c_str(), prefix.length()) == 0)
                                : (std::strncmp(s.c_str(), prefix.c_str(), prefix.length()) == 0)));
}


/** \brief   Does the given string end with the suggested suffix?
 *  \param   s            The string to test.
 *  \param   suffix       The suffix to test for.
 *  \param   ignore_case  If true, the match will be case-insensitive.
 *  \return  True if the string "s" equals or ends with the suffix "suffix."
 */
inline bool EndsWith(const std::string &s, const std::string &suffix, const bool ignore_case = false) {
    return suffix.empty()
           or (s.length() >= suffix.length()
               and (ignore_case ? (::strncasecmp(s.c_str() + (s.length() - suffix.length()), suffix.c_str(), suffix.length()) == 0)
                                : (s.compare(s.length() - suffix.length(), suffix.length(), suffix) == 0)));
}


/** \brief  Split a string around a delimiter character.
 *  \param  source                     The string to split.
 *  \param  delimiter                  The character to split around.
 *  \param  container                  Where to return the resulting fields.
 *  \param  suppress_empty_components  If true we will not return empty fields.
 *  \return The number of fields in "container".
 */
template <typename InsertableContainer>
unsigned Split(const std::string &source, const char delimiter, InsertableContainer * const container,
               const bool suppress_empty_components = true)
{
    container->clear();
    if (source.empty())
        return 0;

    std::string::size_type start(0);
    for (;;) {
        const std::string::size_type next_delimiter(source.find(delimiter, start));
        const std::string field(source.substr(start, next_delimiter == std::string::npos ? std::string::npos : next_delimiter - start));
        if (not suppress_empty_components or not field.empty())
            container->insert(container->end(), field);
        if (next_delimiter == std::string::npos)
            break;
        start = next_delimiter + 1;
    }

    return static_cast<unsigned>(container->size());
}


/** \brief  Split a string around a delimiter string.
 *  \note   See the single-character version for the meaning of the parameters.
 */
template <typename InsertableContainer>
unsigned Split(const std::string &source, const std::string &delimiter_string, InsertableContainer * const container,
               const bool suppress_empty_components = true)
{
    container->clear();
    if (source.empty())
        return 0;
    if (delimiter_string.empty()) {
        container->insert(container->end(), source);
        return 1;
    }

    std::string::size_type start(0);
    for (;;) {
        const std::string::size_type next_delimiter(source.find(delimiter_string, start));
        const std::string field(source.substr(start, next_delimiter == std::string::npos ? std::string::npos : next_delimiter - start));
        if (not suppress_empty_components or not field.empty())
            container->insert(container->end(), field);
        if (next_delimiter == std::string::npos)
            break;
        start = next_delimiter + delimiter_string.length();
    }

    return static_cast<unsigned>(container->size());
}


/** \brief  Converts a decimal string to an unsigned number.
 *  \return True if "s" consisted of nothing but an optional leading white space and digits and the value fits, o/w false.
 */
bool ToUnsigned(const std::string &s, unsigned * const n);


/** \brief  Converts a decimal string to an unsigned number.
 *  \throws std::runtime_error if "s" is not a valid unsigned number.
 */
unsigned ToUnsigned(const std::string &s);


/** \brief Replaces occurrences of "old_text" with "new_text" in "s".
 *  \param global  If false, only the first occurrence will be replaced.
 */
std::string &ReplaceString(const std::string &old_text, const std::string &new_text, std::string * const s, const bool global = true);


/** \brief  Wraps "text" into lines of at most "target_length" characters.
 *  \param  initial_indent     Prepended to the first line, counts towards its length.
 *  \param  subsequent_indent  Prepended to all following lines, counts towards their lengths.
 *  \return The wrapped lines separated by newlines and without a trailing newline.
 *  \note   Consecutive white space is collapsed to a single space.  Words that are longer than the available width are
 *          placed on a line of their own and not split.  Lengths are measured in UTF-8 code points.
 */
std::string WordWrap(const std::string &text, const unsigned target_length, const std::string &initial_indent = "",
                     const std::string &subsequent_indent = "");


} // namespace StringUtil
