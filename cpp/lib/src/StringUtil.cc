/** \file   StringUtil.cc
 *  \brief  Implementation of string utility functions.
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
#include "StringUtil.h"
#include <stdexcept>
#include <vector>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include "Compiler.h"


namespace StringUtil {


const std::string WHITE_SPACE(" \t\n\v\f\r");


std::string &ASCIIToLower(std::string * const s) {
    for (auto &ch : *s) {
        if (ch >= 'A' and ch <= 'Z')
            ch = static_cast<char>(ch - 'A' + 'a');
    }

    return *s;
}


bool IsWhitespace(const std::string &s) {
    for (const char ch : s) {
        if (not IsWhitespace(ch))
            return false;
    }

    return true;
}


std::string &TrimWhite(std::string * const s) {
    const std::string::size_type first_non_white(s->find_first_not_of(WHITE_SPACE));
    if (first_non_white == std::string::npos) {
        s->clear();
        return *s;
    }

    const std::string::size_type last_non_white(s->find_last_not_of(WHITE_SPACE));
    *s = s->substr(first_non_white, last_non_white - first_non_white + 1);
    return *s;
}


bool ToUnsigned(const std::string &s, unsigned * const n) {
    std::string::const_iterator ch(s.begin());
    while (ch != s.end() and IsWhitespace(*ch))
        ++ch;
    if (unlikely(ch == s.end() or *ch < '0' or *ch > '9'))
        return false;

    char *end_ptr;
    errno = 0;
    const unsigned long ul(std::strtoul(s.c_str(), &end_ptr, 10));
    *n = static_cast<unsigned>(ul);

    return *end_ptr == '\0' and errno == 0 and ul <= UINT_MAX;
}


unsigned ToUnsigned(const std::string &s) {
    unsigned n;
    if (unlikely(not ToUnsigned(s, &n)))
        throw std::runtime_error("in StringUtil::ToUnsigned: can't convert \"" + s + "\"!");

    return n;
}


std::string &ReplaceString(const std::string &old_text, const std::string &new_text, std::string * const s, const bool global) {
    if (unlikely(old_text.empty()))
        throw std::runtime_error("in StringUtil::ReplaceString: \"old_text\" must not be empty!");

    std::string::size_type start(s->find(old_text));
    while (start != std::string::npos) {
        s->replace(start, old_text.length(), new_text);
        if (not global)
            break;
        start = s->find(old_text, start + new_text.length());
    }

    return *s;
}


namespace {


// Counts UTF-8 code points by skipping continuation bytes.
size_t CodePointCount(const std::string &s) {
    size_t count(0);
    for (const char ch : s) {
        if ((static_cast<unsigned char>(ch) & 0b11000000) != 0b10000000)
            ++count;
    }

    return count;
}


} // unnamed namespace


std::string WordWrap(const std::string &text, const unsigned target_length, const std::string &initial_indent,
                     const std::string &subsequent_indent)
{
    std::vector<std::string> words;
    std::string word;
    for (const char ch : text) {
        if (IsWhitespace(ch)) {
            if (not word.empty()) {
                words.emplace_back(word);
                word.clear();
            }
        } else
            word += ch;
    }
    if (not word.empty())
        words.emplace_back(word);

    std::string wrapped_text(initial_indent);
    size_t current_line_length(CodePointCount(initial_indent));
    bool line_has_words(false);
    for (const auto &next_word : words) {
        const size_t word_length(CodePointCount(next_word));
        if (line_has_words and current_line_length + 1 + word_length > target_length) {
            wrapped_text += '\n' + subsequent_indent;
            current_line_length = CodePointCount(subsequent_indent);
            line_has_words = false;
        }

        if (line_has_words) {
            wrapped_text += ' ';
            ++current_line_length;
        }
        wrapped_text += next_word;
        current_line_length += word_length;
        line_has_words = true;
    }

    return wrapped_text;
}


} // namespace StringUtil
