/** \file   TextUtil.cc
 *  \brief  Implementation of the character encoding and UTF-8 helpers.
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
#include "TextUtil.h"
#include <cerrno>
#include "Compiler.h"
#include "StringUtil.h"
#include "util.h"


namespace TextUtil {


const std::string EncodingConverter::CANONICAL_UTF8_NAME("utf8");


std::unique_ptr<EncodingConverter> EncodingConverter::Factory(const std::string &from_encoding, const std::string &to_encoding,
                                                              std::string * const error_message)
{
    if (CanonizeCharset(from_encoding) == CanonizeCharset(to_encoding)) {
        error_message->clear();
        return std::unique_ptr<EncodingConverter>(new IdentityConverter());
    }

    const iconv_t iconv_handle(::iconv_open(to_encoding.c_str(), from_encoding.c_str()));
    if (unlikely(iconv_handle == (iconv_t)-1)) {
        *error_message = "can't create an encoding converter for conversion from \"" + from_encoding + "\" to \"" + to_encoding
                         + "\"!";
        return std::unique_ptr<EncodingConverter>(nullptr);
    }

    error_message->clear();
    return std::unique_ptr<EncodingConverter>(new EncodingConverter(from_encoding, to_encoding, iconv_handle));
}


bool EncodingConverter::convert(const std::string &input, std::string * const output) {
    std::string in_bytes(input);
    static const size_t UTF8_SEQUENCE_MAXLEN(6);
    std::string out_bytes(UTF8_SEQUENCE_MAXLEN * input.length() + UTF8_SEQUENCE_MAXLEN, '\0');

    char *in_ptr(&in_bytes[0]), *out_ptr(&out_bytes[0]);
    size_t inbytes_left(in_bytes.length()), outbytes_left(out_bytes.length());

    // Reset the conversion state left behind by a previous call.
    ::iconv(iconv_handle_, nullptr, nullptr, nullptr, nullptr);

    if (unlikely(::iconv(iconv_handle_, &in_ptr, &inbytes_left, &out_ptr, &outbytes_left) == static_cast<size_t>(-1))) {
        LOG_DEBUG("iconv(3) failed! (Trying to convert \"" + from_encoding_ + "\" to \"" + to_encoding_ + "\", errno was "
                  + std::to_string(errno) + ")");
        *output = input;
        return false;
    }

    // Flush any pending shift sequence.
    if (unlikely(::iconv(iconv_handle_, nullptr, nullptr, &out_ptr, &outbytes_left) == static_cast<size_t>(-1))) {
        *output = input;
        return false;
    }

    output->assign(out_bytes.data(), out_bytes.length() - outbytes_left);
    return true;
}


EncodingConverter::~EncodingConverter() {
    if (iconv_handle_ != (iconv_t)-1 and unlikely(::iconv_close(iconv_handle_) == -1))
        LOG_ERROR("iconv_close(3) failed!");
}


std::string CanonizeCharset(std::string charset) {
    StringUtil::ASCIIToLower(&charset);

    std::string canonized_charset;
    for (const char ch : charset) {
        if (ch != '-' and ch != '_' and ch != ' ')
            canonized_charset += ch;
    }

    return canonized_charset;
}


bool IsValidUTF8(const std::string &utf8_candidate) {
    for (std::string::const_iterator ch(utf8_candidate.begin()); ch != utf8_candidate.end(); ++ch) {
        const unsigned char uch(static_cast<unsigned char>(*ch));
        unsigned sequence_length;
        if ((uch & 0b10000000) == 0b00000000)
            sequence_length = 0;
        else if ((uch & 0b11100000) == 0b11000000)
            sequence_length = 1;
        else if ((uch & 0b11110000) == 0b11100000)
            sequence_length = 2;
        else if ((uch & 0b11111000) == 0b11110000)
            sequence_length = 3;
        else
            return false;

        // Overlong two-byte sequences.
        if (unlikely(uch == 0xC0 or uch == 0xC1))
            return false;

        for (unsigned i(0); i < sequence_length; ++i) {
            ++ch;
            if (unlikely(ch == utf8_candidate.end()))
                return false;
            if (unlikely((static_cast<unsigned char>(*ch) & 0b11000000) != 0b10000000))
                return false;
        }
    }

    return true;
}


bool WCharToUTF8String(const uint32_t code_point, std::string * const utf8_string) {
    if (unlikely(code_point > 0x10FFFFu or (code_point >= 0xD800u and code_point <= 0xDFFFu)))
        return false;

    if (code_point < 0x80u)
        *utf8_string += static_cast<char>(code_point);
    else if (code_point < 0x800u) {
        *utf8_string += static_cast<char>(0b11000000 | (code_point >> 6));
        *utf8_string += static_cast<char>(0b10000000 | (code_point & 0b111111));
    } else if (code_point < 0x10000u) {
        *utf8_string += static_cast<char>(0b11100000 | (code_point >> 12));
        *utf8_string += static_cast<char>(0b10000000 | ((code_point >> 6) & 0b111111));
        *utf8_string += static_cast<char>(0b10000000 | (code_point & 0b111111));
    } else {
        *utf8_string += static_cast<char>(0b11110000 | (code_point >> 18));
        *utf8_string += static_cast<char>(0b10000000 | ((code_point >> 12) & 0b111111));
        *utf8_string += static_cast<char>(0b10000000 | ((code_point >> 6) & 0b111111));
        *utf8_string += static_cast<char>(0b10000000 | (code_point & 0b111111));
    }

    return true;
}


bool ConvertToUTF8(const std::string &encoding, const std::string &text, std::string * const utf8_text) {
    utf8_text->clear();

    std::string error_message;
    const auto to_utf8_converter(EncodingConverter::Factory(encoding, "UTF-8", &error_message));
    if (to_utf8_converter == nullptr) {
        LOG_DEBUG(error_message);
        return false;
    }

    return to_utf8_converter->convert(text, utf8_text);
}


bool StripUTF8ByteOrderMark(std::string * const s) {
    if (not StringUtil::StartsWith(*s, "\xEF\xBB\xBF"))
        return false;

    s->erase(0, 3);
    return true;
}


std::string GetUTF16ByteOrderMarkEncoding(const std::string &s) {
    if (s.length() < 2)
        return "";

    const unsigned char first(static_cast<unsigned char>(s[0])), second(static_cast<unsigned char>(s[1]));
    if (first == 0xFF and second == 0xFE)
        return "UTF-16LE";
    if (first == 0xFE and second == 0xFF)
        return "UTF-16BE";
    return "";
}


std::string GetXMLDeclarationEncoding(const std::string &document) {
    if (not StringUtil::StartsWith(document, "<?xml"))
        return "";

    const std::string::size_type declaration_end(document.find("?>"));
    if (declaration_end == std::string::npos)
        return "";
    const std::string declaration(document.substr(0, declaration_end));

    std::string::size_type encoding_pos(declaration.find("encoding"));
    if (encoding_pos == std::string::npos)
        return "";
    encoding_pos += __builtin_strlen("encoding");

    while (encoding_pos < declaration.length() and StringUtil::IsWhitespace(declaration[encoding_pos]))
        ++encoding_pos;
    if (encoding_pos == declaration.length() or declaration[encoding_pos] != '=')
        return "";
    ++encoding_pos;
    while (encoding_pos < declaration.length() and StringUtil::IsWhitespace(declaration[encoding_pos]))
        ++encoding_pos;
    if (encoding_pos == declaration.length() or (declaration[encoding_pos] != '"' and declaration[encoding_pos] != '\''))
        return "";

    const char quote(declaration[encoding_pos]);
    const std::string::size_type closing_quote_pos(declaration.find(quote, encoding_pos + 1));
    if (closing_quote_pos == std::string::npos)
        return "";

    return StringUtil::TrimWhite(declaration.substr(encoding_pos + 1, closing_quote_pos - encoding_pos - 1));
}


std::string &CollapseAndTrimWhitespace(std::string * const utf8_string) {
    static const std::string NO_BREAK_SPACE("\xC2\xA0");

    std::string collapsed_string;
    bool last_char_was_whitespace(true); // Suppresses leading white space.
    for (std::string::size_type i(0); i < utf8_string->length(); ++i) {
        bool is_whitespace(StringUtil::IsWhitespace((*utf8_string)[i]));
        if (not is_whitespace and utf8_string->compare(i, NO_BREAK_SPACE.length(), NO_BREAK_SPACE) == 0) {
            is_whitespace = true;
            ++i;
        }

        if (is_whitespace) {
            if (not last_char_was_whitespace)
                collapsed_string += ' ';
            last_char_was_whitespace = true;
        } else {
            collapsed_string += (*utf8_string)[i];
            last_char_was_whitespace = false;
        }
    }

    if (not collapsed_string.empty() and collapsed_string.back() == ' ')
        collapsed_string.resize(collapsed_string.size() - 1);

    utf8_string->swap(collapsed_string);
    return *utf8_string;
}


} // namespace TextUtil
