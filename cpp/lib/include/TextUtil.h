/** \file   TextUtil.h
 *  \brief  Various utility functions related to character encodings and the processing of UTF-8 text.
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


#include <memory>
#include <string>
#include <cstdint>
#include <iconv.h>


namespace TextUtil {


/** \brief Converter between many text encodings.
 */
class EncodingConverter {
    friend class IdentityConverter;
    const std::string from_encoding_;
    const std::string to_encoding_;

protected:
    const iconv_t iconv_handle_;

public:
    static const std::string CANONICAL_UTF8_NAME;

public:
    virtual ~EncodingConverter();

    /** \brief Converts "input" to "output".
     *  \return True if the conversion succeeded, otherwise false.
     *  \note When this function returns false "*output" contains the unmodified copy of "input"!
     */
    virtual bool convert(const std::string &input, std::string * const output);

    /** \return Returns a nullptr if an error occurred and then sets *error_message to a non-empty string.
     *          O/w an EncodingConverter instance will be returned and *error_message will be cleared.
     */
    static std::unique_ptr<EncodingConverter> Factory(const std::string &from_encoding, const std::string &to_encoding,
                                                      std::string * const error_message);

private:
    explicit EncodingConverter(const std::string &from_encoding, const std::string &to_encoding, const iconv_t iconv_handle)
        : from_encoding_(from_encoding), to_encoding_(to_encoding), iconv_handle_(iconv_handle) { }
    EncodingConverter(const EncodingConverter &) = delete;
    EncodingConverter &operator=(const EncodingConverter &) = delete;
};


class IdentityConverter : public EncodingConverter {
    friend std::unique_ptr<EncodingConverter> EncodingConverter::Factory(const std::string &from_encoding, const std::string &to_encoding,
                                                                         std::string * const error_message);
    IdentityConverter(): EncodingConverter(/* from_encoding = */ "", /* to_encoding = */ "", (iconv_t)-1) { }

public:
    virtual bool convert(const std::string &input, std::string * const output) final override {
        *output = input;
        return true;
    }
};


/** \brief Lowercases "charset" and removes hyphens, underscores and spaces so that e.g. "UTF-8" and "utf8" compare equal. */
std::string CanonizeCharset(std::string charset);


bool IsValidUTF8(const std::string &utf8_candidate);


/** \brief Appends the UTF-8 encoding of "code_point" to "utf8_string".
 *  \return False if "code_point" is not a Unicode scalar value, i.e. a surrogate or larger than 0x10FFFF, else true.
 */
bool WCharToUTF8String(const uint32_t code_point, std::string * const utf8_string);


/** \brief Converts "text" from "encoding" to UTF-8.
 *  \return True if "encoding" is known to iconv(3) and all of "text" could be converted, else false.
 */
bool ConvertToUTF8(const std::string &encoding, const std::string &text, std::string * const utf8_text);


/** \brief Removes a leading UTF-8 byte-order mark.
 *  \return True if a BOM was found and removed, else false.
 */
bool StripUTF8ByteOrderMark(std::string * const s);


/** \brief Detects a UTF-16 byte-order mark at the start of "s".
 *  \return "UTF-16LE", "UTF-16BE" or the empty string if there was no UTF-16 BOM.
 */
std::string GetUTF16ByteOrderMarkEncoding(const std::string &s);


/** \brief Extracts the value of the encoding pseudo-attribute from the XML declaration of an ASCII-compatible document.
 *  \return The declared encoding or an empty string if there is no XML declaration or it declares no encoding.
 */
std::string GetXMLDeclarationEncoding(const std::string &document);


/** \brief Replaces runs of white space, incl. non-breaking spaces, with a single space and removes leading and trailing
 *         white space.
 *  \note  "utf8_string" is assumed to be valid UTF-8.
 */
std::string &CollapseAndTrimWhitespace(std::string * const utf8_string);


inline std::string CollapseAndTrimWhitespace(const std::string &utf8_string) {
    std::string temp_string(utf8_string);
    return CollapseAndTrimWhitespace(&temp_string);
}


} // namespace TextUtil
