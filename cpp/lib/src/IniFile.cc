/** \file    IniFile.cc
 *  \brief   Implementation of class IniFile.
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
#include "IniFile.h"
#include <fstream>
#include <stdexcept>
#include "StringUtil.h"
#include "util.h"


bool IniFile::Section::hasEntry(const std::string &variable_name) const {
    return findEntry(variable_name) != nullptr;
}


const IniFile::Entry *IniFile::Section::findEntry(const std::string &variable_name) const {
    for (const auto &entry : entries_) {
        if (entry.name_ == variable_name)
            return &entry;
    }

    return nullptr;
}


void IniFile::Section::insert(const std::string &variable_name, const std::string &value) {
    for (auto &entry : entries_) {
        if (entry.name_ == variable_name) {
            entry.value_ = value;
            return;
        }
    }

    entries_.emplace_back(variable_name, value);
}


std::string IniFile::Section::getString(const std::string &variable_name) const {
    const Entry * const entry(findEntry(variable_name));
    if (unlikely(entry == nullptr))
        throw std::runtime_error("in IniFile::Section::getString: can't find \"" + variable_name + "\" in section \"" + section_name_
                                 + "\"!");

    return entry->value_;
}


std::string IniFile::Section::getString(const std::string &variable_name, const std::string &default_value) const {
    const Entry * const entry(findEntry(variable_name));
    return (entry == nullptr) ? default_value : entry->value_;
}


unsigned IniFile::Section::getUnsigned(const std::string &variable_name) const {
    const std::string value(getString(variable_name));
    unsigned number;
    if (unlikely(not StringUtil::ToUnsigned(value, &number)))
        throw std::runtime_error("in IniFile::Section::getUnsigned: \"" + value + "\" is not a valid unsigned number! (section: \""
                                 + section_name_ + "\", variable: \"" + variable_name + "\")");

    return number;
}


unsigned IniFile::Section::getUnsigned(const std::string &variable_name, const unsigned default_value) const {
    return hasEntry(variable_name) ? getUnsigned(variable_name) : default_value;
}


bool IniFile::Section::getBool(const std::string &variable_name) const {
    const std::string value(StringUtil::ToLower(getString(variable_name)));
    if (value == "true" or value == "yes" or value == "on")
        return true;
    if (value == "false" or value == "no" or value == "off")
        return false;

    throw std::runtime_error("in IniFile::Section::getBool: \"" + value + "\" is not a valid boolean value! (section: \""
                             + section_name_ + "\", variable: \"" + variable_name + "\")");
}


bool IniFile::Section::getBool(const std::string &variable_name, const bool default_value) const {
    return hasEntry(variable_name) ? getBool(variable_name) : default_value;
}


IniFile::IniFile(const std::string &ini_file_name): ini_file_name_(ini_file_name) {
    std::ifstream input(ini_file_name);
    if (unlikely(not input))
        throw std::runtime_error("in IniFile::IniFile: can't open \"" + ini_file_name + "\" for reading!");

    processFile(input);
}


IniFile::IniFile(std::istream &input, const std::string &source_name): ini_file_name_(source_name) {
    processFile(input);
}


namespace {


char UnescapeChar(const char ch) {
    switch (ch) {
    case 'n':
        return '\n';
    case 't':
        return '\t';
    case 'r':
        return '\r';
    default:
        return ch;
    }
}


// Parses the right-hand side of an entry.  Handles quoting and removes trailing comments.
bool ParseValue(const std::string &raw_value, std::string * const value, std::string * const err_msg) {
    value->clear();

    const std::string trimmed_value(StringUtil::TrimWhite(raw_value));
    if (trimmed_value.empty() or trimmed_value[0] != '"') {
        bool escaped(false);
        for (const char ch : trimmed_value) {
            if (escaped) {
                *value += ch;
                escaped = false;
            } else if (ch == '\\')
                escaped = true;
            else if (ch == '#' or ch == ';')
                break;
            else
                *value += ch;
        }
        StringUtil::TrimWhite(value);
        return true;
    }

    std::string::size_type pos(1);
    for (/* Empty! */; pos < trimmed_value.length(); ++pos) {
        const char ch(trimmed_value[pos]);
        if (ch == '"')
            break;
        if (ch == '\\') {
            if (++pos == trimmed_value.length())
                break;
            *value += UnescapeChar(trimmed_value[pos]);
        } else
            *value += ch;
    }

    if (pos >= trimmed_value.length()) {
        *err_msg = "unterminated string constant";
        return false;
    }

    const std::string trailer(StringUtil::TrimWhite(trimmed_value.substr(pos + 1)));
    if (not trailer.empty() and trailer[0] != '#' and trailer[0] != ';') {
        *err_msg = "garbage after string constant";
        return false;
    }

    return true;
}


} // unnamed namespace


void IniFile::processFile(std::istream &input) {
    Section *current_section(getOrCreateSection(""));

    unsigned line_no(0);
    std::string line;
    while (std::getline(input, line)) {
        ++line_no;

        // Join continuation lines:
        while (StringUtil::EndsWith(line, "\\") and not StringUtil::EndsWith(line, "\\\\")) {
            line.resize(line.length() - 1);
            std::string continuation;
            if (not std::getline(input, continuation))
                break;
            ++line_no;
            line += continuation;
        }

        StringUtil::TrimWhite(&line);
        if (line.empty() or line[0] == '#' or line[0] == ';')
            continue;

        if (line[0] == '[') {
            const std::string::size_type closing_bracket_pos(line.find(']'));
            if (unlikely(closing_bracket_pos == std::string::npos))
                throw std::runtime_error("in IniFile::processFile: missing ']' in section header on line " + std::to_string(line_no)
                                         + " of \"" + ini_file_name_ + "\"!");
            current_section = getOrCreateSection(StringUtil::TrimWhite(line.substr(1, closing_bracket_pos - 1)));
            continue;
        }

        const std::string::size_type equal_sign_pos(line.find('='));
        if (unlikely(equal_sign_pos == std::string::npos))
            throw std::runtime_error("in IniFile::processFile: expected \"name = value\" on line " + std::to_string(line_no) + " of \""
                                     + ini_file_name_ + "\"!");

        const std::string variable_name(StringUtil::TrimWhite(line.substr(0, equal_sign_pos)));
        if (unlikely(variable_name.empty()))
            throw std::runtime_error("in IniFile::processFile: missing variable name on line " + std::to_string(line_no) + " of \""
                                     + ini_file_name_ + "\"!");

        std::string value, err_msg;
        if (unlikely(not ParseValue(line.substr(equal_sign_pos + 1), &value, &err_msg)))
            throw std::runtime_error("in IniFile::processFile: " + err_msg + " on line " + std::to_string(line_no) + " of \""
                                     + ini_file_name_ + "\"!");

        current_section->insert(variable_name, value);
    }

    LOG_DEBUG("read " + std::to_string(line_no) + " lines from \"" + ini_file_name_ + "\".");
}


IniFile::Section *IniFile::getOrCreateSection(const std::string &section_name) {
    for (auto &section : sections_) {
        if (section.section_name_ == section_name)
            return &section;
    }

    sections_.emplace_back(section_name);
    return &sections_.back();
}


const IniFile::Section *IniFile::getSection(const std::string &section_name) const {
    for (const auto &section : sections_) {
        if (section.section_name_ == section_name)
            return &section;
    }

    return nullptr;
}


std::vector<std::string> IniFile::getSections() const {
    std::vector<std::string> section_names;
    for (const auto &section : sections_)
        section_names.emplace_back(section.section_name_);

    return section_names;
}


std::string IniFile::getString(const std::string &section_name, const std::string &variable_name) const {
    const Section * const section(getSection(section_name));
    if (unlikely(section == nullptr))
        throw std::runtime_error("in IniFile::getString: no section \"" + section_name + "\" in \"" + ini_file_name_ + "\"!");

    return section->getString(variable_name);
}


std::string IniFile::getString(const std::string &section_name, const std::string &variable_name,
                               const std::string &default_value) const
{
    const Section * const section(getSection(section_name));
    return (section == nullptr) ? default_value : section->getString(variable_name, default_value);
}


unsigned IniFile::getUnsigned(const std::string &section_name, const std::string &variable_name) const {
    const Section * const section(getSection(section_name));
    if (unlikely(section == nullptr))
        throw std::runtime_error("in IniFile::getUnsigned: no section \"" + section_name + "\" in \"" + ini_file_name_ + "\"!");

    return section->getUnsigned(variable_name);
}


unsigned IniFile::getUnsigned(const std::string &section_name, const std::string &variable_name, const unsigned default_value) const {
    const Section * const section(getSection(section_name));
    return (section == nullptr) ? default_value : section->getUnsigned(variable_name, default_value);
}


bool IniFile::getBool(const std::string &section_name, const std::string &variable_name) const {
    const Section * const section(getSection(section_name));
    if (unlikely(section == nullptr))
        throw std::runtime_error("in IniFile::getBool: no section \"" + section_name + "\" in \"" + ini_file_name_ + "\"!");

    return section->getBool(variable_name);
}


bool IniFile::getBool(const std::string &section_name, const std::string &variable_name, const bool default_value) const {
    const Section * const section(getSection(section_name));
    return (section == nullptr) ? default_value : section->getBool(variable_name, default_value);
}
