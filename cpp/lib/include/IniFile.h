/** \file    IniFile.h
 *  \brief   Declarations for an initialisation file parsing class.
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


#include <istream>
#include <string>
#include <vector>


/** \class  IniFile
 *  \brief  Read a configuration file in our .ini format.
 *
 *  The file consists of "[section_name]" headers followed by "name = value" entries.  Entries before the first section
 *  header belong to the unnamed section "".  Everything following an unquoted '#' or ';' is a comment.  Values may be
 *  double-quoted, in which case C-style backslash escapes like \\n and \\" are recognised.  A backslash at the end of a
 *  line continues the entry on the next line.
 */
class IniFile {
public:
    struct Entry {
        std::string name_, value_;

    public:
        Entry(const std::string &name, const std::string &value): name_(name), value_(value) { }
    };

    class Section {
        friend class IniFile;
        std::string section_name_;
        std::vector<Entry> entries_;

    public:
        typedef std::vector<Entry>::const_iterator const_iterator;

    public:
        explicit Section(const std::string &section_name): section_name_(section_name) { }

        inline size_t size() const { return entries_.size(); }
        inline const_iterator begin() const { return entries_.cbegin(); }
        inline const_iterator end() const { return entries_.cend(); }

        bool hasEntry(const std::string &variable_name) const;

        /** \throws std::runtime_error if the variable is not defined in this section. */
        std::string getString(const std::string &variable_name) const;
        std::string getString(const std::string &variable_name, const std::string &default_value) const;

        /** \throws std::runtime_error if the variable is not defined or is not a valid unsigned number. */
        unsigned getUnsigned(const std::string &variable_name) const;

        /** \throws std::runtime_error if the variable is defined but is not a valid unsigned number. */
        unsigned getUnsigned(const std::string &variable_name, const unsigned default_value) const;

        /** \note   Recognised values are "true", "yes", "on" and "false", "no", "off" (case-insensitive).
         *  \throws std::runtime_error if the variable is not defined or has an unrecognised value.
         */
        bool getBool(const std::string &variable_name) const;
        bool getBool(const std::string &variable_name, const bool default_value) const;

    private:
        const Entry *findEntry(const std::string &variable_name) const;
        void insert(const std::string &variable_name, const std::string &value);
    };

    typedef std::vector<Section>::const_iterator const_iterator;

private:
    std::string ini_file_name_;
    std::vector<Section> sections_;

public:
    /** \throws std::runtime_error if the file can't be opened or contains a syntax error. */
    explicit IniFile(const std::string &ini_file_name);

    /** \param  source_name  Used in error messages only.
     *  \throws std::runtime_error if "input" contains a syntax error.
     */
    IniFile(std::istream &input, const std::string &source_name);

    inline const std::string &getFilename() const { return ini_file_name_; }

    inline const_iterator begin() const { return sections_.cbegin(); }
    inline const_iterator end() const { return sections_.cend(); }

    bool hasSection(const std::string &section_name) const { return getSection(section_name) != nullptr; }

    /** \return The section or nullptr if there is no section named "section_name". */
    const Section *getSection(const std::string &section_name) const;

    std::vector<std::string> getSections() const;

    /** \throws std::runtime_error if the section or the variable does not exist. */
    std::string getString(const std::string &section_name, const std::string &variable_name) const;

    std::string getString(const std::string &section_name, const std::string &variable_name, const std::string &default_value) const;

    unsigned getUnsigned(const std::string &section_name, const std::string &variable_name) const;

    unsigned getUnsigned(const std::string &section_name, const std::string &variable_name, const unsigned default_value) const;

    bool getBool(const std::string &section_name, const std::string &variable_name) const;

    bool getBool(const std::string &section_name, const std::string &variable_name, const bool default_value) const;

private:
    void processFile(std::istream &input);
    Section *getOrCreateSection(const std::string &section_name);
};
