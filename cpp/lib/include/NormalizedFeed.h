/** \file   NormalizedFeed.h
 *  \brief  The dialect-independent representation of a syndication feed.
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


#include <optional>
#include <string>
#include <vector>


/** \class  NormalizedFeed
 *  \brief  An immutable snapshot of a feed document.
 *  \note   Absent fields are represented as std::nullopt, never as empty strings.
 */
class NormalizedFeed final {
public:
    enum Dialect { ATOM, RSS20 };

    class Entry {
        std::optional<std::string> title_;
        std::optional<std::string> link_;
        std::optional<std::string> description_; // May contain HTML markup.
    public:
        Entry(const std::optional<std::string> &title, const std::optional<std::string> &link,
              const std::optional<std::string> &description)
            : title_(title), link_(link), description_(description) { }

        inline bool operator==(const Entry &rhs) const
            { return title_ == rhs.title_ and link_ == rhs.link_ and description_ == rhs.description_; }
        inline bool operator!=(const Entry &rhs) const { return not operator==(rhs); }

        inline const std::optional<std::string> &getTitle() const { return title_; }
        inline const std::optional<std::string> &getLink() const { return link_; }
        inline const std::optional<std::string> &getDescription() const { return description_; }
    };

    typedef std::vector<Entry>::const_iterator const_iterator;

private:
    Dialect dialect_;
    std::optional<std::string> title_;
    std::optional<std::string> description_;
    std::optional<std::string> link_;
    std::vector<Entry> entries_;

public:
    /** \note Entries that have neither a title nor a link are dropped. */
    NormalizedFeed(const Dialect dialect, const std::optional<std::string> &title, const std::optional<std::string> &description,
                   const std::optional<std::string> &link, const std::vector<Entry> &entries);

    inline Dialect getDialect() const { return dialect_; }
    inline std::string getFormatName() const { return DialectToString(dialect_); }

    inline const std::optional<std::string> &getTitle() const { return title_; }
    inline const std::optional<std::string> &getDescription() const { return description_; }
    inline const std::optional<std::string> &getLink() const { return link_; }

    inline const std::vector<Entry> &getEntries() const { return entries_; }
    inline size_t size() const { return entries_.size(); }
    inline bool empty() const { return entries_.empty(); }
    inline const_iterator begin() const { return entries_.cbegin(); }
    inline const_iterator end() const { return entries_.cend(); }

    bool operator==(const NormalizedFeed &rhs) const;
    inline bool operator!=(const NormalizedFeed &rhs) const { return not operator==(rhs); }

    // \return "Atom" or "RSS 2.0".
    static std::string DialectToString(const Dialect dialect);
};
