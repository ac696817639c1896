/** \file   NormalizedFeed.cc
 *  \brief  Implementation of class NormalizedFeed.
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
#include "NormalizedFeed.h"
#include "util.h"


NormalizedFeed::NormalizedFeed(const Dialect dialect, const std::optional<std::string> &title,
                               const std::optional<std::string> &description, const std::optional<std::string> &link,
                               const std::vector<Entry> &entries)
    : dialect_(dialect), title_(title), description_(description), link_(link)
{
    for (const auto &entry : entries) {
        if (entry.getTitle() or entry.getLink())
            entries_.emplace_back(entry);
    }
}


bool NormalizedFeed::operator==(const NormalizedFeed &rhs) const {
    return dialect_ == rhs.dialect_ and title_ == rhs.title_ and description_ == rhs.description_ and link_ == rhs.link_
           and entries_ == rhs.entries_;
}


std::string NormalizedFeed::DialectToString(const Dialect dialect) {
    switch (dialect) {
    case ATOM:
        return "Atom";
    case RSS20:
        return "RSS 2.0";
    }

    LOG_ERROR("unknown dialect " + std::to_string(static_cast<int>(dialect)) + "!");
}
