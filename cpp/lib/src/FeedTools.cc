/** \file    FeedTools.cc
 *  \brief   Installation-specific constants shared by the feed_tools programs.
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
#include "FeedTools.h"
#include <cstdlib>


namespace FeedTools {


std::string GetDefaultConfigPath() {
    const char * const config_path(::getenv("FEED_TOOLS_CONFIG"));
    if (config_path != nullptr and *config_path != '\0')
        return config_path;

    return "/usr/local/etc/feed_tools/feed_reader.conf";
}


} // namespace FeedTools
