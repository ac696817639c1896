/** \file    FeedTools.h
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
#pragma once


#include <string>


namespace FeedTools {


// Sent as the "User-Agent" header unless overridden by the configuration.
const std::string DEFAULT_USER_AGENT("feed_tools feed_reader/1.0");


// \return The value of the FEED_TOOLS_CONFIG environment variable if set and non-empty, otherwise the compiled-in default.
std::string GetDefaultConfigPath();


} // namespace FeedTools
