/** \file    TimeLimit.cc
 *  \brief   Implementation of class TimeLimit.
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
#include "TimeLimit.h"


void TimeLimit::initialize(const unsigned time_limit) {
    limit_ = time_limit;

    ::gettimeofday(&expire_time_, nullptr);
    const timeval limit_as_timeval{ static_cast<time_t>(time_limit / 1000), static_cast<suseconds_t>((time_limit % 1000) * 1000) };
    timeradd(&expire_time_, &limit_as_timeval, &expire_time_);
}


unsigned TimeLimit::getRemainingTime() const {
    timeval now;
    ::gettimeofday(&now, nullptr);
    if (not timercmp(&now, &expire_time_, <))
        return 0;

    timeval diff_time;
    timersub(&expire_time_, &now, &diff_time);

    // Round up so that a limit that has not quite expired is never reported as 0.
    return static_cast<unsigned>(diff_time.tv_sec * 1000 + (diff_time.tv_usec + 999) / 1000);
}
