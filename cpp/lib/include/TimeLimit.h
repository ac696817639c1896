/** \file    TimeLimit.h
 *  \brief   Declaration of class TimeLimit.
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


#include <sys/time.h>


/** \class  TimeLimit
 *  \brief  Represents a time limit placed upon some operation.
 *
 *  A time limit is specified (in milliseconds) when the object is created.  From that point on, limitExceeded() can be
 *  used to test whether the time limit has been reached, and getRemainingTime() to measure the time left before the
 *  limit has been reached.
 */
class TimeLimit {
    timeval expire_time_;
    unsigned limit_;

public:
    /** \brief  Construct a TimeLimit by specifying the limit.
     *  \param  time_limit  The time until expiration, in milliseconds.
     *  \note   This constructor is deliberately not explicit, so that unsigned values can be used in place of
     *          TimeLimit objects in function calls.
     */
    TimeLimit(const unsigned time_limit) { initialize(time_limit); }

    TimeLimit &operator=(const unsigned time_limit) {
        initialize(time_limit);
        return *this;
    }

    /** \return  True if the time limit has been exceeded, otherwise false. */
    bool limitExceeded() const { return getRemainingTime() == 0; }

    /** \return  The time remaining until the limit has been reached (in milliseconds) or 0 if the limit is already
     *           exceeded.
     */
    unsigned getRemainingTime() const;

    inline unsigned getLimit() const { return limit_; }

private:
    void initialize(const unsigned time_limit);
};
