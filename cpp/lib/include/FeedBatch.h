/** \file   FeedBatch.h
 *  \brief  Fetching and normalising of many feeds on a pool of worker threads.
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


#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "FeedFetcher.h"
#include "NormalizedFeed.h"
#include "SyndicationFormat.h"


namespace FeedBatch {


// The outcome of processing a single URL.  Exactly one of "feed_", "fetch_error_" and "parse_error_" is set.
struct Result {
    std::string url_;
    std::unique_ptr<NormalizedFeed> feed_;
    FeedFetcher::FetchError fetch_error_;
    ParseError parse_error_;

public:
    inline bool succeeded() const { return feed_ != nullptr; }

    // \return A description like "Failed to fetch feed: HTTP status 404" or an empty string if we succeeded.
    std::string getErrorMessage() const;
};


// Must be safe to call concurrently from multiple threads.
typedef std::function<bool(const std::string &url, FeedFetcher::Response * const response, FeedFetcher::FetchError * const error)>
    FetchFunction;


// \return A FetchFunction that calls FeedFetcher::Fetch() with "params".
FetchFunction MakeFetchFunction(const FeedFetcher::Params &params);


// Fetches and normalises a single feed.
void ProcessOne(const std::string &url, const FetchFunction &fetch_function, Result * const result);


/** \brief  Processes all "urls" using up to "worker_count" threads.
 *  \param  results  Will hold one entry per URL in the order of "urls", regardless of the order of completion.
 *  \note   A "worker_count" of 0 is treated as 1.  If "fetch_function" throws a std::exception, the message is
 *          recorded as a transport error for that URL.
 */
void Process(const std::vector<std::string> &urls, const unsigned worker_count, const FetchFunction &fetch_function,
             std::vector<Result> * const results);


} // namespace FeedBatch
