/** \file   FeedBatch.cc
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
#include "FeedBatch.h"
#include <algorithm>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <thread>
#include "util.h"


namespace FeedBatch {


std::string Result::getErrorMessage() const {
    if (fetch_error_.isError())
        return "Failed to fetch feed: " + fetch_error_.toString();
    if (parse_error_.isError())
        return "Failed to parse feed: " + parse_error_.toString();
    return "";
}


FetchFunction MakeFetchFunction(const FeedFetcher::Params &params) {
    return [params](const std::string &url, FeedFetcher::Response * const response, FeedFetcher::FetchError * const error) -> bool {
        return FeedFetcher::Fetch(url, params, response, error);
    };
}


void ProcessOne(const std::string &url, const FetchFunction &fetch_function, Result * const result) {
    result->url_ = url;
    result->feed_.reset();
    result->fetch_error_ = FeedFetcher::FetchError();
    result->parse_error_ = ParseError();

    FeedFetcher::Response response;
    bool fetched;
    try {
        fetched = fetch_function(url, &response, &result->fetch_error_);
    } catch (const std::exception &x) {
        result->fetch_error_ = FeedFetcher::FetchError::Transport(x.what());
        fetched = false;
    }

    if (not fetched) {
        if (not result->fetch_error_.isError())
            result->fetch_error_ = FeedFetcher::FetchError::Transport("fetch failed without a reason");
        LOG_DEBUG("\"" + url + "\": " + result->getErrorMessage());
        return;
    }

    result->feed_ = SyndicationFormat::Normalize(response.body_, response.charset_, &result->parse_error_);
    if (result->feed_ == nullptr)
        LOG_DEBUG("\"" + url + "\": " + result->getErrorMessage());
    else
        LOG_DEBUG("\"" + url + "\": " + std::to_string(result->feed_->size()) + " entries.");
}


namespace {


void WorkerThread(const std::vector<std::string> * const urls, const FetchFunction * const fetch_function,
                  std::deque<size_t> * const task_queue, std::mutex * const task_queue_mutex, std::vector<Result> * const results)
{
    for (;;) {
        size_t url_index;
        {
            std::lock_guard<std::mutex> task_queue_mutex_locker(*task_queue_mutex);
            if (task_queue->empty())
                return;
            url_index = task_queue->front();
            task_queue->pop_front();
        }

        // Each worker writes to a different slot, so no locking is needed here.
        ProcessOne((*urls)[url_index], *fetch_function, &(*results)[url_index]);
    }
}


} // unnamed namespace


void Process(const std::vector<std::string> &urls, const unsigned worker_count, const FetchFunction &fetch_function,
             std::vector<Result> * const results)
{
    results->clear();
    results->resize(urls.size());
    if (urls.empty())
        return;

    std::deque<size_t> task_queue;
    for (size_t url_index(0); url_index < urls.size(); ++url_index)
        task_queue.emplace_back(url_index);
    std::mutex task_queue_mutex;

    const size_t thread_count(std::min(static_cast<size_t>(std::max(worker_count, 1u)), urls.size()));
    LOG_DEBUG("processing " + std::to_string(urls.size()) + " feed(s) with " + std::to_string(thread_count) + " worker thread(s).");

    std::vector<std::thread> thread_pool(thread_count);
    for (auto &thread : thread_pool)
        thread = std::thread(WorkerThread, &urls, &fetch_function, &task_queue, &task_queue_mutex, results);

    for (auto &thread : thread_pool)
        thread.join();
}


} // namespace FeedBatch
