/** \brief Test cases for FeedBatch
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
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "FeedBatch.h"
#include "UnitTest.h"


namespace {


// Serves canned documents keyed on the URL.  The "slow" feeds finish last so that completion order differs from input order.
bool FakeFetch(const std::string &url, FeedFetcher::Response * const response, FeedFetcher::FetchError * const error) {
    if (url == "http://feeds/missing") {
        *error = FeedFetcher::FetchError::HttpStatus(404);
        return false;
    }
    if (url == "http://feeds/throws")
        throw std::runtime_error("connection reset");
    if (url == "http://feeds/silent")
        return false;
    if (url == "http://feeds/garbage") {
        response->body_ = "<html><body>Not a feed</body></html>";
        return true;
    }

    if (url.find("slow") != std::string::npos)
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    response->body_ = "<rss><channel><title>" + url + "</title><item><title>Item</title></item></channel></rss>";
    return true;
}


} // unnamed namespace


TEST(ProcessOneSuccess) {
    FeedBatch::Result result;
    FeedBatch::ProcessOne("http://feeds/a", FakeFetch, &result);

    CHECK_TRUE(result.succeeded());
    CHECK_EQ(result.url_, "http://feeds/a");
    CHECK_EQ(*result.feed_->getTitle(), "http://feeds/a");
    CHECK_EQ(result.getErrorMessage(), "");
}


TEST(ProcessOneFetchError) {
    FeedBatch::Result result;
    FeedBatch::ProcessOne("http://feeds/missing", FakeFetch, &result);

    CHECK_FALSE(result.succeeded());
    CHECK_EQ(result.fetch_error_.getKind(), FeedFetcher::FetchError::HTTP_STATUS);
    CHECK_FALSE(result.parse_error_.isError());
    CHECK_EQ(result.getErrorMessage(), "Failed to fetch feed: HTTP status 404");
}


TEST(ProcessOneExceptionBecomesTransportError) {
    FeedBatch::Result result;
    FeedBatch::ProcessOne("http://feeds/throws", FakeFetch, &result);

    CHECK_EQ(result.fetch_error_.getKind(), FeedFetcher::FetchError::TRANSPORT);
    CHECK_EQ(result.fetch_error_.getMessage(), "connection reset");
}


TEST(ProcessOneFailureWithoutReason) {
    FeedBatch::Result result;
    FeedBatch::ProcessOne("http://feeds/silent", FakeFetch, &result);

    CHECK_EQ(result.fetch_error_.getKind(), FeedFetcher::FetchError::TRANSPORT);
}


TEST(ProcessOneParseError) {
    FeedBatch::Result result;
    FeedBatch::ProcessOne("http://feeds/garbage", FakeFetch, &result);

    CHECK_FALSE(result.succeeded());
    CHECK_FALSE(result.fetch_error_.isError());
    CHECK_EQ(result.parse_error_.getKind(), ParseError::UNKNOWN_DIALECT);
    CHECK_EQ(result.getErrorMessage(), "Failed to parse feed: unknown feed dialect: root element is \"html\"");
}


TEST(ProcessKeepsInputOrder) {
    const std::vector<std::string> urls{ "http://feeds/slow1", "http://feeds/missing", "http://feeds/b",
                                         "http://feeds/slow2", "http://feeds/garbage", "http://feeds/c" };
    std::vector<FeedBatch::Result> results;
    FeedBatch::Process(urls, /* worker_count = */ 3, FakeFetch, &results);

    CHECK_EQ(results.size(), urls.size());
    for (size_t i(0); i < urls.size(); ++i)
        CHECK_EQ(results[i].url_, urls[i]);

    CHECK_TRUE(results[0].succeeded());
    CHECK_FALSE(results[1].succeeded());
    CHECK_TRUE(results[2].succeeded());
    CHECK_TRUE(results[3].succeeded());
    CHECK_FALSE(results[4].succeeded());
    CHECK_EQ(*results[5].feed_->getTitle(), "http://feeds/c");
}


TEST(ProcessFailuresDoNotAbortTheBatch) {
    const std::vector<std::string> urls{ "http://feeds/throws", "http://feeds/a" };
    std::vector<FeedBatch::Result> results;
    FeedBatch::Process(urls, /* worker_count = */ 1, FakeFetch, &results);

    CHECK_FALSE(results[0].succeeded());
    CHECK_TRUE(results[1].succeeded());
}


TEST(ProcessWithZeroWorkers) {
    std::atomic<unsigned> call_count(0);
    const FeedBatch::FetchFunction counting_fetch(
        [&call_count](const std::string &url, FeedFetcher::Response * const response, FeedFetcher::FetchError * const error) {
            ++call_count;
            return FakeFetch(url, response, error);
        });

    std::vector<FeedBatch::Result> results;
    FeedBatch::Process({ "http://feeds/a", "http://feeds/b" }, /* worker_count = */ 0, counting_fetch, &results);

    CHECK_EQ(call_count.load(), 2u);
    CHECK_TRUE(results[0].succeeded() and results[1].succeeded());
}


TEST(ProcessNothing) {
    std::vector<FeedBatch::Result> results(1);
    FeedBatch::Process({}, /* worker_count = */ 4, FakeFetch, &results);
    CHECK_TRUE(results.empty());
}


TEST_MAIN(FeedBatch)
