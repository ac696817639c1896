/** \file   FeedFetcher.h
 *  \brief  Retrieval of raw syndication feed documents over HTTP.
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
#include <climits>
#include <vector>
#include <curl/curl.h>
#include "FeedTools.h"


namespace FeedFetcher {


const unsigned DEFAULT_TIMEOUT(10000); // In ms.
const unsigned MAX_TIMEOUT_SECONDS(UINT_MAX / 1000);


/** \class  FetchError
 *  \brief  Describes why a feed document could not be retrieved.
 */
class FetchError {
public:
    enum Kind { NONE, TIMEOUT, HTTP_STATUS, TRANSPORT };

private:
    Kind kind_;
    long http_status_;
    std::string message_;

public:
    FetchError(): kind_(NONE), http_status_(0) { }

    inline Kind getKind() const { return kind_; }
    inline bool isError() const { return kind_ != NONE; }

    // Only meaningful for HTTP_STATUS.
    inline long getHttpStatus() const { return http_status_; }

    inline const std::string &getMessage() const { return message_; }

    // \return A human-readable description like "HTTP status 404" or "timed out".
    std::string toString() const;

    static FetchError Timeout(const std::string &message = "");
    static FetchError HttpStatus(const long http_status);
    static FetchError Transport(const std::string &message);

private:
    FetchError(const Kind kind, const long http_status, const std::string &message)
        : kind_(kind), http_status_(http_status), message_(message) { }
};


struct Params {
    std::string user_agent_;
    unsigned timeout_; // In ms, 0 means no limit.
    bool follow_redirects_;
    long max_redirects_;
    std::string proxy_; // Empty means no proxy.
    std::vector<std::string> additional_headers_;

public:
    explicit Params(const std::string &user_agent = FeedTools::DEFAULT_USER_AGENT, const unsigned timeout = DEFAULT_TIMEOUT,
                    const bool follow_redirects = true, const long max_redirects = 10, const std::string &proxy = "");
};


struct Response {
    std::string body_;    // The raw, undecoded bytes.
    std::string charset_; // As declared by the transport, may be empty.
    long status_code_;    // 0 for schemes without status codes, e.g. "file".

public:
    Response(): status_code_(0) { }
};


/** \brief  Converts a timeout given in seconds to the milliseconds expected by Params.
 *  \return False if "seconds" exceeds MAX_TIMEOUT_SECONDS, in which case "timeout" is left unchanged.
 */
bool TimeoutFromSeconds(const unsigned seconds, unsigned * const timeout);


/** \brief  Retrieves "url" with a single GET request.
 *  \return True on success, in which case "response" has been filled in, else false and "error" describes the failure.
 *  \note   No retries are attempted.
 */
bool Fetch(const std::string &url, const Params &params, Response * const response, FetchError * const error);


/** \brief  Maps the outcome of a transfer onto our error categories.
 *  \param  curl_code      The result of the transfer.
 *  \param  response_code  The final response code as reported by libcurl, 0 if there was none.
 *  \param  message        A description of the curl failure.
 *  \return An error of kind NONE if the transfer should be regarded as a success.
 */
FetchError ClassifyFailure(const CURLcode curl_code, const long response_code, const std::string &message);


} // namespace FeedFetcher
