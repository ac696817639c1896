/** \file   FeedFetcher.cc
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
#include "FeedFetcher.h"
#include "Downloader.h"
#include "TimeLimit.h"
#include "util.h"


namespace FeedFetcher {


std::string FetchError::toString() const {
    switch (kind_) {
    case NONE:
        return "no error";
    case TIMEOUT:
        return message_.empty() ? "timed out" : "timed out (" + message_ + ")";
    case HTTP_STATUS:
        return "HTTP status " + std::to_string(http_status_);
    case TRANSPORT:
        return "transport error: " + message_;
    }

    return "unknown error";
}


FetchError FetchError::Timeout(const std::string &message) {
    return FetchError(TIMEOUT, 0, message);
}


FetchError FetchError::HttpStatus(const long http_status) {
    return FetchError(HTTP_STATUS, http_status, "HTTP status " + std::to_string(http_status));
}


FetchError FetchError::Transport(const std::string &message) {
    return FetchError(TRANSPORT, 0, message);
}


Params::Params(const std::string &user_agent, const unsigned timeout, const bool follow_redirects, const long max_redirects,
               const std::string &proxy)
    : user_agent_(user_agent), timeout_(timeout), follow_redirects_(follow_redirects), max_redirects_(max_redirects), proxy_(proxy),
      additional_headers_{ "Accept: application/rss+xml, application/atom+xml, application/xml;q=0.9, text/xml;q=0.9, */*;q=0.8" }
{
}


bool TimeoutFromSeconds(const unsigned seconds, unsigned * const timeout) {
    if (seconds > MAX_TIMEOUT_SECONDS)
        return false;

    *timeout = seconds * 1000;
    return true;
}


FetchError ClassifyFailure(const CURLcode curl_code, const long response_code, const std::string &message) {
    if (curl_code == CURLE_OPERATION_TIMEDOUT)
        return FetchError::Timeout(message);

    // Status codes >= 400 arrive as CURLE_HTTP_RETURNED_ERROR, unfollowed redirects as CURLE_OK:
    if ((curl_code == CURLE_OK or curl_code == CURLE_HTTP_RETURNED_ERROR) and response_code != 0
        and (response_code < 200 or response_code > 299))
        return FetchError::HttpStatus(response_code);

    if (curl_code == CURLE_OK)
        return FetchError();

    return FetchError::Transport(message.empty() ? ::curl_easy_strerror(curl_code) : message);
}


bool Fetch(const std::string &url, const Params &params, Response * const response, FetchError * const error) {
    *response = Response();
    *error = FetchError();

    const TimeLimit time_limit(params.timeout_);
    Downloader::Params downloader_params(params.user_agent_, params.max_redirects_, Downloader::DEFAULT_DNS_CACHE_TIMEOUT,
                                         /* debugging = */ logger->getMinimumLogLevel() >= Logger::LL_DEBUG, params.follow_redirects_,
                                         /* ignore_ssl_certificates = */ false, params.proxy_, params.additional_headers_);
    Downloader downloader(downloader_params);
    const bool succeeded(downloader.newUrl(url, time_limit));

    if (not succeeded and params.timeout_ != 0 and time_limit.limitExceeded())
        *error = FetchError::Timeout(downloader.getLastErrorMessage());
    else
        *error = ClassifyFailure(downloader.getLastErrorCode(), downloader.getResponseCode(), downloader.getLastErrorMessage());

    if (error->isError()) {
        LOG_DEBUG("fetching \"" + url + "\" failed: " + error->toString());
        return false;
    }

    response->body_ = downloader.getMessageBody();
    response->charset_ = downloader.getCharset();
    response->status_code_ = downloader.getResponseCode();
    LOG_DEBUG("fetched " + std::to_string(response->body_.size()) + " bytes from \"" + url + "\" (media type: \""
              + downloader.getMediaType() + "\").");

    return true;
}


} // namespace FeedFetcher
