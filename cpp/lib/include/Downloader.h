/** \file   Downloader.h
 *  \brief  A libcurl-based HTTP client for fetching Web resources.
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


#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include <curl/curl.h>
#include "Compiler.h"
#include "HttpHeader.h"
#include "TimeLimit.h"
#include "util.h"


/** \class  Downloader
 *  \brief  Implements an object that can download Web documents.
 *  \note   Each instance owns its own curl easy handle and must only be used by a single thread at a time.  DNS and
 *          cookie data are shared between all instances in the process.
 */
class Downloader {
    CURL *easy_handle_;
    static CURLSH *share_handle_;
    static std::mutex share_handle_mutex_;
    static std::mutex dns_mutex_;
    static std::mutex cookie_mutex_;

public:
    static const long DEFAULT_MAX_REDIRECTS = 10;
    static const long MAX_MAX_REDIRECT_COUNT = 20;
    static const long DEFAULT_DNS_CACHE_TIMEOUT = 10; // In s
    static const std::string DEFAULT_USER_AGENT_STRING;
    static const unsigned DEFAULT_TIME_LIMIT = 20000; // In ms.
private:
    CURLcode curl_error_code_;
    long response_code_;
    mutable std::string last_error_message_;
    std::string concatenated_headers_;
    std::string body_;
    char error_buffer_[CURL_ERROR_SIZE];
    curl_slist *additional_http_headers_;

public:
    struct Params {
        std::string user_agent_;
        long max_redirect_count_; // Must always be between 0 and MAX_MAX_REDIRECT_COUNT.
        long dns_cache_timeout_;  // How long to keep cache entries around.  (In seconds.)  -1 means forever
        bool debugging_;
        bool follow_redirects_;
        bool ignore_ssl_certificates_;
        std::string proxy_host_and_port_;
        std::vector<std::string> additional_headers_;

    public:
        /** \throws std::runtime_error if "max_redirect_count" is out of range. */
        explicit Params(const std::string &user_agent = DEFAULT_USER_AGENT_STRING, const long max_redirect_count = DEFAULT_MAX_REDIRECTS,
                        const long dns_cache_timeout = DEFAULT_DNS_CACHE_TIMEOUT, const bool debugging = false,
                        const bool follow_redirects = true, const bool ignore_ssl_certificates = false,
                        const std::string &proxy_host_and_port = "", const std::vector<std::string> &additional_headers = {});
    };

public:
    /** \throws std::runtime_error if the curl handles can't be set up. */
    explicit Downloader(const Params &params = Params());
    Downloader(const Downloader &rhs) = delete;
    ~Downloader();

    Downloader &operator=(const Downloader &rhs) = delete;

    /** \brief  Issues a GET request for "url" and waits for the transfer to finish or "time_limit" to expire.
     *  \return True if the transfer succeeded, else false.  On failure getLastErrorCode() and getLastErrorMessage()
     *          describe what went wrong.
     *  \note   Any HTTP status >= 400 is treated as a failure with error code CURLE_HTTP_RETURNED_ERROR.
     */
    bool newUrl(const std::string &url, const TimeLimit &time_limit = DEFAULT_TIME_LIMIT);

    /** \return The last header block received, i.e. the one belonging to the final response after any redirects. */
    std::string getMessageHeader() const;
    HttpHeader getMessageHeaderObject() const { return HttpHeader(getMessageHeader()); }
    const std::string &getMessageBody() const { return body_; }

    /** \return The lowercased media type from the Content-Type header or an empty string if there was none. */
    std::string getMediaType() const { return getMessageHeaderObject().getMediaType(); }

    /** \return The charset from the Content-Type header or an empty string if there was none. */
    std::string getCharset() const { return getMessageHeaderObject().getCharset(); }

    CURLcode getLastErrorCode() const { return curl_error_code_; }
    const std::string &getLastErrorMessage() const;

    /** \return The response code of the final response, or 0 if none was received or the scheme, e.g. "file", has none. */
    long getResponseCode() const { return response_code_; }

    void setIgnoreSslCertificates(const bool ignore_ssl_certificates);

    /** \note Pass empty string to disable previously set proxy. */
    void setProxy(const std::string &proxy_host_and_port);

    /** \note If empty, DEFAULT_USER_AGENT_STRING will be used. */
    void setUserAgent(const std::string &user_agent);

private:
    Params params_;

    void init();
    static CURLSH *GetShareHandle();
    size_t writeFunction(void *data, size_t size, size_t nmemb);
    static size_t WriteFunction(void *data, size_t size, size_t nmemb, void *this_pointer);
    static void LockFunction(CURL *handle, curl_lock_data data, curl_lock_access access, void * /* unused */);
    static void UnlockFunction(CURL *handle, curl_lock_data data, void * /* unused */);
    size_t headerFunction(void *data, size_t size, size_t nmemb);
    static size_t HeaderFunction(void *data, size_t size, size_t nmemb, void *this_pointer);
    void debugFunction(CURL *handle, curl_infotype infotype, char *data, size_t size);
    static int DebugFunction(CURL *handle, curl_infotype infotype, char *data, size_t size, void *this_pointer);
    template <typename OptionType>
    void curlEasySetopt(const CURLoption option, OptionType value, const std::string &caller_info) {
        if ((curl_error_code_ = ::curl_easy_setopt(easy_handle_, option, value)) != CURLE_OK)
            LOG_ERROR("curl_easy_setopt(" + caller_info + ") failed!");
    }
};
