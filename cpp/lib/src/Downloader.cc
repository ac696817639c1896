/** \file    Downloader.cc
 *  \brief   Implementation of class Downloader.
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
#include "Downloader.h"
#include <cstring>
#include <unistd.h>
#include "StringUtil.h"


namespace {


int GlobalInit() {
    if (unlikely(::curl_global_init(CURL_GLOBAL_ALL) != 0)) {
        const std::string error_message("curl_global_init(3) failed!\n");
        const ssize_t dummy = ::write(STDERR_FILENO, error_message.c_str(), error_message.length());
        (void)dummy;
        ::_exit(EXIT_FAILURE);
    }

    return 0;
}


int dummy(GlobalInit());


// Splits the headers of all responses received during a transfer, e.g. because of redirects, into separate blocks.
void SplitHttpHeaders(std::string possible_combo_headers, std::vector<std::string> * const individual_headers) {
    individual_headers->clear();
    if (possible_combo_headers.empty())
        return;

    // Sometimes we get HTTP headers that end in LF/LF sequences:
    StringUtil::ReplaceString("\r\n", "\n", &possible_combo_headers);
    StringUtil::ReplaceString("\n", "\r\n", &possible_combo_headers);

    StringUtil::Split(possible_combo_headers, std::string("\r\n\r\n"), individual_headers, /* suppress_empty_components = */ true);
    for (auto &individual_header : *individual_headers)
        individual_header += "\r\n\r\n";
}


} // unnamed namespace


CURLSH *Downloader::share_handle_(nullptr);
std::mutex Downloader::share_handle_mutex_;
std::mutex Downloader::cookie_mutex_;
std::mutex Downloader::dns_mutex_;
const std::string Downloader::DEFAULT_USER_AGENT_STRING("feed_tools Downloader");


Downloader::Params::Params(const std::string &user_agent, const long max_redirect_count, const long dns_cache_timeout,
                           const bool debugging, const bool follow_redirects, const bool ignore_ssl_certificates,
                           const std::string &proxy_host_and_port, const std::vector<std::string> &additional_headers)
    : user_agent_(user_agent), max_redirect_count_(max_redirect_count), dns_cache_timeout_(dns_cache_timeout), debugging_(debugging),
      follow_redirects_(follow_redirects), ignore_ssl_certificates_(ignore_ssl_certificates), proxy_host_and_port_(proxy_host_and_port),
      additional_headers_(additional_headers)
{
    if (unlikely(max_redirect_count_ < 0 or max_redirect_count_ > MAX_MAX_REDIRECT_COUNT))
        throw std::runtime_error("in Downloader::Params::Params: max_redirect_count (= " + std::to_string(max_redirect_count)
                                 + ") must be between 0 and " + std::to_string(MAX_MAX_REDIRECT_COUNT) + "!");

    max_redirect_count_ = follow_redirects_ ? max_redirect_count_ : 0;
}


Downloader::Downloader(const Params &params)
    : easy_handle_(nullptr), curl_error_code_(CURLE_OK), response_code_(0), additional_http_headers_(nullptr), params_(params)
{
    error_buffer_[0] = '\0';
    init();
}


Downloader::~Downloader() {
    if (additional_http_headers_ != nullptr)
        ::curl_slist_free_all(additional_http_headers_);
    if (likely(easy_handle_ != nullptr))
        ::curl_easy_cleanup(easy_handle_);
}


bool Downloader::newUrl(const std::string &url, const TimeLimit &time_limit) {
    last_error_message_.clear();
    concatenated_headers_.clear();
    body_.clear();
    error_buffer_[0] = '\0';
    response_code_ = 0;
    curl_error_code_ = CURLE_OK;

    const long timeout_in_ms(time_limit.getRemainingTime());
    if (timeout_in_ms == 0 and time_limit.getLimit() != 0) {
        curl_error_code_ = CURLE_OPERATION_TIMEDOUT;
        last_error_message_ = "timeout exceeded";
        return false;
    }

    curlEasySetopt(CURLOPT_URL, url.c_str(), "Downloader::newUrl:CURLOPT_URL");
    curlEasySetopt(CURLOPT_TIMEOUT_MS, timeout_in_ms, "Downloader::newUrl:CURLOPT_TIMEOUT_MS");
    curlEasySetopt(CURLOPT_MAXREDIRS, params_.max_redirect_count_, "Downloader::newUrl:CURLOPT_MAXREDIRS");
    if (additional_http_headers_ != nullptr)
        curlEasySetopt(CURLOPT_HTTPHEADER, additional_http_headers_, "Downloader::newUrl:CURLOPT_HTTPHEADER");

    LOG_DEBUG("downloading \"" + url + "\" with a time limit of " + std::to_string(timeout_in_ms) + " ms.");
    curl_error_code_ = ::curl_easy_perform(easy_handle_);

    // Also available after CURLE_HTTP_RETURNED_ERROR, which is what we get for status codes >= 400:
    if (::curl_easy_getinfo(easy_handle_, CURLINFO_RESPONSE_CODE, &response_code_) != CURLE_OK)
        response_code_ = 0;

    return curl_error_code_ == CURLE_OK;
}


std::string Downloader::getMessageHeader() const {
    if (concatenated_headers_.empty())
        return "";

    std::vector<std::string> headers;
    SplitHttpHeaders(concatenated_headers_, &headers);
    return headers.empty() ? "" : headers.back();
}


const std::string &Downloader::getLastErrorMessage() const {
    if (curl_error_code_ != CURLE_OK and last_error_message_.empty()) {
        if (error_buffer_[0] != '\0')
            last_error_message_ = error_buffer_;
        else
            last_error_message_ = ::curl_easy_strerror(curl_error_code_);
    }

    return last_error_message_;
}


CURLSH *Downloader::GetShareHandle() {
    std::lock_guard<std::mutex> share_handle_locker(share_handle_mutex_);
    if (share_handle_ != nullptr)
        return share_handle_;

    share_handle_ = ::curl_share_init();
    if (unlikely(share_handle_ == nullptr))
        throw std::runtime_error("in Downloader::GetShareHandle: curl_share_init() failed!");
    if (unlikely(::curl_share_setopt(share_handle_, CURLSHOPT_LOCKFUNC, LockFunction) != 0))
        throw std::runtime_error("in Downloader::GetShareHandle: curl_share_setopt() failed (1)!");
    if (unlikely(::curl_share_setopt(share_handle_, CURLSHOPT_UNLOCKFUNC, UnlockFunction) != 0))
        throw std::runtime_error("in Downloader::GetShareHandle: curl_share_setopt() failed (2)!");
    if (unlikely(::curl_share_setopt(share_handle_, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS) != 0))
        throw std::runtime_error("in Downloader::GetShareHandle: curl_share_setopt() failed (3)!");
    if (unlikely(::curl_share_setopt(share_handle_, CURLSHOPT_SHARE, CURL_LOCK_DATA_COOKIE) != 0))
        throw std::runtime_error("in Downloader::GetShareHandle: curl_share_setopt() failed (4)!");

    return share_handle_;
}


void Downloader::init() {
    easy_handle_ = ::curl_easy_init();
    if (unlikely(easy_handle_ == nullptr))
        throw std::runtime_error("in Downloader::init: curl_easy_init() failed!");

    curlEasySetopt(CURLOPT_SHARE, GetShareHandle(), "Downloader::init:CURLOPT_SHARE");

    if (params_.debugging_) {
        curlEasySetopt(CURLOPT_VERBOSE, 1L, "Downloader::init:CURLOPT_VERBOSE");
        curlEasySetopt(CURLOPT_DEBUGFUNCTION, DebugFunction, "Downloader::init:CURLOPT_DEBUGFUNCTION");
        curlEasySetopt(CURLOPT_DEBUGDATA, reinterpret_cast<void *>(this), "Downloader::init:CURLOPT_DEBUGDATA");
    }

    curlEasySetopt(CURLOPT_HEADER, 0L, "Downloader::init:CURLOPT_HEADER");
    curlEasySetopt(CURLOPT_NOPROGRESS, 1L, "Downloader::init:CURLOPT_NOPROGRESS");
    curlEasySetopt(CURLOPT_NOSIGNAL, 1L, "Downloader::init:CURLOPT_NOSIGNAL");
    curlEasySetopt(CURLOPT_WRITEFUNCTION, WriteFunction, "Downloader::init:CURLOPT_WRITEFUNCTION");
    curlEasySetopt(CURLOPT_FAILONERROR, 1L, "Downloader::init:CURLOPT_FAILONERROR");

    // An empty string enables all encodings libcurl was built with and makes it decompress transparently:
    curlEasySetopt(CURLOPT_ACCEPT_ENCODING, "", "Downloader::init:CURLOPT_ACCEPT_ENCODING");

    const long should_follow(params_.follow_redirects_ ? 1L : 0L);
    curlEasySetopt(CURLOPT_FOLLOWLOCATION, should_follow, "Downloader::init:CURLOPT_FOLLOWLOCATION");
    curlEasySetopt(CURLOPT_DNS_CACHE_TIMEOUT, params_.dns_cache_timeout_, "Downloader::init:CURLOPT_DNS_CACHE_TIMEOUT");
    curlEasySetopt(CURLOPT_HEADERFUNCTION, HeaderFunction, "Downloader::init:CURLOPT_HEADERFUNCTION");

    setUserAgent(params_.user_agent_);

    curlEasySetopt(CURLOPT_ERRORBUFFER, error_buffer_, "Downloader::init:CURLOPT_ERRORBUFFER");
    curlEasySetopt(CURLOPT_AUTOREFERER, 1L, "Downloader::init:CURLOPT_AUTOREFERER");

    for (const auto &additional_header : params_.additional_headers_) {
        curl_slist * const new_list(::curl_slist_append(additional_http_headers_, additional_header.c_str()));
        if (unlikely(new_list == nullptr))
            throw std::runtime_error("in Downloader::init: curl_slist_append() failed!");
        additional_http_headers_ = new_list;
    }

    curlEasySetopt(CURLOPT_WRITEDATA, reinterpret_cast<void *>(this), "Downloader::init:CURLOPT_WRITEDATA");
    curlEasySetopt(CURLOPT_WRITEHEADER, reinterpret_cast<void *>(this), "Downloader::init:CURLOPT_WRITEHEADER");

    if (params_.ignore_ssl_certificates_)
        setIgnoreSslCertificates(params_.ignore_ssl_certificates_);

    if (not params_.proxy_host_and_port_.empty())
        setProxy(params_.proxy_host_and_port_);
}


size_t Downloader::writeFunction(void *data, size_t size, size_t nmemb) {
    const size_t total_size(size * nmemb);
    body_.append(reinterpret_cast<char *>(data), total_size);
    return total_size;
}


size_t Downloader::WriteFunction(void *data, size_t size, size_t nmemb, void *this_pointer) {
    Downloader * const downloader(reinterpret_cast<Downloader *>(this_pointer));
    return downloader->writeFunction(data, size, nmemb);
}


void Downloader::LockFunction(CURL * /* handle */, curl_lock_data data, curl_lock_access /* access */, void * /* unused */) {
    if (data == CURL_LOCK_DATA_DNS)
        Downloader::dns_mutex_.lock();
    else if (data == CURL_LOCK_DATA_COOKIE)
        Downloader::cookie_mutex_.lock();
}


void Downloader::UnlockFunction(CURL * /* handle */, curl_lock_data data, void * /* unused */) {
    if (data == CURL_LOCK_DATA_DNS)
        Downloader::dns_mutex_.unlock();
    else if (data == CURL_LOCK_DATA_COOKIE)
        Downloader::cookie_mutex_.unlock();
}


size_t Downloader::headerFunction(void *data, size_t size, size_t nmemb) {
    const size_t total_size(size * nmemb);
    concatenated_headers_.append(reinterpret_cast<char *>(data), total_size);
    return total_size;
}


size_t Downloader::HeaderFunction(void *data, size_t size, size_t nmemb, void *this_pointer) {
    Downloader * const downloader(reinterpret_cast<Downloader *>(this_pointer));
    return downloader->headerFunction(data, size, nmemb);
}


void Downloader::debugFunction(CURL * /* handle */, curl_infotype infotype, char *data, size_t size) {
    switch (infotype) {
    case CURLINFO_TEXT:
        LOG_DEBUG("informational text: " + std::string(data, size));
        break;
    case CURLINFO_HEADER_IN:
        LOG_DEBUG("received header:\n" + std::string(data, size));
        break;
    case CURLINFO_HEADER_OUT:
        LOG_DEBUG("sent header:\n" + std::string(data, size));
        break;
    case CURLINFO_DATA_IN:
        LOG_DEBUG("received " + std::to_string(size) + " bytes of data");
        break;
    default:
        break;
    }
}


int Downloader::DebugFunction(CURL *handle, curl_infotype infotype, char *data, size_t size, void *this_pointer) {
    Downloader * const downloader(reinterpret_cast<Downloader *>(this_pointer));
    downloader->debugFunction(handle, infotype, data, size);

    return 0;
}


void Downloader::setIgnoreSslCertificates(const bool ignore_ssl_certificates) {
    params_.ignore_ssl_certificates_ = ignore_ssl_certificates;
    const long verify_peer(ignore_ssl_certificates ? 0L : 1L);
    curlEasySetopt(CURLOPT_SSL_VERIFYPEER, verify_peer, "Downloader::setIgnoreSslCertificates:CURLOPT_SSL_VERIFYPEER");
    const long verify_host(ignore_ssl_certificates ? 0L : 2L);
    curlEasySetopt(CURLOPT_SSL_VERIFYHOST, verify_host, "Downloader::setIgnoreSslCertificates:CURLOPT_SSL_VERIFYHOST");
}


void Downloader::setProxy(const std::string &proxy_host_and_port) {
    params_.proxy_host_and_port_ = proxy_host_and_port;
    curlEasySetopt(CURLOPT_PROXY, params_.proxy_host_and_port_.c_str(), "Downloader::setProxy:CURLOPT_PROXY");
}


void Downloader::setUserAgent(const std::string &user_agent) {
    if (user_agent.empty())
        params_.user_agent_ = Downloader::DEFAULT_USER_AGENT_STRING;
    else
        params_.user_agent_ = user_agent;
    curlEasySetopt(CURLOPT_USERAGENT, params_.user_agent_.c_str(), "Downloader::setUserAgent:CURLOPT_USERAGENT");
}
