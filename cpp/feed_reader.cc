/** \file    feed_reader.cc
 *  \brief   Fetches RSS 2.0 and Atom feeds and displays them as plain text.
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
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <unistd.h>
#include "Downloader.h"
#include "FeedBatch.h"
#include "FeedFetcher.h"
#include "FeedTools.h"
#include "HtmlUtil.h"
#include "IniFile.h"
#include "StringUtil.h"
#include "TextUtil.h"
#include "util.h"


namespace {


[[noreturn]] void Usage() {
    ::Usage("[--config-file=path] [--timeout=seconds] [--worker-threads=count] [--wrap-width=columns] [--input] [url1 ... urlN]\n"
            "If no URLs have been provided or --input has been specified, URLs will be read from stdin, one per line,\n"
            "until an empty line has been entered.");
}


struct ReaderConfig {
    FeedFetcher::Params fetcher_params_;
    unsigned worker_thread_count_;
    unsigned wrap_width_;

public:
    ReaderConfig(): worker_thread_count_(1), wrap_width_(80) { }
};


void LoadConfigFile(const std::string &config_file_path, ReaderConfig * const config) {
    const IniFile ini_file(config_file_path);
    LOG_INFO("using configuration file \"" + config_file_path + "\".");

    FeedFetcher::Params &fetcher_params(config->fetcher_params_);
    fetcher_params.user_agent_ = ini_file.getString("Fetcher", "user_agent", fetcher_params.user_agent_);
    const unsigned timeout(ini_file.getUnsigned("Fetcher", "timeout", fetcher_params.timeout_ / 1000));
    if (not FeedFetcher::TimeoutFromSeconds(timeout, &fetcher_params.timeout_))
        LOG_ERROR("\"timeout\" in \"" + config_file_path + "\" must not exceed " + std::to_string(FeedFetcher::MAX_TIMEOUT_SECONDS)
                  + " seconds!");
    fetcher_params.follow_redirects_ = ini_file.getBool("Fetcher", "follow_redirects", fetcher_params.follow_redirects_);
    fetcher_params.max_redirects_ = ini_file.getUnsigned("Fetcher", "max_redirects", static_cast<unsigned>(fetcher_params.max_redirects_));
    fetcher_params.proxy_ = ini_file.getString("Fetcher", "proxy", fetcher_params.proxy_);

    config->wrap_width_ = ini_file.getUnsigned("Display", "wrap_width", config->wrap_width_);
    config->worker_thread_count_ = ini_file.getUnsigned("Batch", "worker_threads", config->worker_thread_count_);
}


unsigned GetUnsignedFlagValue(const std::string &arg, const std::string &flag_prefix) {
    unsigned value;
    if (not StringUtil::ToUnsigned(arg.substr(flag_prefix.length()), &value))
        Usage();
    return value;
}


void ReadURLsInteractively(std::vector<std::string> * const urls) {
    std::cout << "Enter feed URLs one by one. Press Enter on an empty line to finish.\n";
    for (;;) {
        std::cout << "URL #" << (urls->size() + 1) << ": " << std::flush;
        std::string line;
        if (not std::getline(std::cin, line))
            break;
        StringUtil::TrimWhite(&line);
        if (line.empty())
            break;
        urls->emplace_back(line);
    }
}


std::string CleanDescription(const std::string &description) {
    std::string cleaned_description(HtmlUtil::StripHtmlTags(description));
    HtmlUtil::ReplaceEntities(&cleaned_description);
    return TextUtil::CollapseAndTrimWhitespace(cleaned_description);
}


void DisplayFeed(const std::string &url, const NormalizedFeed &feed, const unsigned wrap_width) {
    const std::string separator(wrap_width + 4, '-');

    std::cout << separator << '\n';
    std::cout << "Feed Source: " << url << '\n';
    std::cout << "\n--- Feed: " << feed.getTitle().value_or("No Title Found") << " (" << feed.getFormatName() << ") ---\n";
    if (feed.getDescription())
        std::cout << "Description: " << *feed.getDescription() << '\n';
    if (feed.getLink())
        std::cout << "Link: " << *feed.getLink() << '\n';
    std::cout << '\n';

    if (feed.empty()) {
        std::cout << "No entries found in this feed.\n";
        std::cout << separator << '\n';
        return;
    }

    std::cout << "--- Entries ---\n";
    for (const auto &entry : feed) {
        std::cout << "\n* Title: " << entry.getTitle().value_or("No Title") << '\n';
        std::cout << "  Link: " << entry.getLink().value_or("No Link") << '\n';

        const std::string description(entry.getDescription() ? CleanDescription(*entry.getDescription()) : "");
        if (description.empty())
            std::cout << "  Desc: Not Available\n";
        else
            std::cout << StringUtil::WordWrap(description, wrap_width, /* initial_indent = */ "  Desc: ",
                                              /* subsequent_indent = */ "        ")
                      << '\n';
    }

    std::cout << separator << '\n';
}


} // unnamed namespace


int Main(int argc, char *argv[]) {
    ReaderConfig config;
    std::string config_file_path;
    bool config_file_path_specified(false), read_from_stdin(false);
    unsigned timeout(0), worker_thread_count(0), wrap_width(0);

    --argc, ++argv;
    while (argc > 0 and StringUtil::StartsWith(argv[0], "--")) {
        const std::string arg(argv[0]);
        if (StringUtil::StartsWith(arg, "--config-file=")) {
            config_file_path = arg.substr(__builtin_strlen("--config-file="));
            config_file_path_specified = true;
        } else if (StringUtil::StartsWith(arg, "--timeout="))
            timeout = GetUnsignedFlagValue(arg, "--timeout=");
        else if (StringUtil::StartsWith(arg, "--worker-threads="))
            worker_thread_count = GetUnsignedFlagValue(arg, "--worker-threads=");
        else if (StringUtil::StartsWith(arg, "--wrap-width="))
            wrap_width = GetUnsignedFlagValue(arg, "--wrap-width=");
        else if (arg == "--input")
            read_from_stdin = true;
        else
            Usage();
        --argc, ++argv;
    }

    if (not config_file_path_specified) {
        config_file_path = FeedTools::GetDefaultConfigPath();
        if (::access(config_file_path.c_str(), F_OK) != 0)
            config_file_path.clear();
    }
    if (not config_file_path.empty())
        LoadConfigFile(config_file_path, &config);

    // Command-line flags take precedence over the configuration file:
    if (timeout != 0 and not FeedFetcher::TimeoutFromSeconds(timeout, &config.fetcher_params_.timeout_))
        LOG_ERROR("--timeout must not exceed " + std::to_string(FeedFetcher::MAX_TIMEOUT_SECONDS) + " seconds!");
    if (worker_thread_count != 0)
        config.worker_thread_count_ = worker_thread_count;
    if (wrap_width != 0)
        config.wrap_width_ = wrap_width;

    if (config.fetcher_params_.timeout_ == 0)
        LOG_ERROR("the timeout must be at least 1 second!");
    if (config.fetcher_params_.max_redirects_ > Downloader::MAX_MAX_REDIRECT_COUNT)
        LOG_ERROR("max_redirects must not exceed " + std::to_string(Downloader::MAX_MAX_REDIRECT_COUNT) + "!");
    if (config.wrap_width_ < 20)
        LOG_ERROR("the wrap width must be at least 20 columns!");

    std::vector<std::string> urls;
    for (int arg_no(0); arg_no < argc; ++arg_no)
        urls.emplace_back(argv[arg_no]);
    if (urls.empty() or read_from_stdin)
        ReadURLsInteractively(&urls);
    if (urls.empty()) {
        std::cout << "No URLs entered. Exiting.\n";
        return EXIT_FAILURE;
    }

    std::vector<FeedBatch::Result> results;
    FeedBatch::Process(urls, config.worker_thread_count_, FeedBatch::MakeFetchFunction(config.fetcher_params_), &results);

    unsigned rendered_count(0);
    for (const auto &result : results) {
        std::cout << "\n>>> Processing feed: " << result.url_ << '\n';
        if (result.succeeded()) {
            DisplayFeed(result.url_, *result.feed_, config.wrap_width_);
            ++rendered_count;
        } else {
            std::cout << result.getErrorMessage() << '\n';
            LOG_WARNING("\"" + result.url_ + "\": " + result.getErrorMessage());
        }
        std::cout << "<<< Finished processing feed.\n";
    }

    LOG_INFO("rendered " + std::to_string(rendered_count) + " of " + std::to_string(results.size()) + " feed(s).");

    return (rendered_count > 0) ? EXIT_SUCCESS : EXIT_FAILURE;
}
