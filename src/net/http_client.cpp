/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "pathprobe/http_client.hpp"

#include <format>
#include <stdexcept>

#include <curl/curl.h>

#include "pathprobe/config.hpp"

namespace pathprobe {

namespace {

constexpr auto kUserAgent = "pathprobe/1.0 (+https://curl.se/libcurl/)";

double info_seconds(CURL* handle, CURLINFO info) {
    curl_off_t us = 0;
    if (curl_easy_getinfo(handle, info, &us) != CURLE_OK || us < 0) {
        return 0.0;
    }
    return static_cast<double>(us) / 1'000'000.0;
}

HttpTiming collect_timing(CURL* handle) {
    HttpTiming t;
    t.namelookup = info_seconds(handle, CURLINFO_NAMELOOKUP_TIME_T);
    t.connect = info_seconds(handle, CURLINFO_CONNECT_TIME_T);
    t.appconnect = info_seconds(handle, CURLINFO_APPCONNECT_TIME_T);
    t.starttransfer = info_seconds(handle, CURLINFO_STARTTRANSFER_TIME_T);
    t.total = info_seconds(handle, CURLINFO_TOTAL_TIME_T);

    long code = 0;
    if (curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &code) == CURLE_OK) {
        t.http_code = code;
    }

    curl_off_t speed = 0;
    if (curl_easy_getinfo(handle, CURLINFO_SPEED_DOWNLOAD_T, &speed) == CURLE_OK) {
        t.speed_download = static_cast<double>(speed);
    }

    char* ip = nullptr;
    if (curl_easy_getinfo(handle, CURLINFO_PRIMARY_IP, &ip) == CURLE_OK && ip) {
        t.remote_ip = ip;
    }

    long redirects = 0;
    if (curl_easy_getinfo(handle, CURLINFO_REDIRECT_COUNT, &redirects) == CURLE_OK) {
        t.num_redirects = redirects;
    }
    return t;
}

}  // namespace

HttpClient::HttpClient() : handle_(curl_easy_init(), curl_easy_cleanup) {
    if (!handle_) throw std::runtime_error("Failed to create curl handle");
}

size_t HttpClient::discard_body(void*, size_t size, size_t nmemb, void*) noexcept {
    return size * nmemb;
}

std::expected<HttpTiming, HttpFailure> HttpClient::timed_request(const TimedRequest& req,
                                                                 std::stop_token stop) {
    CURL* h = handle_.get();
    curl_easy_reset(h);

    curl_easy_setopt(h, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(h, CURLOPT_USERAGENT, kUserAgent);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, discard_body);
    curl_easy_setopt(h, CURLOPT_TIMEOUT, req.timeout_sec);
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, req.connect_timeout_sec);
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, req.follow_redirects ? 1L : 0L);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_FORBID_REUSE, 1L);
    curl_easy_setopt(h, CURLOPT_FRESH_CONNECT, 1L);

    curl_easy_setopt(h, CURLOPT_XFERINFODATA, &stop);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION,
        +[](void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) -> int {
            auto* token = static_cast<std::stop_token*>(clientp);
            return token->stop_requested() ? 1 : 0;
        });
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);

    CURLcode res = curl_easy_perform(h);
    HttpTiming timing = collect_timing(h);

    if (res != CURLE_OK) {
        return std::unexpected(HttpFailure{
            static_cast<int>(res),
            std::format("curl: ({}) {}", static_cast<int>(res), curl_easy_strerror(res)),
            timing});
    }
    return timing;
}

}  // namespace pathprobe
