/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <cstdint>
#include <expected>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>

typedef void CURL;

namespace pathprobe {

struct HttpTiming {
    // Cumulative phase timers in seconds, as curl's write-out reports them.
    double namelookup = 0.0;
    double connect = 0.0;
    double appconnect = 0.0;
    double starttransfer = 0.0;
    double total = 0.0;
    long http_code = 0;
    double speed_download = 0.0;
    std::string remote_ip;
    long num_redirects = 0;
};

// Expands curl-style %{variable} references and \n escapes in a write-out
// template. Unknown variables are left untouched.
[[nodiscard]] std::string render_write_out(std::string_view tmpl, const HttpTiming& t);

struct HttpFailure {
    int code = 0;  // CURLcode, which is also the curl CLI exit status
    std::string message;
    HttpTiming partial;
};

struct TimedRequest {
    std::string url;
    long timeout_sec = 30;
    long connect_timeout_sec = 10;
    bool follow_redirects = false;
};

class HttpClient {
   public:
    HttpClient();
    ~HttpClient() = default;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Performs one GET, discarding the body, and reports the phase timers.
    std::expected<HttpTiming, HttpFailure> timed_request(const TimedRequest& req,
                                                         std::stop_token stop = {});

   private:
    std::unique_ptr<CURL, void (*)(CURL*)> handle_;

    static size_t discard_body(void* ptr, size_t size, size_t nmemb, void* userdata) noexcept;
};

// Reference-counted libcurl / OpenSSL global initialization.
class HttpContext {
   public:
    HttpContext();
    ~HttpContext();

    HttpContext(const HttpContext&) = delete;
    HttpContext& operator=(const HttpContext&) = delete;

    // libcurl, its TLS backend and the OpenSSL build, for logs and --version.
    [[nodiscard]] static std::string describe();
};

}  // namespace pathprobe
