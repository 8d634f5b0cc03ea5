/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "pathprobe/http_client.hpp"

#include <format>
#include <mutex>
#include <stdexcept>
#include <string>

#include <curl/curl.h>
#include <openssl/crypto.h>
#include <openssl/opensslv.h>

#include "pathprobe/log.hpp"

namespace pathprobe {

namespace {

std::mutex init_mutex;
int users = 0;

void init_libraries() {
    if (OPENSSL_init_crypto(OPENSSL_INIT_NO_LOAD_CONFIG, nullptr) == 0) {
        throw std::runtime_error("Failed to initialize OpenSSL crypto library");
    }
    if (CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT); rc != CURLE_OK) {
        throw std::runtime_error(
            std::format("Failed to initialize libcurl: {}", curl_easy_strerror(rc)));
    }

    const curl_version_info_data* info = curl_version_info(CURLVERSION_NOW);
    if ((info->features & CURL_VERSION_SSL) == 0) {
        Log::warn("libcurl {} was built without TLS; https timing needs the curl binary",
                  info->version);
    }
    Log::debug("http backend: {}", HttpContext::describe());
}

}  // namespace

HttpContext::HttpContext() {
    std::lock_guard lock(init_mutex);
    if (users == 0) {
        init_libraries();
    }
    ++users;
}

HttpContext::~HttpContext() {
    std::lock_guard lock(init_mutex);
    if (--users == 0) {
        curl_global_cleanup();
    }
}

std::string HttpContext::describe() {
    const curl_version_info_data* info = curl_version_info(CURLVERSION_NOW);
    return std::format("libcurl {} ({}), {}",
                       info->version,
                       info->ssl_version ? info->ssl_version : "no TLS",
                       OpenSSL_version(OPENSSL_VERSION));
}

}  // namespace pathprobe
