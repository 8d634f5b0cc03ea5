/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "pathprobe/probe_capability.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <format>
#include <optional>
#include <string_view>

#include <curl/curl.h>

#include "pathprobe/config.hpp"
#include "pathprobe/http_client.hpp"
#include "pathprobe/log.hpp"
#include "pathprobe/utils.hpp"

namespace pathprobe {

namespace {

struct CurlArgs {
    TimedRequest request;
    std::string write_out;
};

// Accepts the subset of curl options the probes emit; anything else is left
// to the real binary.
std::optional<CurlArgs> parse_curl_args(const std::vector<std::string>& args) {
    CurlArgs out;
    for (std::size_t i = 0; i < args.size(); ++i) {
        std::string_view a = args[i];
        auto next = [&]() -> std::optional<std::string_view> {
            if (i + 1 >= args.size()) return std::nullopt;
            return std::string_view(args[++i]);
        };

        if (a == "-s" || a == "--silent" || a == "-S" || a == "--show-error") {
            continue;
        } else if (a == "-L" || a == "--location") {
            out.request.follow_redirects = true;
        } else if (a == "-o" || a == "--output") {
            auto v = next();
            if (!v || *v != "/dev/null") return std::nullopt;
        } else if (a == "-w" || a == "--write-out") {
            auto v = next();
            if (!v) return std::nullopt;
            out.write_out = std::string(*v);
        } else if (a == "--connect-timeout" || a == "-m" || a == "--max-time") {
            auto v = next();
            if (!v) return std::nullopt;
            auto secs = parse_number<long>(*v);
            if (!secs || *secs <= 0) return std::nullopt;
            if (a == "--connect-timeout") {
                out.request.connect_timeout_sec = *secs;
            } else {
                out.request.timeout_sec = *secs;
            }
        } else if (!a.starts_with('-') && out.request.url.empty()) {
            out.request.url = std::string(a);
        } else {
            return std::nullopt;
        }
    }
    if (out.request.url.empty()) return std::nullopt;
    return out;
}

std::string format_seconds(double s) {
    return std::format("{:.6f}", s);
}

}  // namespace

std::string render_write_out(std::string_view tmpl, const HttpTiming& t) {
    std::string out;
    out.reserve(tmpl.size() + 64);

    for (std::size_t i = 0; i < tmpl.size(); ++i) {
        char c = tmpl[i];
        if (c == '\\' && i + 1 < tmpl.size()) {
            char e = tmpl[i + 1];
            if (e == 'n' || e == 't' || e == 'r' || e == '\\') {
                out += e == 'n' ? '\n' : e == 't' ? '\t' : e == 'r' ? '\r' : '\\';
                ++i;
                continue;
            }
        }
        if (c == '%' && i + 1 < tmpl.size() && tmpl[i + 1] == '{') {
            auto close = tmpl.find('}', i + 2);
            if (close != std::string_view::npos) {
                std::string_view var = tmpl.substr(i + 2, close - i - 2);
                std::optional<std::string> value;
                if (var == "time_namelookup") value = format_seconds(t.namelookup);
                else if (var == "time_connect") value = format_seconds(t.connect);
                else if (var == "time_appconnect") value = format_seconds(t.appconnect);
                else if (var == "time_starttransfer") value = format_seconds(t.starttransfer);
                else if (var == "time_total") value = format_seconds(t.total);
                else if (var == "http_code" || var == "response_code")
                    value = std::format("{:03}", t.http_code);
                else if (var == "speed_download") value = std::format("{:.0f}", t.speed_download);
                else if (var == "remote_ip") value = t.remote_ip;
                else if (var == "num_redirects") value = std::format("{}", t.num_redirects);

                if (value) {
                    out += *value;
                    i = close;
                    continue;
                }
            }
        }
        out += c;
    }
    return out;
}

ProbeInvocation LibcurlCapability::invoke(const ProbeCommand& cmd, std::stop_token stop) {
    if (cmd.tool != Config::CURL_BINARY) {
        return fallback_.invoke(cmd, stop);
    }

    auto parsed = parse_curl_args(cmd.args);
    if (!parsed) {
        Log::debug("libcurl backend cannot serve '{}', using the curl binary", describe(cmd));
        return fallback_.invoke(cmd, stop);
    }

    auto limit = std::chrono::duration_cast<std::chrono::seconds>(cmd.timeout).count();
    if (limit > 0) {
        parsed->request.timeout_sec = std::min<long>(parsed->request.timeout_sec, limit);
    }

    ProbeInvocation inv;
    auto start = std::chrono::steady_clock::now();
    Log::debug("libcurl: {}", parsed->request.url);

    try {
        HttpClient client;
        auto res = client.timed_request(parsed->request, stop);
        if (res) {
            inv.exit_code = 0;
            inv.stdout_text = render_write_out(parsed->write_out, *res);
        } else {
            inv.exit_code = res.error().code;
            inv.stdout_text = render_write_out(parsed->write_out, res.error().partial);
            inv.stderr_text = res.error().message;
            inv.cancelled = res.error().code == CURLE_ABORTED_BY_CALLBACK && stop.stop_requested();
        }
    } catch (const std::exception& e) {
        inv.exit_code = CURLE_FAILED_INIT;
        inv.launch_error = e.what();
        inv.stderr_text = e.what();
    }

    inv.elapsed_ms = elapsed_ms(start);
    return inv;
}

}  // namespace pathprobe
