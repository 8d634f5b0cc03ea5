/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include <gtest/gtest.h>

#include <string_view>
#include <vector>

#include "pathprobe/http_client.hpp"
#include "pathprobe/options.hpp"
#include "pathprobe/parsers.hpp"
#include "pathprobe/results.hpp"

using namespace pathprobe;

TEST(MakeRequest, BareDomainDefaultsToHttps) {
    auto req = make_request("example.com");
    ASSERT_TRUE(req.has_value()) << req.error();
    EXPECT_EQ(req->target_url, "https://example.com");
    EXPECT_EQ(req->domain, "example.com");
    EXPECT_TRUE(req->uses_tls);
    EXPECT_FALSE(req->port.has_value());
}

TEST(MakeRequest, KeepsPathAndExtractsPort) {
    auto req = make_request("http://Example.COM:8080/status?x=1");
    ASSERT_TRUE(req.has_value()) << req.error();
    EXPECT_EQ(req->target_url, "http://Example.COM:8080/status?x=1");
    EXPECT_EQ(req->domain, "example.com");
    EXPECT_FALSE(req->uses_tls);
    ASSERT_TRUE(req->port.has_value());
    EXPECT_EQ(*req->port, 8080);
}

TEST(MakeRequest, AcceptsIpLiterals) {
    auto v4 = make_request("https://93.184.216.34/");
    ASSERT_TRUE(v4.has_value());
    EXPECT_EQ(v4->domain, "93.184.216.34");

    auto v6 = make_request("http://[2606:2800:220:1::1]:80/");
    ASSERT_TRUE(v6.has_value()) << v6.error();
    EXPECT_EQ(v6->domain, "2606:2800:220:1::1");
    EXPECT_EQ(*v6->port, 80);
}

TEST(MakeRequest, RejectsMalformedTargets) {
    EXPECT_FALSE(make_request("").has_value());
    EXPECT_FALSE(make_request("   ").has_value());
    EXPECT_FALSE(make_request("ftp://example.com").has_value());
    EXPECT_FALSE(make_request("https://").has_value());
    EXPECT_FALSE(make_request("exa mple.com").has_value());
    EXPECT_FALSE(make_request("https://example.com:0/").has_value());
    EXPECT_FALSE(make_request("https://example.com:99999/").has_value());
    EXPECT_FALSE(make_request("http://[::1/").has_value());
}

TEST(ParseOptions, Defaults) {
    auto opts = parse_options({"example.com"});
    ASSERT_TRUE(opts.has_value()) << opts.error();
    EXPECT_EQ(opts->target, "example.com");
    EXPECT_FALSE(opts->json);
    EXPECT_FALSE(opts->capture_root.has_value());
    EXPECT_EQ(opts->samples, Config::STABILITY_SAMPLES);
    EXPECT_EQ(opts->max_hops, Config::ROUTE_MAX_HOPS);
    EXPECT_EQ(opts->http_backend, HttpBackend::CurlBinary);
    EXPECT_EQ(opts->log_level, LogLevel::Warn);
}

TEST(ParseOptions, ValuesInBothForms) {
    auto opts = parse_options({"--samples", "20", "--max-hops=30", "--bottleneck-delta", "80",
                               "--bottleneck-ceiling=250", "--http-backend", "libcurl", "--json",
                               "--log-level=debug", "https://example.com"});
    ASSERT_TRUE(opts.has_value()) << opts.error();
    EXPECT_EQ(opts->samples, 20);
    EXPECT_EQ(opts->max_hops, 30);
    EXPECT_EQ(opts->bottleneck_delta_ms, 80);
    EXPECT_EQ(opts->bottleneck_ceiling_ms, 250);
    EXPECT_EQ(opts->http_backend, HttpBackend::Libcurl);
    EXPECT_TRUE(opts->json);
    EXPECT_EQ(opts->log_level, LogLevel::Debug);
}

TEST(ParseOptions, CaptureTakesOnlyInlineDirectory) {
    auto bare = parse_options({"--capture", "example.com"});
    ASSERT_TRUE(bare.has_value()) << bare.error();
    EXPECT_EQ(bare->target, "example.com");
    EXPECT_EQ(*bare->capture_root, std::filesystem::path(Config::CAPTURE_ROOT));

    auto dir = parse_options({"--capture=/tmp/runs", "example.com"});
    ASSERT_TRUE(dir.has_value());
    EXPECT_EQ(*dir->capture_root, std::filesystem::path("/tmp/runs"));

    EXPECT_FALSE(parse_options({"--capture=", "example.com"}).has_value());
}

TEST(ParseOptions, HelpAndVersionNeedNoTarget) {
    auto help = parse_options({"-h"});
    ASSERT_TRUE(help.has_value());
    EXPECT_TRUE(help->show_help);

    auto version = parse_options({"--version"});
    ASSERT_TRUE(version.has_value());
    EXPECT_TRUE(version->show_version);
}

TEST(ParseOptions, Errors) {
    auto missing = parse_options({});
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error(), "Missing target (domain or URL)");

    auto unknown = parse_options({"--bogus", "example.com"});
    ASSERT_FALSE(unknown.has_value());
    EXPECT_NE(unknown.error().find("Unknown option"), std::string::npos);

    auto extra = parse_options({"a.com", "b.com"});
    ASSERT_FALSE(extra.has_value());
    EXPECT_NE(extra.error().find("Unexpected argument"), std::string::npos);

    auto no_value = parse_options({"example.com", "--samples"});
    ASSERT_FALSE(no_value.has_value());
    EXPECT_NE(no_value.error().find("requires a value"), std::string::npos);

    EXPECT_FALSE(parse_options({"--samples", "0", "example.com"}).has_value());
    EXPECT_FALSE(parse_options({"--samples", "101", "example.com"}).has_value());
    EXPECT_FALSE(parse_options({"--max-hops", "65", "example.com"}).has_value());
    EXPECT_FALSE(parse_options({"--bottleneck-delta", "abc", "example.com"}).has_value());
    EXPECT_FALSE(parse_options({"--http-backend", "wget", "example.com"}).has_value());
    EXPECT_FALSE(parse_options({"--log-level", "loud", "example.com"}).has_value());
}

TEST(WriteOut, RendersTimingTemplate) {
    HttpTiming t;
    t.namelookup = 0.012;
    t.connect = 0.034;
    t.appconnect = 0.1;
    t.starttransfer = 0.2;
    t.total = 0.25;
    t.http_code = 200;
    t.speed_download = 1234.6;
    t.remote_ip = "93.184.216.34";
    t.num_redirects = 1;

    auto out = render_write_out(kCurlTimingTemplate, t);
    auto parsed = parse_curl_timing(out);
    ASSERT_TRUE(parsed.has_value()) << out;
    EXPECT_EQ(parsed->dns_ms, 12);
    EXPECT_EQ(parsed->connect_ms, 34);
    EXPECT_EQ(parsed->ssl_ms, 100);
    EXPECT_EQ(parsed->ttfb_ms, 200);
    EXPECT_EQ(parsed->total_ms, 250);
    EXPECT_EQ(parsed->http_code, 200);
    EXPECT_EQ(parsed->remote_ip, "93.184.216.34");
    EXPECT_EQ(parsed->redirect_count, 1);
}

TEST(WriteOut, FailedTransferPrintsZeroCode) {
    HttpTiming t;
    EXPECT_EQ(render_write_out("%{http_code}", t), "000");
}

TEST(WriteOut, EscapesAndUnknownVariables) {
    HttpTiming t;
    t.http_code = 404;
    EXPECT_EQ(render_write_out("code=%{response_code}\\n", t), "code=404\n");
    EXPECT_EQ(render_write_out("%{size_header}", t), "%{size_header}");
    EXPECT_EQ(render_write_out("100%", t), "100%");
}
