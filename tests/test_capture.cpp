/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include <gtest/gtest.h>

#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>
#include <string>

#include <unistd.h>

#include "pathprobe/capture.hpp"
#include "scripted_capability.hpp"

using namespace pathprobe;
using namespace pathprobe::test;
namespace fs = std::filesystem;

namespace {

std::string slurp(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

class CaptureTest : public ::testing::Test {
   protected:
    fs::path root_;

    void SetUp() override {
        root_ = fs::temp_directory_path() /
                std::format("pathprobe-capture-{}-{}", ::getpid(),
                            ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(root_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }
};

}  // namespace

TEST_F(CaptureTest, WritesNumberedInvocationFiles) {
    auto sink = DirectoryCaptureSink::create(root_);
    ASSERT_TRUE(sink.has_value()) << sink.error();
    EXPECT_TRUE(fs::is_directory((*sink)->dir()));
    EXPECT_EQ((*sink)->dir().parent_path(), root_);

    ProbeCommand cmd{"dig", {"+short", "example.com", "A"}, std::chrono::seconds(5), "dns_a"};
    auto inv = output("93.184.216.34\n", 12);
    ASSERT_TRUE((*sink)->write(cmd, inv).has_value());

    EXPECT_EQ(slurp((*sink)->dir() / "01_dns_a.txt"), "93.184.216.34\n");
    auto meta = slurp((*sink)->dir() / "01_dns_a.meta.txt");
    EXPECT_NE(meta.find("command: dig +short example.com A"), std::string::npos);
    EXPECT_NE(meta.find("exit_code: 0"), std::string::npos);

    cmd.label = "stability 01/10";
    ASSERT_TRUE((*sink)->write(cmd, inv).has_value());
    EXPECT_TRUE(fs::exists((*sink)->dir() / "02_stability_01_10.txt"));
}

TEST_F(CaptureTest, StdoutIsWrittenByteForByte) {
    auto sink = DirectoryCaptureSink::create(root_);
    ASSERT_TRUE(sink.has_value());

    ProbeCommand cmd{"traceroute", {"-n", "1.1.1.1"}, std::chrono::seconds(5), "traceroute"};
    const std::string raw = " 1  10.0.0.1  1.0 ms\r\n 2  *\n\xff no trailing newline";
    auto inv = output(raw, 900, 1);
    inv.stderr_text = "traceroute: warning\n";
    ASSERT_TRUE((*sink)->write(cmd, inv).has_value());

    EXPECT_EQ(slurp((*sink)->dir() / "01_traceroute.txt"), raw);
    auto meta = slurp((*sink)->dir() / "01_traceroute.meta.txt");
    EXPECT_NE(meta.find("exit_code: 1"), std::string::npos);
    EXPECT_NE(meta.find("--- stderr ---\ntraceroute: warning\n"), std::string::npos);
}

TEST_F(CaptureTest, EachRunGetsItsOwnDirectory) {
    auto first = DirectoryCaptureSink::create(root_);
    auto second = DirectoryCaptureSink::create(root_);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_NE((*first)->dir(), (*second)->dir());
}

TEST_F(CaptureTest, ArtifactsKeepTheirName) {
    auto sink = DirectoryCaptureSink::create(root_);
    ASSERT_TRUE(sink.has_value());
    ASSERT_TRUE((*sink)->write_artifact("report.json", R"({"score": 100})").has_value());
    EXPECT_EQ(slurp((*sink)->dir() / "report.json"), R"({"score": 100})");
}

TEST_F(CaptureTest, UnwritableRootIsAnError) {
    fs::create_directories(root_);
    std::ofstream(root_ / "file") << "x";
    auto sink = DirectoryCaptureSink::create(root_ / "file" / "runs");
    EXPECT_FALSE(sink.has_value());
}

TEST_F(CaptureTest, CapturingCapabilityRecordsEveryCall) {
    auto sink = DirectoryCaptureSink::create(root_);
    ASSERT_TRUE(sink.has_value());

    ScriptedCapability inner;
    inner.on("dns_a", output("93.184.216.34\n"));
    CapturingCapability capturing(inner, **sink);

    auto ok = capturing.invoke({"dig", {"+short", "example.com"}, std::chrono::seconds(1), "dns_a"}, {});
    EXPECT_EQ(ok.stdout_text, "93.184.216.34\n");
    auto missing = capturing.invoke({"traceroute", {"-n", "1.1.1.1"}, std::chrono::seconds(1), "traceroute"}, {});
    EXPECT_TRUE(missing.tool_missing);

    EXPECT_TRUE(fs::exists((*sink)->dir() / "01_dns_a.txt"));
    EXPECT_TRUE(slurp((*sink)->dir() / "02_traceroute.txt").empty());
    auto meta = slurp((*sink)->dir() / "02_traceroute.meta.txt");
    EXPECT_NE(meta.find("launch_error: not scripted"), std::string::npos);
}
