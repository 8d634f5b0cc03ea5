/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "pathprobe/application.hpp"

#include <filesystem>
#include <format>
#include <memory>
#include <optional>
#include <print>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include "pathprobe/capture.hpp"
#include "pathprobe/cli_renderer.hpp"
#include "pathprobe/color.hpp"
#include "pathprobe/config.hpp"
#include "pathprobe/events.hpp"
#include "pathprobe/http_client.hpp"
#include "pathprobe/interrupts.hpp"
#include "pathprobe/log.hpp"
#include "pathprobe/pipeline.hpp"
#include "pathprobe/probe_capability.hpp"
#include "pathprobe/report_json.hpp"
#include "pathprobe/utils.hpp"

namespace fs = std::filesystem;

namespace pathprobe {

void Application::show_help(const std::string& app_name) const {
    std::println("Usage: {} [options] <domain-or-url>", app_name);
    std::println("");
    std::println("Diagnoses why a site is slow or unreachable: DNS, connection timing,");
    std::println("route and stability probes, scored with actionable recommendations.");
    std::println("");
    std::println("Options:");
    std::println("  --json                  Print the report as JSON");
    std::println("  --capture[=DIR]         Save raw probe output under DIR (default: {})",
                 Config::CAPTURE_ROOT);
    std::println("  --samples N             Stability requests, 1..{} (default: {})",
                 Config::STABILITY_MAX_SAMPLES, Config::STABILITY_SAMPLES);
    std::println("  --max-hops N            Traceroute hop limit (default: {})", Config::ROUTE_MAX_HOPS);
    std::println("  --bottleneck-delta MS   RTT jump that flags a hop (default: {})",
                 Config::BOTTLENECK_DELTA_MS);
    std::println("  --bottleneck-ceiling MS RTT that always flags a hop (default: {})",
                 Config::BOTTLENECK_CEILING_MS);
    std::println("  --http-backend B        curl (binary, default) or libcurl (in-process)");
    std::println("  --log-level L           debug, info, warn (default), error, off");
    std::println("  --no-color              Disable ANSI colors");
    std::println("  -h, --help              Show this help message");
    std::println("  -v, --version           Show version information");
    std::println("");
    std::println("Examples:");
    std::println("  {} example.com", app_name);
    std::println("  {} --capture --samples 20 https://example.com/login", app_name);
}

void Application::show_version() const {
    std::println("{} v{}", Config::APP_NAME, Config::APP_VERSION);
    std::println("Built with {}", HttpContext::describe());
    std::println("Copyright (c) 2025 Alfie Ardinata");
    std::println("Licensed under the Mozilla Public License 2.0");
}

DiagnosticReport Application::diagnose(const Options& opts, const DiagnosticRequest& request) {
    ProcessCapability process;
    std::optional<LibcurlCapability> libcurl;
    ProbeCapability* capability = &process;
    if (opts.http_backend == HttpBackend::Libcurl) {
        capability = &libcurl.emplace(process);
    }

    std::unique_ptr<DirectoryCaptureSink> sink;
    std::optional<CapturingCapability> capturing;
    if (opts.capture_root) {
        auto created = DirectoryCaptureSink::create(*opts.capture_root);
        if (created) {
            sink = std::move(*created);
            capability = &capturing.emplace(*capability, *sink);
            if (auto log = Log::open_file(sink->dir() / Config::CAPTURE_LOG_NAME); !log) {
                Log::warn("{}", log.error());
            }
            Log::info("capturing raw output to {}", sink->dir().string());
        } else {
            Log::warn("raw capture disabled: {}", created.error());
        }
    }

    PipelineOptions popts;
    popts.route.max_hops = opts.max_hops;
    popts.route.bottleneck_delta_ms = opts.bottleneck_delta_ms;
    popts.route.bottleneck_ceiling_ms = opts.bottleneck_ceiling_ms;
    popts.stability.samples = opts.samples;

    std::stop_source stop_source;
    InterruptBridge bridge(stop_source);

    EventChannel channel;
    Pipeline pipeline(*capability, channel, popts);

    std::jthread printer;
    if (!opts.json) {
        printer = std::jthread([sub = channel.subscribe()]() mutable {
            while (auto ev = sub.next()) {
                CliRenderer::render_event(*ev);
            }
        });
    }

    auto report = pipeline.run(request, stop_source.get_token());
    if (printer.joinable()) printer.join();

    if (sink) {
        report.capture_dir = sink->dir().string();
        auto saved = sink->write_artifact(Config::CAPTURE_REPORT_NAME, report_to_string(report));
        if (!saved) {
            Log::warn("{}", saved.error());
        }
        Log::close_file();
    }
    return report;
}

int Application::run(int argc, char* argv[]) {
    try {
        SignalGuard signal_guard;

        std::string app_name{Config::APP_NAME};
        if (argc > 0) {
            app_name = fs::path(argv[0]).filename().string();
            if (app_name.empty())
                app_name = Config::APP_NAME;
        }

        std::vector<std::string_view> args(argv + (argc > 0 ? 1 : 0), argv + argc);
        auto opts = parse_options(args);
        if (!opts) {
            std::println(stderr, "{}Error: {}{}", Color::RED, opts.error(), Color::RESET);
            show_help(app_name);
            return 1;
        }
        if (opts->show_help) {
            show_help(app_name);
            return 0;
        }
        if (opts->show_version) {
            show_version();
            return 0;
        }

        Color::enabled = opts->color && !opts->json && ::isatty(STDOUT_FILENO) == 1;
        Log::set_level(opts->log_level);

        auto request = make_request(opts->target);
        if (!request) {
            std::println(stderr, "{}Error: {}{}", Color::RED, request.error(), Color::RESET);
            return 1;
        }

        HttpContext http_context;

        if (!opts->json) {
            print_centered_header(std::format("pathprobe - Network Path Diagnostics (v{})", Config::APP_VERSION));
            std::println(" {:<{}} : {}", "Target", Config::APP_INFO_LABEL_WIDTH,
                         Color::colorize(request->target_url, Color::CYAN));
            std::println(" {:<{}} : {}", "Domain", Config::APP_INFO_LABEL_WIDTH, request->domain);
            print_line();
        }

        auto report = diagnose(*opts, *request);

        if (opts->json) {
            std::println("{}", report_to_string(report));
        } else {
            CliRenderer::render_report(report);
        }

        if (report.cancelled) return 130;
        return report.overall_status == OverallStatus::Failed ? 2 : 0;

    } catch (const std::exception& e) {
        std::println(stderr, "\n{}Fatal Error: {}{}", Color::RED, e.what(), Color::RESET);
        Log::close_file();
        return 1;
    }
}

}  // namespace pathprobe
