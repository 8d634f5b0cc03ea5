/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "pathprobe/events.hpp"
#include "pathprobe/results.hpp"

namespace pathprobe::CliRenderer {
std::string status_tag(StepStatus status);
std::string_view step_label(StepId id);
std::string jitter_assessment(std::int64_t mean_delta_jitter_ms);

void render_event(const ProgressEvent& event);
void render_report(const DiagnosticReport& report);
}  // namespace pathprobe::CliRenderer
