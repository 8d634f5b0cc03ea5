/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <string>

#include "pathprobe/options.hpp"
#include "pathprobe/results.hpp"

namespace pathprobe {

// Exit codes: 0 report delivered, 1 usage or fatal error, 2 target failed,
// 130 interrupted.
class Application {
   public:
    int run(int argc, char* argv[]);

   private:
    void show_help(const std::string& app_name) const;
    void show_version() const;

    DiagnosticReport diagnose(const Options& opts, const DiagnosticRequest& request);
};

}  // namespace pathprobe
