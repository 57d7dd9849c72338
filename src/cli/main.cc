// Copyright 2025 Xiaochen Cui
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

// =====================================================================
// c++ std
// =====================================================================

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

// =====================================================================
// third-party libraries
// =====================================================================

// spdlog
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

// CLI11
#include "CLI/CLI.hpp"

// =====================================================================
// local libraries
// =====================================================================

#include "src/cli/options.h"
#include "src/issuer/layout.h"

int main(int argc, char *argv[]) {
    // ids go to stdout, logs go to stderr
    spdlog::set_default_logger(spdlog::stderr_color_mt("butterfly"));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%@] %v");

    CLI::App app{"butterfly"};

    int64_t machine = 0;
    app.add_option("--machine", machine, "Machine id")
        ->check(CLI::Range(int64_t{0}, butterfly::issuer::kMachineMax));

    int64_t timestamp = 0;
    auto timestamp_opt =
        app.add_option("--timestamp", timestamp,
                       "Seed timestamp in unix milliseconds, default to now")
            ->check(CLI::Range(int64_t{0}, butterfly::issuer::kTimestampMax));

    int64_t count = 1;
    app.add_option("--count", count, "Number of ids to generate")
        ->check(CLI::NonNegativeNumber);

    bool decode = false;
    app.add_flag("--decode", decode, "Print the fields of each id");

    std::string log_level = "info";
    app.add_option("--log-level", log_level, "Log level")
        ->check(CLI::IsMember(
            {"trace", "debug", "info", "warning", "error", "critical", "off"}));

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError &e) {
        return app.exit(e);
    }

    spdlog::set_level(spdlog::level::from_str(log_level));

    std::optional<int64_t> seed;
    if (timestamp_opt->count() > 0) {
        seed = timestamp;
    }

    return butterfly::cli::Run(
        butterfly::cli::Options(machine, seed, count, decode), std::cout);
}
