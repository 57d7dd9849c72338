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
#include <memory>
#include <optional>
#include <ostream>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/time/clock.h"
#include "absl/time/time.h"

// spdlog
#include "spdlog/spdlog.h"

// =====================================================================
// local libraries
// =====================================================================

#include "src/issuer/issuer.h"
#include "src/issuer/layout.h"

// =====================================================================
// self header
// =====================================================================

#include "src/cli/options.h"

namespace butterfly::cli {

Options::Options(int64_t machine, std::optional<int64_t> timestamp,
                 int64_t count, bool decode)
    : machine(machine), timestamp(timestamp), count(count), decode(decode) {}

absl::Status Options::Validate() const {
    auto status = butterfly::issuer::ValidateMachine(machine);
    if (!status.ok()) {
        return status;
    }

    if (timestamp.has_value()) {
        status = butterfly::issuer::ValidateTimestamp(timestamp.value());
        if (!status.ok()) {
            return status;
        }
    }

    if (count < 0) {
        return absl::InvalidArgumentError(
            fmt::format("count[{}] can't be negative", count));
    }

    return absl::OkStatus();
}

absl::StatusOr<std::unique_ptr<butterfly::issuer::Issuer>> MakeIssuer(
    const Options& options) {
    auto status = options.Validate();
    if (!status.ok()) {
        return status;
    }

    // the wall clock is read here rather than through Issuer::CreateNow since
    // that one is bound to machine 0
    int64_t timestamp = options.timestamp.has_value()
                            ? options.timestamp.value()
                            : absl::ToUnixMillis(absl::Now());

    return butterfly::issuer::Issuer::CreateWithMachine(timestamp,
                                                        options.machine);
}

int Run(const Options& options, std::ostream& out) {
    auto issuer = MakeIssuer(options);
    if (!issuer.ok()) {
        SPDLOG_ERROR("failed to create issuer: {}",
                     issuer.status().ToString());
        return 1;
    }

    auto ids = issuer.value()->GenerateBatch(options.count);
    if (!ids.ok()) {
        SPDLOG_ERROR("failed to generate ids: {}", ids.status().ToString());
        return 1;
    }

    SPDLOG_INFO("generated {} ids for machine {}", ids.value().size(),
                options.machine);

    for (int64_t id : ids.value()) {
        if (options.decode) {
            out << fmt::format("{} ({})", id,
                               butterfly::issuer::Decompose(id).ToString())
                << "\n";
        } else {
            out << id << "\n";
        }
    }
    out.flush();

    return 0;
}

}  // namespace butterfly::cli
