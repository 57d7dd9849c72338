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

#pragma once

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
#include "absl/status/status.h"
#include "absl/status/statusor.h"

// =====================================================================
// local libraries
// =====================================================================

#include "src/issuer/issuer.h"

namespace butterfly::cli {

// Immutable options of one run of the command line tool.
class Options {
   public:
    int64_t machine;

    // Seed timestamp in unix milliseconds, the wall clock is used when it's
    // empty.
    std::optional<int64_t> timestamp;

    // Number of ids to print.
    int64_t count;

    // Print the fields of each id next to it.
    bool decode;

    Options(int64_t machine, std::optional<int64_t> timestamp, int64_t count,
            bool decode);

    absl::Status Validate() const;
};

absl::StatusOr<std::unique_ptr<butterfly::issuer::Issuer>> MakeIssuer(
    const Options& options);

// Issue the ids described by `options` and write them to `out`, one per
// line. Returns the exit code of the process.
int Run(const Options& options, std::ostream& out);

}  // namespace butterfly::cli
