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
#include <mutex>
#include <vector>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"

// spdlog
#include "spdlog/spdlog.h"

// =====================================================================
// self header
// =====================================================================

#include "src/issuer/issuer.h"

namespace butterfly::issuer {

Issuer::Issuer(const Fields& fields) : fields_(fields) {}

absl::StatusOr<std::unique_ptr<Issuer>> Issuer::Create(int64_t timestamp) {
    return CreateWithMachine(timestamp, 0);
}

absl::StatusOr<std::unique_ptr<Issuer>> Issuer::CreateWithMachine(
    int64_t timestamp, int64_t machine) {
    auto status = ValidateMachine(machine);
    if (!status.ok()) {
        return status;
    }

    status = ValidateTimestamp(timestamp);
    if (!status.ok()) {
        return status;
    }

    Fields fields;
    fields.timestamp = timestamp;
    fields.machine = machine;

    SPDLOG_DEBUG("issuer created, timestamp: {}, machine: {}", timestamp,
                 machine);

    // private constructor, std::make_unique can't reach it
    return std::unique_ptr<Issuer>(new Issuer(fields));
}

absl::StatusOr<std::unique_ptr<Issuer>> Issuer::CreateNow() {
    return Create(absl::ToUnixMillis(absl::Now()));
}

absl::StatusOr<int64_t> Issuer::Generate() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (fields_.low_sequence < kLowSequenceMax) {
        fields_.low_sequence++;
        return Compose(fields_);
    }

    // low sequence overflows from here on

    if (fields_.machine > kMachineMax) {
        return absl::InternalError(
            fmt::format("machine[{}] can't be more than the max[{}]",
                        fields_.machine, kMachineMax));
    }

    if (fields_.high_sequence < kHighSequenceMax) {
        fields_.high_sequence++;
        fields_.low_sequence = 0;
        return Compose(fields_);
    }

    if (fields_.timestamp >= kTimestampMax) {
        return absl::ResourceExhaustedError(
            fmt::format("no more ids, every field is at its max ({})",
                        fields_.ToString()));
    }

    fields_.timestamp++;
    fields_.high_sequence = 0;
    fields_.low_sequence = 0;
    return Compose(fields_);
}

absl::StatusOr<std::vector<int64_t>> Issuer::GenerateBatch(int64_t count) {
    std::vector<int64_t> ids;
    if (count <= 0) {
        return ids;
    }

    for (int64_t i = 0; i < count; ++i) {
        auto id = Generate();
        if (!id.ok()) {
            return id.status();
        }
        ids.push_back(id.value());
    }
    return ids;
}

Fields Issuer::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fields_;
}

}  // namespace butterfly::issuer
