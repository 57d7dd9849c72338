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
#include <string>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/status.h"

// spdlog
#include "spdlog/spdlog.h"

// =====================================================================
// self header
// =====================================================================

#include "src/issuer/layout.h"

namespace butterfly::issuer {

std::string Fields::ToString() const {
    return fmt::format(
        "timestamp: {}, high_sequence: {}, machine: {}, low_sequence: {}",
        timestamp, high_sequence, machine, low_sequence);
}

int64_t Compose(const Fields& fields) {
    return fields.timestamp << kTimestampShift |
           fields.high_sequence << kHighSequenceShift |
           fields.machine << kMachineShift | fields.low_sequence;
}

Fields Decompose(int64_t id) {
    Fields fields;
    fields.timestamp = id >> kTimestampShift;
    fields.high_sequence = (id >> kHighSequenceShift) & kHighSequenceMax;
    fields.machine = (id >> kMachineShift) & kMachineMax;
    fields.low_sequence = id & ~(int64_t{-1} << kLowSequenceBits);
    return fields;
}

absl::Status ValidateTimestamp(int64_t timestamp) {
    if (timestamp < 0 || timestamp > kTimestampMax) {
        return absl::OutOfRangeError(fmt::format(
            "timestamp[{}] must be in the range [0, {}]", timestamp,
            kTimestampMax));
    }
    return absl::OkStatus();
}

absl::Status ValidateMachine(int64_t machine) {
    if (machine < 0 || machine > kMachineMax) {
        return absl::OutOfRangeError(fmt::format(
            "machine[{}] must be in the range [0, {}]", machine, kMachineMax));
    }
    return absl::OkStatus();
}

}  // namespace butterfly::issuer
