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
#include <string>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/status.h"

namespace butterfly::issuer {

// Bit layout of an id, from the most significant bit to the least:
//
//   | 0 (sign) | timestamp (41) | high sequence (8) | machine (13) | low (1) |
constexpr uint32_t kTimestampBits = 41;
constexpr uint32_t kHighSequenceBits = 8;
constexpr uint32_t kMachineBits = 13;
constexpr uint32_t kLowSequenceBits = 1;

constexpr uint32_t kMachineShift = kLowSequenceBits;
constexpr uint32_t kHighSequenceShift = kMachineBits + kLowSequenceBits;
constexpr uint32_t kTimestampShift =
    kHighSequenceBits + kMachineBits + kLowSequenceBits;

constexpr int64_t kTimestampMax = ~(int64_t{-1} << kTimestampBits);
constexpr int64_t kHighSequenceMax = ~(int64_t{-1} << kHighSequenceBits);
constexpr int64_t kMachineMax = ~(int64_t{-1} << kMachineBits);

// NB: The low sequence is capped at a decimal digit, not at the capacity of
// its single bit. Values 2-9 spill into the bits of the machine field, so
// machine ids with any of their three lowest bits set produce ids that
// collide or go backwards within one high sequence.
constexpr int64_t kLowSequenceMax = 9;

static_assert(kTimestampShift + kTimestampBits == 63,
              "the sign bit of an id must stay unused");

// The four components of an id.
struct Fields {
    int64_t timestamp = 0;
    int64_t high_sequence = 0;
    int64_t machine = 0;
    int64_t low_sequence = 0;

    bool operator==(const Fields& other) const = default;

    std::string ToString() const;
};

// Pack the fields into an id. Fields are not range checked.
int64_t Compose(const Fields& fields);

// Split an id into its fields by reversing the shifts of Compose.
//
// The low sequence is read from its single allocated bit, so for ids whose
// low sequence was above 1 the result differs from the fields that produced
// the id. Compose(Decompose(id)) == id holds for every non-negative id.
Fields Decompose(int64_t id);

absl::Status ValidateTimestamp(int64_t timestamp);

absl::Status ValidateMachine(int64_t machine);

}  // namespace butterfly::issuer
