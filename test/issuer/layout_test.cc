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
#include <limits>
#include <vector>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/status.h"

// gtest
#include "gtest/gtest.h"

// =====================================================================
// local libraries
// =====================================================================

#include "src/issuer/layout.h"

namespace butterfly::issuer {
namespace {

TEST(LayoutTest, ShiftsFollowWidths) {
    EXPECT_EQ(kMachineShift, 1u);
    EXPECT_EQ(kHighSequenceShift, 14u);
    EXPECT_EQ(kTimestampShift, 22u);
}

TEST(LayoutTest, MaximaFollowWidths) {
    EXPECT_EQ(kTimestampMax, (int64_t{1} << 41) - 1);
    EXPECT_EQ(kHighSequenceMax, 255);
    EXPECT_EQ(kMachineMax, 8191);

    // a decimal digit, wider than the single bit of the field
    EXPECT_EQ(kLowSequenceMax, 9);
}

TEST(LayoutTest, ComposePlacesEachField) {
    EXPECT_EQ(Compose(Fields{1, 0, 0, 0}), int64_t{1} << 22);
    EXPECT_EQ(Compose(Fields{0, 1, 0, 0}), int64_t{1} << 14);
    EXPECT_EQ(Compose(Fields{0, 0, 1, 0}), int64_t{1} << 1);
    EXPECT_EQ(Compose(Fields{0, 0, 0, 1}), 1);
    EXPECT_EQ(Compose(Fields{1700000000000, 17, 4096, 1}),
              (int64_t{1700000000000} << 22) | (17 << 14) | (4096 << 1) | 1);
}

TEST(LayoutTest, LargestFieldsFillSixtyThreeBits) {
    int64_t id = Compose(
        Fields{kTimestampMax, kHighSequenceMax, kMachineMax, kLowSequenceMax});
    EXPECT_EQ(id, std::numeric_limits<int64_t>::max());
}

TEST(LayoutTest, DecomposeReversesCompose) {
    const std::vector<Fields> cases = {
        {0, 0, 0, 0},
        {0, 0, 0, 1},
        {1700000000000, 0, 8, 1},
        {1700000000000, 255, 8191, 0},
        {kTimestampMax, kHighSequenceMax, kMachineMax, 1},
    };

    for (const auto& fields : cases) {
        EXPECT_EQ(Decompose(Compose(fields)), fields) << fields.ToString();
    }
}

TEST(LayoutTest, ComposeOfDecomposeIsIdentity) {
    const std::vector<int64_t> ids = {
        0,
        1,
        9,
        (int64_t{1700000000000} << 22) | 9,
        (int64_t{1700000000000} << 22) | (255 << 14) | (24 << 1) | 7,
        std::numeric_limits<int64_t>::max(),
    };

    for (int64_t id : ids) {
        EXPECT_EQ(Compose(Decompose(id)), id) << id;
    }
}

TEST(LayoutTest, LowSequenceAboveOneSpillsIntoMachine) {
    // 9 = 0b1001, the upper bit lands on the third bit of the machine field
    EXPECT_EQ(Compose(Fields{0, 0, 0, 9}), Compose(Fields{0, 0, 4, 1}));
    EXPECT_EQ(Decompose(9), (Fields{0, 0, 4, 1}));
}

TEST(LayoutTest, ValidateTimestamp) {
    EXPECT_TRUE(ValidateTimestamp(0).ok());
    EXPECT_TRUE(ValidateTimestamp(kTimestampMax).ok());
    EXPECT_EQ(ValidateTimestamp(kTimestampMax + 1).code(),
              absl::StatusCode::kOutOfRange);
    EXPECT_EQ(ValidateTimestamp(-1).code(), absl::StatusCode::kOutOfRange);
}

TEST(LayoutTest, ValidateMachine) {
    EXPECT_TRUE(ValidateMachine(0).ok());
    EXPECT_TRUE(ValidateMachine(kMachineMax).ok());
    EXPECT_EQ(ValidateMachine(kMachineMax + 1).code(),
              absl::StatusCode::kOutOfRange);
    EXPECT_EQ(ValidateMachine(-1).code(), absl::StatusCode::kOutOfRange);
}

}  // namespace
}  // namespace butterfly::issuer

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
