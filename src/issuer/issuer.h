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
#include <mutex>
#include <vector>

// =====================================================================
// third-party libraries
// =====================================================================

// absl
#include "absl/status/statusor.h"

// =====================================================================
// local libraries
// =====================================================================

#include "src/issuer/layout.h"

namespace butterfly::issuer {

// Issues strictly increasing 64-bit ids for one machine.
//
// The low sequence is bumped on every call. When it overflows it rolls into
// the high sequence, which in turn rolls into the timestamp. Once the
// timestamp has advanced this way it works as a logical clock and no longer
// tracks the wall clock.
//
// Thread-safe: all state changes happen under one mutex.
class Issuer {
   private:
    explicit Issuer(const Fields& fields);

    mutable std::mutex mutex_;

    // guarded by mutex_
    Fields fields_;

    friend class IssuerTestPeer;

   public:
    // copy blocker
    Issuer(const Issuer&) = delete;

    // assignment blocker
    void operator=(const Issuer&) = delete;

    // Create an issuer for machine 0 seeded with a unix timestamp in
    // milliseconds.
    static absl::StatusOr<std::unique_ptr<Issuer>> Create(int64_t timestamp);

    // The machine id is checked before the timestamp, so an out of range
    // machine id is reported even if the timestamp is out of range too.
    static absl::StatusOr<std::unique_ptr<Issuer>> CreateWithMachine(
        int64_t timestamp, int64_t machine);

    // Create an issuer for machine 0 seeded with the current wall clock.
    static absl::StatusOr<std::unique_ptr<Issuer>> CreateNow();

    // Return the next id.
    //
    // Errors:
    // - InternalError: the machine id was found out of range while the low
    //   sequence had to roll over.
    // - ResourceExhaustedError: every field is at its max. The issuer can't
    //   issue any more ids and every later call fails the same way.
    //
    // No field is changed when an error is returned.
    absl::StatusOr<int64_t> Generate();

    // Return `count` ids in issuance order. The first error aborts the batch
    // and no id is returned. A non-positive count returns an empty batch.
    //
    // NB: No room is reserved up front, `count` may be far larger than the
    // ids left before the issuer is exhausted.
    absl::StatusOr<std::vector<int64_t>> GenerateBatch(int64_t count);

    // Current fields, as they were packed into the last issued id.
    Fields Snapshot() const;
};

}  // namespace butterfly::issuer
