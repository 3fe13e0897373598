// Copyright 2010-2025 Google LLC
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef GROUNDCREW_ALLOCATION_SCHEDULE_STORE_H_
#define GROUNDCREW_ALLOCATION_SCHEDULE_STORE_H_

#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "groundcrew/allocation/allocation.pb.h"
#include "groundcrew/allocation/assignment_key.h"

namespace groundcrew {

// One decision of a schedule, with the departure of its flight which decides
// on which side of a commit cutoff it falls.
struct ScheduleEntry {
  AssignmentKey key;
  bool assigned = false;
  int64_t flight_departure = 0;
};

// An immutable committed schedule.
class ScheduleVersion {
 public:
  struct Value {
    bool assigned = false;
    int64_t flight_departure = 0;
  };

  ScheduleVersion(int64_t version, int64_t cutoff,
                  absl::flat_hash_map<AssignmentKey, Value> entries)
      : version_(version), cutoff_(cutoff), entries_(std::move(entries)) {}

  int64_t version() const { return version_; }
  int64_t cutoff() const { return cutoff_; }

  // Returns std::nullopt when the key was never part of a solved model.
  std::optional<bool> Committed(const AssignmentKey& key) const;

  const absl::flat_hash_map<AssignmentKey, Value>& entries() const {
    return entries_;
  }

  // The keys set to true, sorted.
  std::vector<AssignmentKey> AssignedKeys() const;

 private:
  const int64_t version_;
  const int64_t cutoff_;
  const absl::flat_hash_map<AssignmentKey, Value> entries_;
};

// The authoritative schedule, as a sequence of versions.
//
// All mutations go through Commit() or ImportSnapshot(), which swap in a new
// immutable ScheduleVersion under a mutex. Readers holding a Snapshot() are
// never affected by later commits.
//
// This class is thread-safe.
class ScheduleStore {
 public:
  // The cutoff of the empty schedule, before the first commit.
  static constexpr int64_t kNoCutoff = std::numeric_limits<int64_t>::min();

  ScheduleStore();

  // This type is neither copyable nor movable.
  ScheduleStore(const ScheduleStore&) = delete;
  ScheduleStore& operator=(const ScheduleStore&) = delete;

  std::optional<bool> Committed(absl::string_view flight,
                                absl::string_view service,
                                absl::string_view staff) const;
  int64_t version() const;
  int64_t cutoff() const;

  std::shared_ptr<const ScheduleVersion> Snapshot() const;

  // The version displaced by the last commit, or nullptr. Only meant as a
  // hint source.
  std::shared_ptr<const ScheduleVersion> Previous() const;

  // Replaces every entry whose flight departs after `cutoff` by `entries`, and
  // keeps the others. Returns the new version number.
  //
  // Fails without any change if an entry departs at or before `cutoff`, if a
  // key appears twice, or if `cutoff` is before the cutoff of the current
  // version.
  absl::StatusOr<int64_t> Commit(const std::vector<ScheduleEntry>& entries,
                                 int64_t cutoff);

  // Staff ids assigned to a flight service, sorted.
  std::vector<std::string> AssignedStaff(absl::string_view flight,
                                         absl::string_view service) const;
  // Assigned keys of a staff member or a flight, sorted.
  std::vector<AssignmentKey> AssignmentsForStaff(absl::string_view staff) const;
  std::vector<AssignmentKey> AssignmentsForFlight(
      absl::string_view flight) const;

  ScheduleSnapshot ExportSnapshot() const;

  // Replaces the whole schedule by `snapshot`, which becomes the current
  // version. The previous version is dropped.
  absl::Status ImportSnapshot(const ScheduleSnapshot& snapshot);

 private:
  mutable absl::Mutex mutex_;
  std::shared_ptr<const ScheduleVersion> current_ ABSL_GUARDED_BY(mutex_);
  std::shared_ptr<const ScheduleVersion> previous_ ABSL_GUARDED_BY(mutex_);
};

}  // namespace groundcrew

#endif  // GROUNDCREW_ALLOCATION_SCHEDULE_STORE_H_
