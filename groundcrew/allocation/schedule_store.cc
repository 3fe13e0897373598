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

#include "groundcrew/allocation/schedule_store.h"

#include <algorithm>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "groundcrew/allocation/allocation.pb.h"
#include "groundcrew/allocation/assignment_key.h"
#include "groundcrew/model/clock_time.h"
#include "ortools/base/logging.h"

namespace groundcrew {

std::optional<bool> ScheduleVersion::Committed(const AssignmentKey& key) const {
  const auto it = entries_.find(key);
  if (it == entries_.end()) return std::nullopt;
  return it->second.assigned;
}

std::vector<AssignmentKey> ScheduleVersion::AssignedKeys() const {
  std::vector<AssignmentKey> keys;
  for (const auto& [key, value] : entries_) {
    if (value.assigned) keys.push_back(key);
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

ScheduleStore::ScheduleStore()
    : current_(std::make_shared<const ScheduleVersion>(
          0, kNoCutoff,
          absl::flat_hash_map<AssignmentKey, ScheduleVersion::Value>())) {}

std::optional<bool> ScheduleStore::Committed(absl::string_view flight,
                                             absl::string_view service,
                                             absl::string_view staff) const {
  return Snapshot()->Committed(AssignmentKey(
      std::string(flight), std::string(service), std::string(staff)));
}

int64_t ScheduleStore::version() const { return Snapshot()->version(); }

int64_t ScheduleStore::cutoff() const { return Snapshot()->cutoff(); }

std::shared_ptr<const ScheduleVersion> ScheduleStore::Snapshot() const {
  absl::MutexLock lock(&mutex_);
  return current_;
}

std::shared_ptr<const ScheduleVersion> ScheduleStore::Previous() const {
  absl::MutexLock lock(&mutex_);
  return previous_;
}

absl::StatusOr<int64_t> ScheduleStore::Commit(
    const std::vector<ScheduleEntry>& entries, int64_t cutoff) {
  absl::flat_hash_map<AssignmentKey, ScheduleVersion::Value> updated;
  for (const ScheduleEntry& entry : entries) {
    if (entry.flight_departure <= cutoff) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Entry ", entry.key.DebugString(), " departs at ",
          FormatClockTime(entry.flight_departure),
          ", not after the commit cutoff ", FormatClockTime(cutoff)));
    }
    if (!updated.insert({entry.key, {entry.assigned, entry.flight_departure}})
             .second) {
      return absl::InvalidArgumentError(
          absl::StrCat("Duplicate entry ", entry.key.DebugString()));
    }
  }

  absl::MutexLock lock(&mutex_);
  if (cutoff < current_->cutoff()) {
    return absl::FailedPreconditionError(absl::StrCat(
        "Commit cutoff ", FormatClockTime(cutoff),
        " is before the cutoff of version ", current_->version(), " (",
        FormatClockTime(current_->cutoff()), ")"));
  }
  int num_kept = 0;
  for (const auto& [key, value] : current_->entries()) {
    if (value.flight_departure > cutoff) continue;
    // Cannot collide with a new entry, which departs after the cutoff.
    updated.insert({key, value});
    ++num_kept;
  }
  const int64_t version = current_->version() + 1;
  previous_ = std::move(current_);
  current_ = std::make_shared<const ScheduleVersion>(version, cutoff,
                                                     std::move(updated));
  VLOG(1) << "Committed version " << version << " at cutoff "
          << FormatClockTime(cutoff) << ": " << entries.size()
          << " new entries, " << num_kept << " kept";
  return version;
}

std::vector<std::string> ScheduleStore::AssignedStaff(
    absl::string_view flight, absl::string_view service) const {
  std::vector<std::string> staff;
  for (const AssignmentKey& key : Snapshot()->AssignedKeys()) {
    if (key.flight == flight && key.service == service) {
      staff.push_back(key.staff);
    }
  }
  std::sort(staff.begin(), staff.end());
  return staff;
}

std::vector<AssignmentKey> ScheduleStore::AssignmentsForStaff(
    absl::string_view staff) const {
  std::vector<AssignmentKey> keys = Snapshot()->AssignedKeys();
  keys.erase(std::remove_if(keys.begin(), keys.end(),
                            [staff](const AssignmentKey& key) {
                              return key.staff != staff;
                            }),
             keys.end());
  return keys;
}

std::vector<AssignmentKey> ScheduleStore::AssignmentsForFlight(
    absl::string_view flight) const {
  std::vector<AssignmentKey> keys = Snapshot()->AssignedKeys();
  keys.erase(std::remove_if(keys.begin(), keys.end(),
                            [flight](const AssignmentKey& key) {
                              return key.flight != flight;
                            }),
             keys.end());
  return keys;
}

ScheduleSnapshot ScheduleStore::ExportSnapshot() const {
  const std::shared_ptr<const ScheduleVersion> snapshot = Snapshot();
  std::vector<const std::pair<const AssignmentKey, ScheduleVersion::Value>*>
      sorted;
  sorted.reserve(snapshot->entries().size());
  for (const auto& entry : snapshot->entries()) sorted.push_back(&entry);
  std::sort(sorted.begin(), sorted.end(),
            [](const auto* a, const auto* b) { return a->first < b->first; });

  ScheduleSnapshot proto;
  proto.set_version(snapshot->version());
  proto.set_cutoff(snapshot->cutoff());
  for (const auto* entry : sorted) {
    AssignmentProto* const assignment = proto.add_assignments();
    assignment->set_flight(entry->first.flight);
    assignment->set_service(entry->first.service);
    assignment->set_staff(entry->first.staff);
    assignment->set_assigned(entry->second.assigned);
    assignment->set_flight_departure(entry->second.flight_departure);
  }
  return proto;
}

absl::Status ScheduleStore::ImportSnapshot(const ScheduleSnapshot& snapshot) {
  if (snapshot.version() < 0) {
    return absl::InvalidArgumentError(
        absl::StrCat("Negative schedule version ", snapshot.version()));
  }
  absl::flat_hash_map<AssignmentKey, ScheduleVersion::Value> entries;
  for (const AssignmentProto& assignment : snapshot.assignments()) {
    AssignmentKey key(assignment.flight(), assignment.service(),
                      assignment.staff());
    if (key.flight.empty() || key.service.empty() || key.staff.empty()) {
      return absl::InvalidArgumentError(
          absl::StrCat("Incomplete assignment ", key.DebugString()));
    }
    if (!entries
             .insert({std::move(key),
                      {assignment.assigned(), assignment.flight_departure()}})
             .second) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Duplicate assignment (", assignment.flight(), ", ",
          assignment.service(), ", ", assignment.staff(), ")"));
    }
  }
  const int64_t cutoff =
      snapshot.has_cutoff() ? snapshot.cutoff() : kNoCutoff;
  auto version = std::make_shared<const ScheduleVersion>(
      snapshot.version(), cutoff, std::move(entries));
  absl::MutexLock lock(&mutex_);
  previous_ = nullptr;
  current_ = std::move(version);
  return absl::OkStatus();
}

}  // namespace groundcrew
