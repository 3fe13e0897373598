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

#include "groundcrew/allocation/schedule_verifier.h"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "groundcrew/allocation/assignment_key.h"
#include "groundcrew/model/clock_time.h"
#include "groundcrew/model/staffing.pb.h"
#include "ortools/base/logging.h"

namespace groundcrew {
namespace {

struct ResolvedAssignment {
  const AssignmentKey* key = nullptr;
  int flight_index = -1;
  int staff_index = -1;
  const Service* service = nullptr;
  TimeWindow window;
  int required_count = 1;
};

bool Excludes(const Service& a, const Service& b) {
  const auto excludes = [](const Service& s, const std::string& id) {
    return std::find(s.exclude_services().begin(), s.exclude_services().end(),
                     id) != s.exclude_services().end();
  };
  return excludes(a, b.id()) || excludes(b, a.id());
}

absl::Status Violation(absl::string_view rule, const AssignmentKey& a) {
  return absl::InternalError(
      absl::StrCat(rule, " violated by ", a.DebugString()));
}

absl::Status Violation(absl::string_view rule, const AssignmentKey& a,
                       const AssignmentKey& b) {
  return absl::InternalError(absl::StrCat(
      rule, " violated by ", a.DebugString(), " and ", b.DebugString()));
}

}  // namespace

absl::Status ScheduleVerifier::Verify(
    absl::Span<const AssignmentKey> assigned) const {
  std::vector<ResolvedAssignment> resolved;
  resolved.reserve(assigned.size());
  absl::flat_hash_set<AssignmentKey> seen;
  absl::flat_hash_map<std::pair<std::string, std::string>, int> staffed;

  for (const AssignmentKey& key : assigned) {
    if (!seen.insert(key).second) {
      return absl::InternalError(
          absl::StrCat("Duplicate assignment ", key.DebugString()));
    }
    ResolvedAssignment assignment;
    assignment.key = &key;
    assignment.flight_index = domain_.FlightIndex(key.flight);
    assignment.staff_index = domain_.StaffIndex(key.staff);
    if (assignment.flight_index < 0 || assignment.staff_index < 0) {
      return absl::InvalidArgumentError(
          absl::StrCat("Unknown flight or staff in ", key.DebugString()));
    }
    const Flight& flight = domain_.flight(assignment.flight_index);
    for (int pos = 0; pos < flight.services_size(); ++pos) {
      if (flight.services(pos).service_id() != key.service) continue;
      assignment.service = &domain_.FlightServiceDefinition(
          assignment.flight_index, pos);
      assignment.window = domain_.ServiceWindow(assignment.flight_index, pos);
      assignment.required_count =
          domain_.RequiredStaffCount(assignment.flight_index, pos);
      break;
    }
    if (assignment.service == nullptr) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Flight ", key.flight, " has no service ", key.service));
    }

    if (!domain_.CanPerform(assignment.staff_index, *assignment.service)) {
      return Violation("Certification", key);
    }
    if (!domain_.IsAvailable(assignment.staff_index, assignment.window)) {
      return Violation("Availability", key);
    }
    if (++staffed[{key.flight, key.service}] > assignment.required_count) {
      return Violation("Staff count", key);
    }
    resolved.push_back(assignment);
  }

  absl::flat_hash_map<std::pair<int, int>, std::vector<int>> by_staff_flight;
  absl::flat_hash_map<int, std::vector<int>> by_staff;
  for (int i = 0; i < resolved.size(); ++i) {
    by_staff_flight[{resolved[i].staff_index, resolved[i].flight_index}]
        .push_back(i);
    by_staff[resolved[i].staff_index].push_back(i);
  }

  for (const auto& [unused, group] : by_staff_flight) {
    for (const int i : group) {
      const ResolvedAssignment& a = resolved[i];
      if (a.service->service_class() == COMMON_LEVEL && group.size() > 1) {
        const int other = group[group[0] == i ? 1 : 0];
        return Violation("CommonLevel exclusivity", *a.key,
                         *resolved[other].key);
      }
      if (a.service->service_class() != FLIGHT_LEVEL) continue;
      int num_flight_level = 0;
      for (const int j : group) {
        const ResolvedAssignment& b = resolved[j];
        if (b.service->service_class() != FLIGHT_LEVEL) continue;
        ++num_flight_level;
        if (j <= i) continue;
        if (Excludes(*a.service, *b.service)) {
          return Violation("exclude_services", *a.key, *b.key);
        }
        if (parameters_.enforce_flight_level_non_overlap() &&
            a.window.Overlaps(b.window)) {
          return Violation("FlightLevel non-overlap", *a.key, *b.key);
        }
      }
      const int limit = a.service->cross_utilization_limit();
      if (limit > 0 && num_flight_level > limit) {
        return Violation("cross_utilization_limit", *a.key);
      }
    }
  }

  for (const auto& [unused, group] : by_staff) {
    const ResolvedAssignment* multi = nullptr;
    for (const int i : group) {
      const ResolvedAssignment& a = resolved[i];
      if (a.service->service_class() != MULTI_FLIGHT) continue;
      if (multi != nullptr && multi->service->id() != a.service->id()) {
        return Violation("MultiFlight identity", *multi->key, *a.key);
      }
      multi = &a;
      for (const int j : group) {
        const ResolvedAssignment& b = resolved[j];
        if (b.service->service_class() == MULTI_FLIGHT) continue;
        if (b.flight_index == a.flight_index || b.window.Overlaps(a.window)) {
          return Violation("MultiFlight exclusivity", *a.key, *b.key);
        }
      }
    }
  }
  VLOG(1) << "Verified " << resolved.size() << " assignments";
  return absl::OkStatus();
}

}  // namespace groundcrew
