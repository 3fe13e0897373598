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

#ifndef GROUNDCREW_ALLOCATION_ASSIGNMENT_KEY_H_
#define GROUNDCREW_ALLOCATION_ASSIGNMENT_KEY_H_

#include <cstdint>
#include <ostream>
#include <string>
#include <tuple>
#include <utility>

#include "absl/container/flat_hash_map.h"
#include "ortools/base/strong_int.h"

namespace groundcrew {

// Identifies one assignment decision: "staff member `staff` performs the
// service `service` on the flight `flight`".
struct AssignmentKey {
  std::string flight;
  std::string service;
  std::string staff;

  AssignmentKey() = default;
  AssignmentKey(std::string flight, std::string service, std::string staff)
      : flight(std::move(flight)),
        service(std::move(service)),
        staff(std::move(staff)) {}

  bool operator==(const AssignmentKey& other) const {
    return flight == other.flight && service == other.service &&
           staff == other.staff;
  }
  bool operator!=(const AssignmentKey& other) const {
    return !(*this == other);
  }
  bool operator<(const AssignmentKey& other) const {
    return std::tie(flight, service, staff) <
           std::tie(other.flight, other.service, other.staff);
  }

  template <typename H>
  friend H AbslHashValue(H h, const AssignmentKey& key) {
    return H::combine(std::move(h), key.flight, key.service, key.staff);
  }

  std::string DebugString() const;
};

std::ostream& operator<<(std::ostream& out, const AssignmentKey& key);

// Dense identifier of an AssignmentKey in a VariableTable.
DEFINE_STRONG_INT_TYPE(AssignmentId, int32_t);

// Values (or hints) of assignment decisions, by their id in the VariableTable
// the model was built with.
using AssignmentValues = absl::flat_hash_map<AssignmentId, bool>;

}  // namespace groundcrew

#endif  // GROUNDCREW_ALLOCATION_ASSIGNMENT_KEY_H_
