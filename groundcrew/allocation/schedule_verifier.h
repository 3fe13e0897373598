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

#ifndef GROUNDCREW_ALLOCATION_SCHEDULE_VERIFIER_H_
#define GROUNDCREW_ALLOCATION_SCHEDULE_VERIFIER_H_

#include "absl/status/status.h"
#include "absl/types/span.h"
#include "groundcrew/allocation/allocation.pb.h"
#include "groundcrew/allocation/assignment_key.h"
#include "groundcrew/model/domain_model.h"

namespace groundcrew {

// Checks a set of assignments against the staffing rules, independently of
// the model that produced them.
//
// Checked: known flight, service and staff; certification; availability;
// at most the required count per flight service; CommonLevel and MultiFlight
// exclusivity; exclude_services and cross_utilization_limit; and the
// same-flight FlightLevel non-overlap when enabled.
class ScheduleVerifier {
 public:
  ScheduleVerifier(const DomainModel& domain,
                   const AllocationParameters& parameters)
      : domain_(domain), parameters_(parameters) {}

  // Returns an InternalError naming the first violated rule.
  absl::Status Verify(absl::Span<const AssignmentKey> assigned) const;

 private:
  const DomainModel& domain_;
  const AllocationParameters parameters_;
};

}  // namespace groundcrew

#endif  // GROUNDCREW_ALLOCATION_SCHEDULE_VERIFIER_H_
