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

#ifndef GROUNDCREW_MODEL_OVERLAP_DETECTOR_H_
#define GROUNDCREW_MODEL_OVERLAP_DETECTOR_H_

#include <cstdint>
#include <vector>

#include "absl/types/span.h"
#include "groundcrew/model/clock_time.h"
#include "groundcrew/model/domain_model.h"

namespace groundcrew {

// Finds the pairs of flights whose ground operations are close enough in time
// for one staff member to be asked to work on both, taking the travel time
// between their bays into account.
//
// Only the non-MULTI_FLIGHT services are considered: a MULTI_FLIGHT service is
// designed to span several flights. The result is used to restrict the
// transition constraints to the flight pairs where they can matter.
class OverlapDetector {
 public:
  // `buffer_minutes` is the overlap tolerated between two consecutive
  // assignments once the travel time is accounted for.
  OverlapDetector(const DomainModel& domain, int64_t buffer_minutes)
      : domain_(domain), buffer_minutes_(buffer_minutes) {}

  // Returns, for each position i of `flights`, the positions (in `flights`)
  // of the flights arriving later that overlap with flights[i].
  std::vector<std::vector<int>> DetectOverlaps(
      absl::Span<const int> flights) const;

  // Returns true if one staff member cannot work both flights, whichever
  // arrives first.
  bool Overlap(int flight_a, int flight_b) const;

  // The span of the non-MULTI_FLIGHT services of a flight, or
  // [arrival, departure) when the flight has none.
  TimeWindow OperationsWindow(int flight_index) const;

 private:
  bool HasTemporalConflict(int earlier_flight, int later_flight) const;

  const DomainModel& domain_;
  const int64_t buffer_minutes_;
};

}  // namespace groundcrew

#endif  // GROUNDCREW_MODEL_OVERLAP_DETECTOR_H_
