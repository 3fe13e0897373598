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

#include "groundcrew/model/overlap_detector.h"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <numeric>
#include <vector>

#include "absl/types/span.h"
#include "groundcrew/model/clock_time.h"
#include "groundcrew/model/domain_model.h"
#include "groundcrew/model/staffing.pb.h"
#include "ortools/base/logging.h"

namespace groundcrew {

TimeWindow OverlapDetector::OperationsWindow(int flight_index) const {
  TimeWindow window{std::numeric_limits<int64_t>::max(),
                    std::numeric_limits<int64_t>::min()};
  bool found = false;
  const Flight& flight = domain_.flight(flight_index);
  for (int p = 0; p < flight.services_size(); ++p) {
    const Service& service = domain_.FlightServiceDefinition(flight_index, p);
    if (service.service_class() == MULTI_FLIGHT) continue;
    const TimeWindow service_window = domain_.ServiceWindow(flight_index, p);
    window.start = std::min(window.start, service_window.start);
    window.end = std::max(window.end, service_window.end);
    found = true;
  }
  if (!found) {
    window.start = domain_.Arrival(flight_index);
    window.end = domain_.Departure(flight_index);
  }
  return window;
}

bool OverlapDetector::HasTemporalConflict(int earlier_flight,
                                          int later_flight) const {
  const int64_t travel =
      domain_.TravelMinutes(domain_.flight(earlier_flight).bay(),
                            domain_.flight(later_flight).bay());
  const int64_t required_gap = std::max<int64_t>(travel - buffer_minutes_, 0);
  const bool conflict = OperationsWindow(earlier_flight).end + required_gap >
                        OperationsWindow(later_flight).start;
  if (conflict) {
    VLOG(2) << "Flight " << domain_.flight(earlier_flight).number()
            << " overlaps flight " << domain_.flight(later_flight).number()
            << " (required gap " << required_gap << " min)";
  }
  return conflict;
}

bool OverlapDetector::Overlap(int flight_a, int flight_b) const {
  if (domain_.Arrival(flight_b) < domain_.Arrival(flight_a)) {
    return HasTemporalConflict(flight_b, flight_a);
  }
  return HasTemporalConflict(flight_a, flight_b);
}

std::vector<std::vector<int>> OverlapDetector::DetectOverlaps(
    absl::Span<const int> flights) const {
  std::vector<int> order(flights.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&](int a, int b) {
    return domain_.Arrival(flights[a]) < domain_.Arrival(flights[b]);
  });

  std::vector<std::vector<int>> overlaps(flights.size());
  for (int i = 0; i < order.size(); ++i) {
    for (int j = i + 1; j < order.size(); ++j) {
      if (!HasTemporalConflict(flights[order[i]], flights[order[j]])) break;
      overlaps[order[i]].push_back(order[j]);
    }
  }
  return overlaps;
}

}  // namespace groundcrew
