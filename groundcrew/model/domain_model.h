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

#ifndef GROUNDCREW_MODEL_DOMAIN_MODEL_H_
#define GROUNDCREW_MODEL_DOMAIN_MODEL_H_

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "groundcrew/model/clock_time.h"
#include "groundcrew/model/staffing.pb.h"

// Read-only reference data of one solving pass.
//
// A DomainModel is built from a StaffingProblem (flight manifest, service
// catalog, staff roster and bays), validates it once and precomputes all the
// absolute times the constraint model needs: flight arrival and departure,
// the window of every flight service, and the shifts of every staff member.
//
// Flights and staff members are addressed by their position in the problem,
// services by their catalog id. The object is never modified once created;
// changes of the reference data (delays, staff called in) produce a new
// DomainModel through WithUpdates().

namespace groundcrew {

class DomainModel {
 public:
  // Validates `problem` and resolves all its times. `default_travel_time` is
  // the travel time, in minutes, between two distinct bays that have no
  // explicit entry.
  static absl::StatusOr<DomainModel> Create(StaffingProblem problem,
                                            int default_travel_time);

  DomainModel(DomainModel&&) = default;
  DomainModel& operator=(DomainModel&&) = default;

  // Returns a new model where every flight of `updated_flights` replaces the
  // flight with the same number (or is appended when the number is new), and
  // where `added_staff` joins the roster.
  absl::StatusOr<DomainModel> WithUpdates(
      absl::Span<const Flight> updated_flights,
      absl::Span<const Staff> added_staff) const;

  const StaffingProblem& problem() const { return problem_; }

  int num_flights() const { return problem_.flights_size(); }
  int num_staff() const { return problem_.roster_size(); }
  const Flight& flight(int flight_index) const {
    return problem_.flights(flight_index);
  }
  const Staff& staff(int staff_index) const {
    return problem_.roster(staff_index);
  }

  // Lookups by identifier. Return -1 or nullptr when unknown.
  int FlightIndex(absl::string_view number) const;
  int StaffIndex(absl::string_view id) const;
  const Service* FindService(absl::string_view id) const;

  int64_t Arrival(int flight_index) const {
    return flights_[flight_index].arrival;
  }
  int64_t Departure(int flight_index) const {
    return flights_[flight_index].departure;
  }

  // The absolute window of the `position`-th service of a flight.
  TimeWindow ServiceWindow(int flight_index, int position) const {
    return flights_[flight_index].service_windows[position];
  }

  // The number of staff members the `position`-th service of a flight needs.
  int RequiredStaffCount(int flight_index, int position) const;

  // Returns the catalog entry of the `position`-th service of a flight.
  const Service& FlightServiceDefinition(int flight_index, int position) const;

  // Returns true iff the staff member meets the certification requirement of
  // the service.
  bool CanPerform(int staff_index, const Service& service) const;

  // Returns true iff one shift of the staff member fully covers `window`.
  bool IsAvailable(int staff_index, const TimeWindow& window) const;

  int NumCertifications(int staff_index) const {
    return static_cast<int>(certifications_[staff_index].size());
  }

  // Travel time in minutes between two bays. Zero when the bays are the same
  // or when one of them is not known.
  int64_t TravelMinutes(absl::string_view from_bay,
                        absl::string_view to_bay) const;

  int default_travel_time() const { return default_travel_time_; }

 private:
  struct ResolvedFlight {
    int64_t arrival = 0;
    int64_t departure = 0;
    std::vector<TimeWindow> service_windows;
  };

  DomainModel(StaffingProblem problem, int default_travel_time)
      : problem_(std::move(problem)),
        default_travel_time_(default_travel_time) {}

  absl::Status ValidateAndLoad();
  absl::Status LoadServices();
  absl::Status LoadBays();
  absl::Status LoadFlights();
  absl::Status LoadRoster();

  StaffingProblem problem_;
  int default_travel_time_;

  absl::flat_hash_map<std::string, int> service_index_;
  absl::flat_hash_map<std::string, int> flight_index_;
  absl::flat_hash_map<std::string, int> staff_index_;
  absl::flat_hash_map<std::string, int> bay_index_;

  std::vector<ResolvedFlight> flights_;
  std::vector<std::vector<TimeWindow>> shifts_;
  std::vector<absl::flat_hash_set<std::string>> certifications_;
};

}  // namespace groundcrew

#endif  // GROUNDCREW_MODEL_DOMAIN_MODEL_H_
