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

#include "groundcrew/model/domain_model.h"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "groundcrew/model/clock_time.h"
#include "groundcrew/model/staffing.pb.h"
#include "ortools/base/logging.h"
#include "ortools/base/status_macros.h"

namespace groundcrew {

absl::StatusOr<DomainModel> DomainModel::Create(StaffingProblem problem,
                                                int default_travel_time) {
  if (default_travel_time < 0) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "The default travel time must be non-negative, got %d.",
        default_travel_time));
  }
  DomainModel model(std::move(problem), default_travel_time);
  RETURN_IF_ERROR(model.ValidateAndLoad());
  return model;
}

absl::Status DomainModel::ValidateAndLoad() {
  RETURN_IF_ERROR(LoadServices());
  RETURN_IF_ERROR(LoadBays());
  RETURN_IF_ERROR(LoadFlights());
  RETURN_IF_ERROR(LoadRoster());

  VLOG(1) << "Number of services: " << problem_.services_size();
  VLOG(1) << "Number of flights: " << problem_.flights_size();
  VLOG(1) << "Number of staff members: " << problem_.roster_size();
  VLOG(1) << "Number of bays: " << problem_.bays_size();
  return absl::OkStatus();
}

absl::Status DomainModel::LoadServices() {
  for (int i = 0; i < problem_.services_size(); ++i) {
    const Service& service = problem_.services(i);
    if (service.id().empty()) {
      return absl::InvalidArgumentError(
          absl::StrFormat("The service at position %d has no id.", i));
    }
    if (!service_index_.emplace(service.id(), i).second) {
      return absl::InvalidArgumentError(
          absl::StrFormat("Duplicate service id '%s'.", service.id()));
    }
    if (service.service_class() == SERVICE_CLASS_UNSPECIFIED) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "The service '%s' has no service class.", service.id()));
    }
    if (service.cross_utilization_limit() < 0) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "The service '%s' has a negative cross utilization limit.",
          service.id()));
    }
  }

  for (const Service& service : problem_.services()) {
    for (const std::string& excluded : service.exclude_services()) {
      if (!service_index_.contains(excluded)) {
        return absl::InvalidArgumentError(
            absl::StrFormat("The service '%s' excludes the unknown service "
                            "'%s'.",
                            service.id(), excluded));
      }
    }
  }
  return absl::OkStatus();
}

absl::Status DomainModel::LoadBays() {
  for (int i = 0; i < problem_.bays_size(); ++i) {
    const Bay& bay = problem_.bays(i);
    if (bay.name().empty()) {
      return absl::InvalidArgumentError(
          absl::StrFormat("The bay at position %d has no name.", i));
    }
    if (!bay_index_.emplace(bay.name(), i).second) {
      return absl::InvalidArgumentError(
          absl::StrFormat("Duplicate bay '%s'.", bay.name()));
    }
    for (const auto& [destination, minutes] : bay.travel_minutes()) {
      if (minutes < 0) {
        return absl::InvalidArgumentError(
            absl::StrFormat("Negative travel time from bay '%s' to '%s'.",
                            bay.name(), destination));
      }
    }
  }
  return absl::OkStatus();
}

absl::Status DomainModel::LoadFlights() {
  flights_.clear();
  flights_.reserve(problem_.flights_size());
  for (int f = 0; f < problem_.flights_size(); ++f) {
    const Flight& flight = problem_.flights(f);
    if (flight.number().empty()) {
      return absl::InvalidArgumentError(
          absl::StrFormat("The flight at position %d has no number.", f));
    }
    if (!flight_index_.emplace(flight.number(), f).second) {
      return absl::InvalidArgumentError(
          absl::StrFormat("Duplicate flight number '%s'.", flight.number()));
    }
    if (!bay_index_.empty() && !flight.bay().empty() &&
        !bay_index_.contains(flight.bay())) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "The flight '%s' is parked at the unknown bay '%s'.",
          flight.number(), flight.bay()));
    }

    ResolvedFlight resolved;
    ASSIGN_OR_RETURN(resolved.arrival, ParseClockTime(flight.arrival()));
    ASSIGN_OR_RETURN(resolved.departure, ParseClockTime(flight.departure()));
    if (resolved.arrival > resolved.departure) {
      return absl::InvalidArgumentError(absl::StrFormat(
          "The flight '%s' departs (%s) before it arrives (%s).",
          flight.number(), flight.departure(), flight.arrival()));
    }

    absl::flat_hash_set<std::string> seen_services;
    for (const FlightService& flight_service : flight.services()) {
      if (!service_index_.contains(flight_service.service_id())) {
        return absl::InvalidArgumentError(
            absl::StrFormat("The flight '%s' requires the unknown service "
                            "'%s'.",
                            flight.number(), flight_service.service_id()));
      }
      if (!seen_services.insert(flight_service.service_id()).second) {
        return absl::InvalidArgumentError(absl::StrFormat(
            "The flight '%s' lists the service '%s' more than once.",
            flight.number(), flight_service.service_id()));
      }
      if (flight_service.required_staff_count() < 0) {
        return absl::InvalidArgumentError(absl::StrFormat(
            "The service '%s' of flight '%s' requires a negative number of "
            "staff members.",
            flight_service.service_id(), flight.number()));
      }
      TimeWindow window;
      ASSIGN_OR_RETURN(window.start,
                       ResolveRelativeTime(flight_service.start(),
                                           resolved.arrival,
                                           resolved.departure));
      ASSIGN_OR_RETURN(window.end,
                       ResolveRelativeTime(flight_service.end(),
                                           resolved.arrival,
                                           resolved.departure));
      if (window.start > window.end) {
        return absl::InvalidArgumentError(absl::StrFormat(
            "The service '%s' of flight '%s' ends (%s) before it starts (%s).",
            flight_service.service_id(), flight.number(), flight_service.end(),
            flight_service.start()));
      }
      resolved.service_windows.push_back(window);
    }
    flights_.push_back(std::move(resolved));
  }
  return absl::OkStatus();
}

absl::Status DomainModel::LoadRoster() {
  shifts_.assign(problem_.roster_size(), {});
  certifications_.assign(problem_.roster_size(), {});
  for (int s = 0; s < problem_.roster_size(); ++s) {
    const Staff& staff = problem_.roster(s);
    if (staff.id().empty()) {
      return absl::InvalidArgumentError(
          absl::StrFormat("The staff member at position %d has no id.", s));
    }
    if (!staff_index_.emplace(staff.id(), s).second) {
      return absl::InvalidArgumentError(
          absl::StrFormat("Duplicate staff id '%s'.", staff.id()));
    }
    for (const Shift& shift : staff.shifts()) {
      TimeWindow window;
      ASSIGN_OR_RETURN(window.start, ParseClockTime(shift.start()));
      ASSIGN_OR_RETURN(window.end, ParseClockTime(shift.end()));
      if (window.start > window.end) {
        return absl::InvalidArgumentError(absl::StrFormat(
            "A shift of staff member '%s' ends (%s) before it starts (%s).",
            staff.id(), shift.end(), shift.start()));
      }
      shifts_[s].push_back(window);
    }
    certifications_[s].insert(staff.certifications().begin(),
                              staff.certifications().end());
  }
  return absl::OkStatus();
}

absl::StatusOr<DomainModel> DomainModel::WithUpdates(
    absl::Span<const Flight> updated_flights,
    absl::Span<const Staff> added_staff) const {
  StaffingProblem problem = problem_;
  for (const Flight& flight : updated_flights) {
    const int index = FlightIndex(flight.number());
    if (index < 0) {
      *problem.add_flights() = flight;
    } else {
      *problem.mutable_flights(index) = flight;
    }
  }
  for (const Staff& staff : added_staff) {
    *problem.add_roster() = staff;
  }
  return Create(std::move(problem), default_travel_time_);
}

int DomainModel::FlightIndex(absl::string_view number) const {
  const auto it = flight_index_.find(number);
  return it == flight_index_.end() ? -1 : it->second;
}

int DomainModel::StaffIndex(absl::string_view id) const {
  const auto it = staff_index_.find(id);
  return it == staff_index_.end() ? -1 : it->second;
}

const Service* DomainModel::FindService(absl::string_view id) const {
  const auto it = service_index_.find(id);
  return it == service_index_.end() ? nullptr
                                    : &problem_.services(it->second);
}

int DomainModel::RequiredStaffCount(int flight_index, int position) const {
  const int count =
      problem_.flights(flight_index).services(position).required_staff_count();
  return count == 0 ? 1 : count;
}

const Service& DomainModel::FlightServiceDefinition(int flight_index,
                                                    int position) const {
  const Service* service = FindService(
      problem_.flights(flight_index).services(position).service_id());
  CHECK(service != nullptr);
  return *service;
}

bool DomainModel::CanPerform(int staff_index, const Service& service) const {
  const absl::flat_hash_set<std::string>& held = certifications_[staff_index];
  switch (service.certification_requirement()) {
    case ANY_OF:
      for (const std::string& certification : service.certifications()) {
        if (held.contains(certification)) return true;
      }
      return false;
    case ALL_OF:
    default:
      for (const std::string& certification : service.certifications()) {
        if (!held.contains(certification)) return false;
      }
      return true;
  }
}

bool DomainModel::IsAvailable(int staff_index,
                              const TimeWindow& window) const {
  for (const TimeWindow& shift : shifts_[staff_index]) {
    if (shift.Covers(window)) return true;
  }
  return false;
}

int64_t DomainModel::TravelMinutes(absl::string_view from_bay,
                                   absl::string_view to_bay) const {
  if (from_bay.empty() || to_bay.empty() || from_bay == to_bay) return 0;
  const auto it = bay_index_.find(from_bay);
  if (it == bay_index_.end()) return 0;
  const auto& travel = problem_.bays(it->second).travel_minutes();
  const auto travel_it = travel.find(std::string(to_bay));
  return travel_it == travel.end() ? default_travel_time_ : travel_it->second;
}

}  // namespace groundcrew
