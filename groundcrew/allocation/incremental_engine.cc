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

#include "groundcrew/allocation/incremental_engine.h"

#include <algorithm>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "groundcrew/allocation/allocation.pb.h"
#include "groundcrew/allocation/allocation_model.h"
#include "groundcrew/allocation/assignment_key.h"
#include "groundcrew/allocation/model_builder.h"
#include "groundcrew/allocation/schedule_store.h"
#include "groundcrew/allocation/schedule_verifier.h"
#include "groundcrew/allocation/solver_adapter.h"
#include "groundcrew/allocation/variable_table.h"
#include "groundcrew/model/clock_time.h"
#include "groundcrew/model/domain_model.h"
#include "groundcrew/model/staffing.pb.h"
#include "ortools/base/logging.h"
#include "ortools/base/timer.h"

namespace groundcrew {
namespace {

AllocationResult Failure(AllocationStatus status, absl::string_view message,
                         AllocationResult result = AllocationResult()) {
  result.set_status(status);
  result.set_message(std::string(message));
  LOG(WARNING) << AllocationStatus_Name(status) << ": " << message;
  return result;
}

}  // namespace

IncrementalUpdateEngine::IncrementalUpdateEngine(
    DomainModel domain, const AllocationParameters& parameters,
    SolverAdapter* solver, ScheduleStore* store)
    : parameters_(parameters),
      solver_(solver),
      store_(store),
      domain_(std::make_shared<const DomainModel>(std::move(domain))) {
  CHECK(solver_ != nullptr);
  CHECK(store_ != nullptr);
}

std::shared_ptr<const DomainModel> IncrementalUpdateEngine::domain() const {
  absl::MutexLock lock(&mutex_);
  return domain_;
}

AllocationResult IncrementalUpdateEngine::SolveBaseline() {
  absl::MutexLock lock(&mutex_);
  if (store_->cutoff() > kStartOfDayCutoff) {
    return Failure(MODEL_INVALID,
                   absl::StrCat("The schedule was already updated at ",
                                FormatClockTime(store_->cutoff()),
                                ", cannot solve the baseline again"));
  }
  LOG(INFO) << "Solving the baseline of " << domain_->num_flights()
            << " flights with " << domain_->num_staff() << " staff members";
  return Reoptimize(domain_, kStartOfDayCutoff, Invalidation());
}

AllocationResult IncrementalUpdateEngine::ApplyDisruption(
    const DisruptionEvent& event) {
  absl::MutexLock lock(&mutex_);
  const absl::StatusOr<int64_t> current_time =
      ParseClockTime(event.current_time());
  if (!current_time.ok()) {
    return Failure(MODEL_INVALID, current_time.status().message());
  }
  if (*current_time < store_->cutoff()) {
    return Failure(MODEL_INVALID,
                   absl::StrCat("Disruption at ", event.current_time(),
                                " is before the last update at ",
                                FormatClockTime(store_->cutoff())));
  }
  for (const Flight& flight : event.updated_flights()) {
    const int index = domain_->FlightIndex(flight.number());
    if (index >= 0 && domain_->Departure(index) <= *current_time) {
      return Failure(MODEL_INVALID,
                     absl::StrCat("Flight ", flight.number(),
                                  " has already departed and cannot change"));
    }
  }

  const std::vector<Flight> updated_flights(event.updated_flights().begin(),
                                            event.updated_flights().end());
  const std::vector<Staff> added_staff(event.added_staff().begin(),
                                       event.added_staff().end());
  absl::StatusOr<DomainModel> updated =
      domain_->WithUpdates(updated_flights, added_staff);
  if (!updated.ok()) {
    return Failure(MODEL_INVALID, updated.status().message());
  }
  auto domain = std::make_shared<const DomainModel>(*std::move(updated));

  // Invalidations of earlier events stay in force. An updated flight is
  // reinstated unless the event also invalidates it.
  Invalidation invalid = invalidated_;
  for (const Flight& flight : event.updated_flights()) {
    const int index = domain->FlightIndex(flight.number());
    if (domain->Departure(index) <= *current_time) {
      return Failure(MODEL_INVALID,
                     absl::StrCat("Updated flight ", flight.number(),
                                  " departs before ", event.current_time()));
    }
    invalid.flights.erase(flight.number());
    invalid.updated_flights.insert(flight.number());
  }
  invalid.flights.insert(event.invalid_flights().begin(),
                         event.invalid_flights().end());
  invalid.services.insert(event.invalid_services().begin(),
                          event.invalid_services().end());
  invalid.staff.insert(event.invalid_staff().begin(),
                       event.invalid_staff().end());
  for (const std::string& number : event.invalid_flights()) {
    if (domain->FlightIndex(number) < 0) {
      LOG(WARNING) << "Ignoring unknown invalid flight " << number;
    }
  }
  for (const std::string& id : event.invalid_services()) {
    if (domain->FindService(id) == nullptr) {
      LOG(WARNING) << "Ignoring unknown invalid service " << id;
    }
  }
  for (const std::string& id : event.invalid_staff()) {
    if (domain->StaffIndex(id) < 0) {
      LOG(WARNING) << "Ignoring unknown invalid staff " << id;
    }
  }

  LOG(INFO) << "Disruption at " << event.current_time() << ": "
            << invalid.flights.size() << " invalid flights, "
            << invalid.services.size() << " invalid services, "
            << invalid.staff.size() << " invalid staff, "
            << invalid.updated_flights.size() << " updated flights, "
            << event.added_staff_size() << " added staff";
  AllocationResult result = Reoptimize(domain, *current_time, invalid);
  if (result.status() == COMMITTED) {
    domain_ = std::move(domain);
    invalidated_ = std::move(invalid);
    invalidated_.updated_flights.clear();
  }
  return result;
}

AllocationResult IncrementalUpdateEngine::Reoptimize(
    std::shared_ptr<const DomainModel> domain, int64_t cutoff,
    const Invalidation& invalid) {
  WallTimer timer;
  timer.Start();
  AllocationResult result;
  result.set_cutoff(cutoff);
  result.set_schedule_version(store_->version());

  std::vector<int> flights;
  for (int f = 0; f < domain->num_flights(); ++f) {
    if (domain->Departure(f) <= cutoff) continue;
    if (invalid.flights.contains(domain->flight(f).number())) continue;
    flights.push_back(f);
  }
  std::vector<int> roster;
  for (int s = 0; s < domain->num_staff(); ++s) {
    if (!invalid.staff.contains(domain->staff(s).id())) roster.push_back(s);
  }

  // The assignments of departed flights are kept, and bind the staff members
  // holding them.
  const std::shared_ptr<const ScheduleVersion> current = store_->Snapshot();
  std::vector<AssignmentKey> kept;
  for (const auto& [key, value] : current->entries()) {
    if (value.assigned && value.flight_departure <= cutoff) kept.push_back(key);
  }
  std::sort(kept.begin(), kept.end());

  const ModelBuilder builder(domain.get(), parameters_, &variables_);
  absl::StatusOr<AllocationModel> model =
      builder.Build(flights, roster, cutoff, invalid.services, kept);
  if (!model.ok()) {
    return Failure(absl::IsFailedPrecondition(model.status())
                       ? MODEL_BUILD_ERROR
                       : MODEL_INVALID,
                   model.status().message(), std::move(result));
  }
  result.set_num_flights(model->num_flights());
  result.set_num_variables(model->num_variables());
  result.set_num_constraints(model->num_constraints());

  // Only the assignments of the current version can be hints.
  AssignmentValues hints;
  for (const auto& [key, value] : current->entries()) {
    if (!value.assigned || value.flight_departure <= cutoff) continue;
    if (invalid.flights.contains(key.flight) ||
        invalid.services.contains(key.service) ||
        invalid.staff.contains(key.staff) ||
        invalid.updated_flights.contains(key.flight)) {
      continue;
    }
    const AssignmentId id = variables_.Find(key);
    if (id == VariableTable::kNoAssignment || model->FindVariable(id) < 0) {
      continue;
    }
    hints[id] = true;
  }
  result.set_num_hints(static_cast<int>(hints.size()));

  const SolveResult solved =
      solver_->Solve(*model, hints, parameters_.objective(),
                     absl::Seconds(parameters_.time_budget_seconds()));
  switch (solved.status) {
    case SolveResult::Status::kInfeasible:
      return Failure(solved.timed_out ? TIMEOUT : INFEASIBLE, solved.message,
                     std::move(result));
    case SolveResult::Status::kError:
      return Failure(SOLVER_ERROR, solved.message, std::move(result));
    case SolveResult::Status::kOptimal:
    case SolveResult::Status::kFeasible:
      break;
  }

  std::vector<ScheduleEntry> entries;
  entries.reserve(model->num_variables());
  std::vector<const ModelVariable*> assigned;
  for (const ModelVariable& variable : model->variables()) {
    const auto it = solved.assignments.find(variable.id);
    if (it == solved.assignments.end()) {
      return Failure(SOLVER_ERROR,
                     absl::StrCat("The solution has no value for ",
                                  variables_.key(variable.id).DebugString()),
                     std::move(result));
    }
    entries.push_back({variable.key, it->second, variable.flight_departure});
    if (it->second) assigned.push_back(&variable);
  }
  std::sort(assigned.begin(), assigned.end(),
            [](const ModelVariable* a, const ModelVariable* b) {
              return a->key < b->key;
            });

  // The new assignments are checked together with the kept ones.
  std::vector<AssignmentKey> schedule = kept;
  schedule.reserve(kept.size() + assigned.size());
  for (const ModelVariable* variable : assigned) {
    schedule.push_back(variable->key);
  }
  const absl::Status verified =
      ScheduleVerifier(*domain, parameters_).Verify(schedule);
  if (!verified.ok()) {
    return Failure(SOLVER_ERROR,
                   absl::StrCat("Rejected solution: ", verified.message()),
                   std::move(result));
  }

  int num_uncovered = 0;
  for (const CoverageRecord& coverage : model->coverage()) {
    int staffed = 0;
    for (const int index : coverage.variables) {
      if (solved.assignments.at(model->variables()[index].id)) ++staffed;
    }
    if (staffed < coverage.required_count) ++num_uncovered;
  }
  int num_hints_kept = 0;
  for (const auto& [id, unused] : hints) {
    if (solved.assignments.at(id)) ++num_hints_kept;
  }

  const absl::StatusOr<int64_t> version = store_->Commit(entries, cutoff);
  if (!version.ok()) {
    return Failure(SOLVER_ERROR, version.status().message(),
                   std::move(result));
  }

  result.set_status(COMMITTED);
  result.set_schedule_version(*version);
  result.set_num_uncovered(num_uncovered);
  result.set_num_hints_kept(num_hints_kept);
  result.set_optimal(solved.status == SolveResult::Status::kOptimal);
  for (const ModelVariable* variable : assigned) {
    AssignmentProto* const assignment = result.add_assignments();
    assignment->set_flight(variable->key.flight);
    assignment->set_service(variable->key.service);
    assignment->set_staff(variable->key.staff);
    assignment->set_assigned(true);
    assignment->set_flight_departure(variable->flight_departure);
  }
  result.set_wall_time_seconds(timer.Get());
  LOG(INFO) << "Committed version " << *version << " at cutoff "
            << FormatClockTime(cutoff) << ": " << result.num_flights()
            << " flights, " << assigned.size() << " assignments, "
            << num_uncovered << " uncovered services, " << num_hints_kept
            << "/" << hints.size() << " hints kept ("
            << SolveStatusName(solved.status) << ", " << timer.Get() << "s)";
  return result;
}

}  // namespace groundcrew
