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

#include "groundcrew/allocation/model_builder.h"

#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "groundcrew/allocation/allocation_model.h"
#include "groundcrew/allocation/assignment_key.h"
#include "groundcrew/model/clock_time.h"
#include "groundcrew/model/overlap_detector.h"
#include "groundcrew/model/staffing.pb.h"
#include "ortools/base/logging.h"
#include "ortools/base/status_macros.h"
#include "ortools/base/timer.h"
#include "ortools/sat/cp_model.h"

namespace groundcrew {
namespace {

using ::operations_research::sat::BoolVar;
using ::operations_research::sat::CpModelBuilder;
using ::operations_research::sat::LinearExpr;

bool Excludes(const Service& a, const Service& b) {
  return std::find(a.exclude_services().begin(), a.exclude_services().end(),
                   b.id()) != a.exclude_services().end() ||
         std::find(b.exclude_services().begin(), b.exclude_services().end(),
                   a.id()) != b.exclude_services().end();
}

void AddMutualExclusion(const ModelVariable& a, const ModelVariable& b,
                        CpModelBuilder* cp_model) {
  cp_model->AddBoolOr({a.var.Not(), b.var.Not()});
}

std::vector<BoolVar> Literals(const AllocationModel& model,
                              absl::Span<const int> indices) {
  std::vector<BoolVar> literals;
  literals.reserve(indices.size());
  for (const int index : indices) {
    literals.push_back(model.variables()[index].var);
  }
  return literals;
}

absl::Status CheckIndices(absl::Span<const int> indices, int size,
                          absl::string_view what) {
  absl::flat_hash_set<int> seen;
  for (const int index : indices) {
    if (index < 0 || index >= size) {
      return absl::InvalidArgumentError(
          absl::StrCat("Unknown ", what, " index ", index));
    }
    if (!seen.insert(index).second) {
      return absl::InvalidArgumentError(
          absl::StrCat("Duplicate ", what, " index ", index));
    }
  }
  return absl::OkStatus();
}

}  // namespace

absl::StatusOr<AllocationModel> ModelBuilder::Build(
    absl::Span<const int> flights, absl::Span<const int> roster,
    int64_t time_cutoff,
    const absl::flat_hash_set<std::string>& excluded_services,
    absl::Span<const AssignmentKey> commitments) const {
  WallTimer timer;
  timer.Start();
  RETURN_IF_ERROR(CheckIndices(flights, domain_.num_flights(), "flight"));
  RETURN_IF_ERROR(CheckIndices(roster, domain_.num_staff(), "staff"));

  std::vector<int> window_flights;
  for (const int f : flights) {
    if (domain_.Departure(f) > time_cutoff) window_flights.push_back(f);
  }

  AllocationModel model(time_cutoff, parameters_.coverage_mode() ==
                                         AllocationParameters::SOFT_COVERAGE);
  model.num_flights_ = static_cast<int>(window_flights.size());

  std::vector<StaffVariables> staff_vars(roster.size());
  for (StaffVariables& vars : staff_vars) {
    vars.by_flight.resize(window_flights.size());
  }
  RETURN_IF_ERROR(AddVariablesAndCoverage(window_flights, roster,
                                          excluded_services, &model,
                                          &staff_vars));
  RETURN_IF_ERROR(
      AddCommitments(commitments, roster, staff_vars, time_cutoff, &model));

  std::vector<std::vector<int>> overlapping_flights;
  if (parameters_.enforce_transition_times()) {
    overlapping_flights =
        OverlapDetector(domain_, parameters_.overlap_tolerance_buffer())
            .DetectOverlaps(window_flights);
  }

  for (const StaffVariables& vars : staff_vars) {
    for (const std::vector<int>& flight_vars : vars.by_flight) {
      AddCommonLevelConstraints(flight_vars, &model);
      AddFlightLevelConstraints(flight_vars, &model);
    }
    AddMultiFlightConstraints(vars, &model);
    if (parameters_.enforce_transition_times()) {
      AddTransitionConstraints(vars, overlapping_flights, window_flights,
                               &model);
    }
  }

  VLOG(1) << "Built model after cutoff " << FormatClockTime(time_cutoff)
          << ": " << model.num_flights() << " flights, "
          << model.coverage().size() << " services, "
          << model.num_variables() << " variables, "
          << model.num_constraints() << " constraints in "
          << timer.Get() << "s";
  return model;
}

absl::Status ModelBuilder::AddVariablesAndCoverage(
    absl::Span<const int> flights, absl::Span<const int> roster,
    const absl::flat_hash_set<std::string>& excluded_services,
    AllocationModel* model, std::vector<StaffVariables>* staff_vars) const {
  CpModelBuilder& cp_model = model->cp_model();
  for (int i = 0; i < flights.size(); ++i) {
    const int f = flights[i];
    const Flight& flight = domain_.flight(f);
    for (int pos = 0; pos < flight.services_size(); ++pos) {
      const std::string& service_id = flight.services(pos).service_id();
      const Service* service = domain_.FindService(service_id);
      if (service == nullptr) {
        return absl::InvalidArgumentError(absl::StrCat(
            "Flight ", flight.number(), " references unknown service ",
            service_id));
      }
      if (excluded_services.contains(service->id())) continue;

      CoverageRecord coverage;
      coverage.flight = flight.number();
      coverage.service = service->id();
      coverage.required_count = domain_.RequiredStaffCount(f, pos);
      const TimeWindow window = domain_.ServiceWindow(f, pos);

      for (int r = 0; r < roster.size(); ++r) {
        const int s = roster[r];
        if (!domain_.CanPerform(s, *service)) continue;

        ModelVariable variable;
        variable.key = AssignmentKey(flight.number(), service->id(),
                                     domain_.staff(s).id());
        variable.id = variables_->GetOrCreate(variable.key);
        variable.var = cp_model.NewBoolVar().WithName(
            absl::StrCat("x", variable.key.DebugString()));
        variable.flight_index = f;
        variable.position = pos;
        variable.staff_index = s;
        variable.service_class = service->service_class();
        variable.window = window;
        variable.flight_departure = domain_.Departure(f);
        variable.available = domain_.IsAvailable(s, window);
        variable.staff_certification_count = domain_.NumCertifications(s);

        if (!variable.available) {
          VLOG(2) << variable.key << " is outside the shifts of the staff";
          cp_model.AddEquality(variable.var, 0);
        }
        const bool available = variable.available;
        const int index = model->AddVariable(std::move(variable));
        coverage.variables.push_back(index);
        if (available) (*staff_vars)[r].by_flight[i].push_back(index);
      }

      if (coverage.variables.empty()) {
        return absl::FailedPreconditionError(absl::StrCat(
            "No staff in the roster can perform service ", service->id(),
            " of flight ", flight.number(), " (requires ",
            CertificationRequirement_Name(service->certification_requirement()),
            " of [", absl::StrJoin(service->certifications(), ", "), "])"));
      }

      const LinearExpr assigned =
          LinearExpr::Sum(Literals(*model, coverage.variables));
      if (model->soft_coverage()) {
        cp_model.AddLessOrEqual(assigned, coverage.required_count);
      } else {
        cp_model.AddEquality(assigned, coverage.required_count);
      }
      model->coverage_.push_back(std::move(coverage));
    }
  }
  return absl::OkStatus();
}

absl::Status ModelBuilder::AddCommitments(
    absl::Span<const AssignmentKey> commitments, absl::Span<const int> roster,
    const std::vector<StaffVariables>& staff_vars, int64_t time_cutoff,
    AllocationModel* model) const {
  if (commitments.empty()) return absl::OkStatus();
  absl::flat_hash_map<std::string, int> roster_position;
  for (int r = 0; r < roster.size(); ++r) {
    roster_position[domain_.staff(roster[r]).id()] = r;
  }
  const OverlapDetector detector(domain_,
                                 parameters_.overlap_tolerance_buffer());
  absl::flat_hash_set<int> fixed;
  for (const AssignmentKey& key : commitments) {
    ModelVariable committed;
    committed.key = key;
    committed.flight_index = domain_.FlightIndex(key.flight);
    committed.staff_index = domain_.StaffIndex(key.staff);
    if (committed.flight_index < 0 || committed.staff_index < 0) {
      return absl::InvalidArgumentError(
          absl::StrCat("Unknown flight or staff in kept assignment ",
                       key.DebugString()));
    }
    if (domain_.Departure(committed.flight_index) > time_cutoff) {
      return absl::InvalidArgumentError(
          absl::StrCat("Kept assignment ", key.DebugString(),
                       " departs after the cutoff"));
    }
    const Flight& flight = domain_.flight(committed.flight_index);
    for (int pos = 0; pos < flight.services_size(); ++pos) {
      if (flight.services(pos).service_id() == key.service) {
        committed.position = pos;
        break;
      }
    }
    if (committed.position < 0) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Flight ", key.flight, " has no service ", key.service));
    }
    committed.service_class =
        domain_.FlightServiceDefinition(committed.flight_index,
                                        committed.position)
            .service_class();
    committed.window =
        domain_.ServiceWindow(committed.flight_index, committed.position);

    const auto it = roster_position.find(key.staff);
    if (it == roster_position.end()) continue;
    for (const std::vector<int>& flight_vars :
         staff_vars[it->second].by_flight) {
      for (const int index : flight_vars) {
        const ModelVariable& variable = model->variables()[index];
        if (!IsCommitmentConflict(committed, variable, detector)) continue;
        if (!fixed.insert(index).second) continue;
        VLOG(2) << variable.key << " conflicts with the kept assignment "
                << key;
        model->cp_model().AddEquality(variable.var, 0);
      }
    }
  }
  VLOG(1) << fixed.size() << " decisions fixed by " << commitments.size()
          << " kept assignments";
  return absl::OkStatus();
}

bool ModelBuilder::IsCommitmentConflict(const ModelVariable& committed,
                                        const ModelVariable& variable,
                                        const OverlapDetector& detector) const {
  const bool committed_multi = committed.service_class == MULTI_FLIGHT;
  const bool variable_multi = variable.service_class == MULTI_FLIGHT;
  if (committed_multi && variable_multi) {
    return committed.key.service != variable.key.service;
  }
  if (committed_multi || variable_multi) {
    return committed.window.Overlaps(variable.window);
  }
  return parameters_.enforce_transition_times() &&
         detector.Overlap(committed.flight_index, variable.flight_index) &&
         IsTransitionConflict(committed, variable);
}

void ModelBuilder::AddCommonLevelConstraints(
    const std::vector<int>& flight_vars, AllocationModel* model) const {
  if (flight_vars.size() < 2) return;
  for (const int index : flight_vars) {
    const ModelVariable& variable = model->variables()[index];
    if (variable.service_class != COMMON_LEVEL) continue;
    model->cp_model()
        .AddLessOrEqual(LinearExpr::Sum(Literals(*model, flight_vars)), 1)
        .OnlyEnforceIf(variable.var);
  }
}

void ModelBuilder::AddFlightLevelConstraints(
    const std::vector<int>& flight_vars, AllocationModel* model) const {
  std::vector<int> flight_level;
  for (const int index : flight_vars) {
    if (model->variables()[index].service_class == FLIGHT_LEVEL) {
      flight_level.push_back(index);
    }
  }
  if (flight_level.size() < 2) return;

  CpModelBuilder& cp_model = model->cp_model();
  for (int i = 0; i < flight_level.size(); ++i) {
    const ModelVariable& a = model->variables()[flight_level[i]];
    const Service& service_a =
        domain_.FlightServiceDefinition(a.flight_index, a.position);
    for (int j = i + 1; j < flight_level.size(); ++j) {
      const ModelVariable& b = model->variables()[flight_level[j]];
      const Service& service_b =
          domain_.FlightServiceDefinition(b.flight_index, b.position);
      if (Excludes(service_a, service_b) ||
          (parameters_.enforce_flight_level_non_overlap() &&
           a.window.Overlaps(b.window))) {
        AddMutualExclusion(a, b, &cp_model);
      }
    }

    // With a cross-utilization limit L, the staff member takes at most L
    // FlightLevel services of the flight, among those compatible with this one.
    const int limit = service_a.cross_utilization_limit();
    if (limit <= 0) continue;
    std::vector<int> compatible;
    for (const int index : flight_level) {
      const ModelVariable& other = model->variables()[index];
      if (index == flight_level[i] ||
          !Excludes(service_a, domain_.FlightServiceDefinition(
                                   other.flight_index, other.position))) {
        compatible.push_back(index);
      }
    }
    if (compatible.size() <= limit) continue;
    cp_model
        .AddLessOrEqual(LinearExpr::Sum(Literals(*model, compatible)), limit)
        .OnlyEnforceIf(a.var);
  }
}

void ModelBuilder::AddMultiFlightConstraints(const StaffVariables& staff_vars,
                                             AllocationModel* model) const {
  // MultiFlight variables grouped by service identity, in order of appearance.
  std::vector<std::pair<std::string, std::vector<int>>> identities;
  absl::flat_hash_map<std::string, int> identity_index;
  std::vector<int> others;
  for (const std::vector<int>& flight_vars : staff_vars.by_flight) {
    for (const int index : flight_vars) {
      const ModelVariable& variable = model->variables()[index];
      if (variable.service_class != MULTI_FLIGHT) {
        others.push_back(index);
        continue;
      }
      const auto [it, inserted] = identity_index.try_emplace(
          variable.key.service, static_cast<int>(identities.size()));
      if (inserted) identities.push_back({variable.key.service, {}});
      identities[it->second].second.push_back(index);
    }
  }
  if (identities.empty()) return;

  CpModelBuilder& cp_model = model->cp_model();
  const std::string& staff_id =
      model->variables()[identities.front().second.front()].key.staff;
  if (identities.size() > 1) {
    std::vector<BoolVar> in_use;
    for (const auto& [service, indices] : identities) {
      const BoolVar uses = cp_model.NewBoolVar().WithName(
          absl::StrCat("uses_", service, "_", staff_id));
      const std::vector<BoolVar> literals = Literals(*model, indices);
      for (const BoolVar& literal : literals) {
        cp_model.AddImplication(literal, uses);
      }
      cp_model.AddBoolOr(literals).OnlyEnforceIf(uses);
      in_use.push_back(uses);
    }
    cp_model.AddAtMostOne(in_use);
  }

  for (const auto& [service, indices] : identities) {
    for (const int m : indices) {
      const ModelVariable& multi = model->variables()[m];
      for (const int o : others) {
        const ModelVariable& other = model->variables()[o];
        if (other.flight_index == multi.flight_index ||
            other.window.Overlaps(multi.window)) {
          AddMutualExclusion(multi, other, &cp_model);
        }
      }
    }
  }
}

void ModelBuilder::AddTransitionConstraints(
    const StaffVariables& staff_vars,
    const std::vector<std::vector<int>>& overlapping_flights,
    absl::Span<const int> flights, AllocationModel* model) const {
  for (int i = 0; i < flights.size(); ++i) {
    for (const int j : overlapping_flights[i]) {
      for (const int a_index : staff_vars.by_flight[i]) {
        const ModelVariable& a = model->variables()[a_index];
        if (a.service_class == MULTI_FLIGHT) continue;
        for (const int b_index : staff_vars.by_flight[j]) {
          const ModelVariable& b = model->variables()[b_index];
          if (b.service_class == MULTI_FLIGHT) continue;
          if (IsTransitionConflict(a, b)) {
            AddMutualExclusion(a, b, &model->cp_model());
          }
        }
      }
    }
  }
}

bool ModelBuilder::IsTransitionConflict(const ModelVariable& a,
                                        const ModelVariable& b) const {
  const std::string& bay_a = domain_.flight(a.flight_index).bay();
  const std::string& bay_b = domain_.flight(b.flight_index).bay();
  const int64_t buffer = parameters_.overlap_tolerance_buffer();
  const bool a_then_b =
      a.window.end + domain_.TravelMinutes(bay_a, bay_b) <=
      b.window.start + buffer;
  const bool b_then_a =
      b.window.end + domain_.TravelMinutes(bay_b, bay_a) <=
      a.window.start + buffer;
  const bool conflict = !a_then_b && !b_then_a;
  if (conflict) {
    VLOG(2) << "Transition conflict between " << a.key << " and " << b.key;
  }
  return conflict;
}

}  // namespace groundcrew
