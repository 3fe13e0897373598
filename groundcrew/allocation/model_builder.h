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

// Translation of flights and a roster into a CP-SAT assignment model.
//
// There is one boolean decision per (flight, service, staff) triple where the
// staff member meets the certification requirement of the service. The
// constraints are:
//   - coverage: each flight service gets at most (exactly, with
//     HARD_COVERAGE) its required number of staff members.
//   - CommonLevel: a CommonLevel assignment is the only assignment of the
//     staff member on that flight.
//   - MultiFlight: a staff member performs at most one MultiFlight service in
//     the window, possibly on many flights, and nothing else on those flights
//     nor at overlapping times.
//   - FlightLevel: exclude_services pairs and cross_utilization_limit, and
//     optionally no temporal overlap on the same flight.
//   - transitions: two services of a staff member on flights at different
//     bays must leave room for the travel between them.
//   - availability: services outside every shift of a staff member are
//     fixed to false.
//   - kept assignments: decisions that a staff member could not combine with
//     an assignment kept from a flight outside the window, under the
//     MultiFlight and transition rules, are fixed to false.

#ifndef GROUNDCREW_ALLOCATION_MODEL_BUILDER_H_
#define GROUNDCREW_ALLOCATION_MODEL_BUILDER_H_

#include <cstdint>
#include <string>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "groundcrew/allocation/allocation.pb.h"
#include "groundcrew/allocation/allocation_model.h"
#include "groundcrew/allocation/assignment_key.h"
#include "groundcrew/allocation/variable_table.h"
#include "groundcrew/model/domain_model.h"
#include "groundcrew/model/overlap_detector.h"

namespace groundcrew {

class ModelBuilder {
 public:
  // Does not take ownership of `domain` nor `variables`, which must outlive
  // the builder. `variables` is usually shared by all the builds of a day so
  // that a key keeps its AssignmentId from one schedule version to the next.
  ModelBuilder(const DomainModel* domain,
               const AllocationParameters& parameters,
               VariableTable* variables)
      : domain_(*domain), parameters_(parameters), variables_(variables) {}

  // Builds the model of the services of `flights` (indices in the domain)
  // that depart strictly after `time_cutoff`, staffed from `roster` (indices
  // in the domain). Services whose id is in `excluded_services` are dropped.
  //
  // `commitments` are the assignments kept from flights departing at or
  // before `time_cutoff`. They are not decisions of the model, but restrict
  // the decisions of their staff member.
  //
  // Returns a FailedPreconditionError when a service of the window has no
  // roster member meeting its certification requirement, and an
  // InvalidArgumentError when a commitment is unknown or inside the window.
  absl::StatusOr<AllocationModel> Build(
      absl::Span<const int> flights, absl::Span<const int> roster,
      int64_t time_cutoff,
      const absl::flat_hash_set<std::string>& excluded_services = {},
      absl::Span<const AssignmentKey> commitments = {}) const;

 private:
  // The variables of one staff member, grouped by flight. Indices are in
  // AllocationModel::variables().
  struct StaffVariables {
    std::vector<std::vector<int>> by_flight;
  };

  absl::Status AddVariablesAndCoverage(
      absl::Span<const int> flights, absl::Span<const int> roster,
      const absl::flat_hash_set<std::string>& excluded_services,
      AllocationModel* model, std::vector<StaffVariables>* staff_vars) const;

  void AddCommonLevelConstraints(const std::vector<int>& flight_vars,
                                 AllocationModel* model) const;
  void AddFlightLevelConstraints(const std::vector<int>& flight_vars,
                                 AllocationModel* model) const;
  void AddMultiFlightConstraints(const StaffVariables& staff_vars,
                                 AllocationModel* model) const;
  void AddTransitionConstraints(
      const StaffVariables& staff_vars,
      const std::vector<std::vector<int>>& overlapping_flights,
      absl::Span<const int> flights, AllocationModel* model) const;

  absl::Status AddCommitments(absl::Span<const AssignmentKey> commitments,
                              absl::Span<const int> roster,
                              const std::vector<StaffVariables>& staff_vars,
                              int64_t time_cutoff,
                              AllocationModel* model) const;

  // Returns true if a staff member holding `committed` cannot also take
  // `variable`.
  bool IsCommitmentConflict(const ModelVariable& committed,
                            const ModelVariable& variable,
                            const OverlapDetector& detector) const;

  // Returns true if a single staff member cannot perform both services, given
  // the travel time between their bays.
  bool IsTransitionConflict(const ModelVariable& a,
                            const ModelVariable& b) const;

  const DomainModel& domain_;
  const AllocationParameters parameters_;
  VariableTable* variables_;
};

}  // namespace groundcrew

#endif  // GROUNDCREW_ALLOCATION_MODEL_BUILDER_H_
