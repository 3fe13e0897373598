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

#ifndef GROUNDCREW_ALLOCATION_CP_SAT_SOLVER_ADAPTER_H_
#define GROUNDCREW_ALLOCATION_CP_SAT_SOLVER_ADAPTER_H_

#include "absl/time/time.h"
#include "groundcrew/allocation/allocation.pb.h"
#include "groundcrew/allocation/allocation_model.h"
#include "groundcrew/allocation/assignment_key.h"
#include "groundcrew/allocation/solver_adapter.h"
#include "ortools/sat/cp_model.pb.h"

namespace groundcrew {

// Solves allocation models with CP-SAT.
//
// The objective is minimized. Each uncovered staff position costs
// uncovered_service_weight, and each assignment costs the number of
// certifications of the staff member, so that specialists are used before
// versatile staff. WEIGHTED_CONTINUITY adds continuity_weight for every hint
// set to true that the solution does not keep.
class CpSatSolverAdapter : public SolverAdapter {
 public:
  explicit CpSatSolverAdapter(const AllocationParameters& parameters)
      : parameters_(parameters) {}

  SolveResult Solve(const AllocationModel& model, const AssignmentValues& hints,
                    AllocationParameters::Objective objective,
                    absl::Duration time_budget) override;

  // Returns the CP-SAT model that Solve() runs, objective and hints included.
  operations_research::sat::CpModelProto BuildSolverModel(
      const AllocationModel& model, const AssignmentValues& hints,
      AllocationParameters::Objective objective) const;

 private:
  const AllocationParameters parameters_;
};

}  // namespace groundcrew

#endif  // GROUNDCREW_ALLOCATION_CP_SAT_SOLVER_ADAPTER_H_
