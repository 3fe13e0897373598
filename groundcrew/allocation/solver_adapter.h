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

#ifndef GROUNDCREW_ALLOCATION_SOLVER_ADAPTER_H_
#define GROUNDCREW_ALLOCATION_SOLVER_ADAPTER_H_

#include <string>

#include "absl/time/time.h"
#include "groundcrew/allocation/allocation.pb.h"
#include "groundcrew/allocation/allocation_model.h"
#include "groundcrew/allocation/assignment_key.h"

namespace groundcrew {

struct SolveResult {
  enum class Status { kOptimal, kFeasible, kInfeasible, kError };

  Status status = Status::kError;

  // Set with kInfeasible when the time budget ran out before any solution was
  // found, and with kFeasible when it ran out before optimality was proven.
  bool timed_out = false;

  // The value of every decision of the model, by ModelVariable::id. Empty
  // without a solution.
  AssignmentValues assignments;

  double objective_value = 0.0;
  std::string message;

  bool has_solution() const {
    return status == Status::kOptimal || status == Status::kFeasible;
  }
};

std::string SolveStatusName(SolveResult::Status status);

// The solving service used by the engine. Hints are non-binding: they may
// guide the search and are rewarded by the WEIGHTED_CONTINUITY objective, but
// the solver is free to override them.
class SolverAdapter {
 public:
  virtual ~SolverAdapter() = default;

  // Solves `model`. Hints are keyed by ModelVariable::id, and a hint whose id
  // is not in the model is ignored. The call returns once `time_budget` is
  // exhausted at the latest.
  virtual SolveResult Solve(const AllocationModel& model,
                            const AssignmentValues& hints,
                            AllocationParameters::Objective objective,
                            absl::Duration time_budget) = 0;
};

}  // namespace groundcrew

#endif  // GROUNDCREW_ALLOCATION_SOLVER_ADAPTER_H_
