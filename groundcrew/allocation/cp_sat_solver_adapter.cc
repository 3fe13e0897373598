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

#include "groundcrew/allocation/cp_sat_solver_adapter.h"

#include <cstdint>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/time/time.h"
#include "google/protobuf/text_format.h"
#include "groundcrew/allocation/allocation.pb.h"
#include "groundcrew/allocation/allocation_model.h"
#include "groundcrew/allocation/assignment_key.h"
#include "ortools/base/logging.h"
#include "ortools/base/timer.h"
#include "ortools/sat/cp_model.h"
#include "ortools/sat/cp_model.pb.h"
#include "ortools/sat/sat_parameters.pb.h"

namespace groundcrew {

using ::operations_research::sat::CpModelProto;
using ::operations_research::sat::CpSolverResponse;
using ::operations_research::sat::CpSolverStatus;
using ::operations_research::sat::SatParameters;

CpModelProto CpSatSolverAdapter::BuildSolverModel(
    const AllocationModel& model, const AssignmentValues& hints,
    AllocationParameters::Objective objective) const {
  CpModelProto proto = model.cp_model().Proto();

  // Objective, as offset + sum(coeffs[i] * variables[i]).
  std::vector<int64_t> coeffs(model.num_variables(), 0);
  int64_t offset = 0;
  const int64_t uncovered_weight = parameters_.uncovered_service_weight();
  for (const CoverageRecord& coverage : model.coverage()) {
    offset += uncovered_weight * coverage.required_count;
    for (const int index : coverage.variables) {
      coeffs[index] -= uncovered_weight;
    }
  }
  for (int i = 0; i < model.num_variables(); ++i) {
    coeffs[i] += model.variables()[i].staff_certification_count;
  }

  int num_hints = 0;
  for (int i = 0; i < model.num_variables(); ++i) {
    const ModelVariable& variable = model.variables()[i];
    const auto it = hints.find(variable.id);
    if (it == hints.end()) continue;
    ++num_hints;
    proto.mutable_solution_hint()->add_vars(variable.var.index());
    proto.mutable_solution_hint()->add_values(it->second ? 1 : 0);
    if (it->second && objective == AllocationParameters::WEIGHTED_CONTINUITY) {
      offset += parameters_.continuity_weight();
      coeffs[i] -= parameters_.continuity_weight();
    }
  }

  operations_research::sat::CpObjectiveProto* const cp_objective =
      proto.mutable_objective();
  for (int i = 0; i < model.num_variables(); ++i) {
    if (coeffs[i] == 0) continue;
    cp_objective->add_vars(model.variables()[i].var.index());
    cp_objective->add_coeffs(coeffs[i]);
  }
  cp_objective->set_offset(static_cast<double>(offset));
  VLOG(1) << "Objective " << AllocationParameters::Objective_Name(objective)
          << " over " << cp_objective->vars_size() << " terms, " << num_hints
          << " hints";
  return proto;
}

SolveResult CpSatSolverAdapter::Solve(const AllocationModel& model,
                                      const AssignmentValues& hints,
                                      AllocationParameters::Objective objective,
                                      absl::Duration time_budget) {
  SolveResult result;
  SatParameters sat_parameters;
  sat_parameters.set_max_time_in_seconds(
      absl::ToDoubleSeconds(time_budget));
  sat_parameters.set_num_workers(parameters_.num_workers());
  sat_parameters.set_log_search_progress(parameters_.log_search_progress());
  sat_parameters.set_random_seed(parameters_.random_seed());
  if (!google::protobuf::TextFormat::MergeFromString(
          parameters_.sat_parameters(), &sat_parameters)) {
    result.status = SolveResult::Status::kError;
    result.message = absl::StrCat("Cannot parse sat_parameters: ",
                                  parameters_.sat_parameters());
    return result;
  }

  WallTimer timer;
  timer.Start();
  const CpModelProto proto = BuildSolverModel(model, hints, objective);
  const CpSolverResponse response =
      operations_research::sat::SolveWithParameters(proto, sat_parameters);
  VLOG(2) << operations_research::sat::CpSolverResponseStats(response);

  switch (response.status()) {
    case CpSolverStatus::OPTIMAL:
      result.status = SolveResult::Status::kOptimal;
      break;
    case CpSolverStatus::FEASIBLE:
      result.status = SolveResult::Status::kFeasible;
      result.timed_out = true;
      break;
    case CpSolverStatus::INFEASIBLE:
      result.status = SolveResult::Status::kInfeasible;
      result.message = "The allocation model is infeasible";
      break;
    case CpSolverStatus::UNKNOWN:
      result.status = SolveResult::Status::kInfeasible;
      result.timed_out = true;
      result.message = absl::StrCat("No solution found within ",
                                    absl::FormatDuration(time_budget));
      break;
    default:
      result.status = SolveResult::Status::kError;
      result.message = absl::StrCat(
          "CP-SAT returned ", CpSolverStatus_Name(response.status()));
      break;
  }

  if (result.has_solution()) {
    result.objective_value = response.objective_value();
    result.assignments.reserve(model.num_variables());
    for (const ModelVariable& variable : model.variables()) {
      result.assignments[variable.id] =
          operations_research::sat::SolutionBooleanValue(response,
                                                         variable.var);
    }
  }
  VLOG(1) << "CP-SAT " << SolveStatusName(result.status) << " in "
          << timer.Get() << "s, objective " << result.objective_value;
  return result;
}

}  // namespace groundcrew
