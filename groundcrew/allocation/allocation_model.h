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

#ifndef GROUNDCREW_ALLOCATION_ALLOCATION_MODEL_H_
#define GROUNDCREW_ALLOCATION_ALLOCATION_MODEL_H_

#include <cstdint>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "groundcrew/allocation/assignment_key.h"
#include "groundcrew/model/clock_time.h"
#include "groundcrew/model/staffing.pb.h"
#include "ortools/sat/cp_model.h"

namespace groundcrew {

// One assignment decision of an AllocationModel.
struct ModelVariable {
  AssignmentId id;
  AssignmentKey key;
  // Refers to AllocationModel::cp_model(). Once the model is built, only its
  // index is used.
  operations_research::sat::BoolVar var;

  int flight_index = -1;
  // Position of the service in the service list of the flight.
  int position = -1;
  int staff_index = -1;

  ServiceClass service_class = SERVICE_CLASS_UNSPECIFIED;
  TimeWindow window;
  int64_t flight_departure = 0;

  // False when the service lies outside every shift of the staff member. The
  // variable is then fixed to false in the model.
  bool available = true;

  int staff_certification_count = 0;
};

// The staffing requirement of one flight service of the model.
struct CoverageRecord {
  std::string flight;
  std::string service;
  int required_count = 1;

  // Indices in AllocationModel::variables() of the candidates.
  std::vector<int> variables;
};

// The decision variables and constraints of one allocation problem, as built
// by ModelBuilder for a time window.
//
// The model does not contain any objective nor hints: both are supplied at
// solve time by the SolverAdapter.
class AllocationModel {
 public:
  AllocationModel(int64_t time_cutoff, bool soft_coverage)
      : time_cutoff_(time_cutoff), soft_coverage_(soft_coverage) {}

  AllocationModel(AllocationModel&&) = default;
  AllocationModel& operator=(AllocationModel&&) = default;

  operations_research::sat::CpModelBuilder& cp_model() { return cp_model_; }
  const operations_research::sat::CpModelBuilder& cp_model() const {
    return cp_model_;
  }

  const std::vector<ModelVariable>& variables() const { return variables_; }
  const std::vector<CoverageRecord>& coverage() const { return coverage_; }

  // Returns the index in variables() of the decision for `key`, or -1 if the
  // key is not part of the model.
  int FindVariable(const AssignmentKey& key) const;
  int FindVariable(AssignmentId id) const;

  int num_variables() const { return static_cast<int>(variables_.size()); }
  int num_constraints() const {
    return cp_model_.Proto().constraints_size();
  }
  int num_flights() const { return num_flights_; }

  // Services of flights departing at or before the cutoff are not modeled.
  int64_t time_cutoff() const { return time_cutoff_; }

  // When true, coverage is an upper bound only and the shortfall of each
  // CoverageRecord is left to the objective.
  bool soft_coverage() const { return soft_coverage_; }

 private:
  friend class ModelBuilder;

  int AddVariable(ModelVariable variable);

  int64_t time_cutoff_;
  bool soft_coverage_;
  int num_flights_ = 0;

  operations_research::sat::CpModelBuilder cp_model_;
  std::vector<ModelVariable> variables_;
  std::vector<CoverageRecord> coverage_;
  absl::flat_hash_map<AssignmentKey, int> variable_index_;
  absl::flat_hash_map<AssignmentId, int> id_index_;
};

}  // namespace groundcrew

#endif  // GROUNDCREW_ALLOCATION_ALLOCATION_MODEL_H_
