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

#include "groundcrew/allocation/allocation_model.h"

#include <utility>

#include "groundcrew/allocation/assignment_key.h"
#include "ortools/base/logging.h"

namespace groundcrew {

int AllocationModel::FindVariable(const AssignmentKey& key) const {
  const auto it = variable_index_.find(key);
  return it == variable_index_.end() ? -1 : it->second;
}

int AllocationModel::FindVariable(AssignmentId id) const {
  const auto it = id_index_.find(id);
  return it == id_index_.end() ? -1 : it->second;
}

int AllocationModel::AddVariable(ModelVariable variable) {
  const int index = num_variables();
  const bool inserted = variable_index_.emplace(variable.key, index).second;
  CHECK(inserted) << "Duplicate decision " << variable.key;
  id_index_.emplace(variable.id, index);
  variables_.push_back(std::move(variable));
  return index;
}

}  // namespace groundcrew
