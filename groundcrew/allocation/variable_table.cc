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

#include "groundcrew/allocation/variable_table.h"

#include "groundcrew/allocation/assignment_key.h"

namespace groundcrew {

AssignmentId VariableTable::GetOrCreate(const AssignmentKey& key) {
  const auto [it, inserted] = ids_.try_emplace(key, AssignmentId(size()));
  if (inserted) keys_.push_back(key);
  return it->second;
}

AssignmentId VariableTable::Find(const AssignmentKey& key) const {
  const auto it = ids_.find(key);
  return it == ids_.end() ? kNoAssignment : it->second;
}

}  // namespace groundcrew
