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

#ifndef GROUNDCREW_ALLOCATION_VARIABLE_TABLE_H_
#define GROUNDCREW_ALLOCATION_VARIABLE_TABLE_H_

#include "absl/container/flat_hash_map.h"
#include "groundcrew/allocation/assignment_key.h"
#include "ortools/base/strong_vector.h"

namespace groundcrew {

// Arena of assignment keys.
//
// Every key gets a dense AssignmentId the first time it is seen, and keeps it
// for the lifetime of the table. A table shared by successive model builds
// therefore gives the same identity to the variables of a key that persists
// from one schedule version to the next.
class VariableTable {
 public:
  VariableTable() = default;

  // This type is neither copyable nor movable.
  VariableTable(const VariableTable&) = delete;
  VariableTable& operator=(const VariableTable&) = delete;

  AssignmentId GetOrCreate(const AssignmentKey& key);

  // Returns kNoAssignment if the key was never seen.
  AssignmentId Find(const AssignmentKey& key) const;

  const AssignmentKey& key(AssignmentId id) const { return keys_[id]; }

  int size() const { return static_cast<int>(keys_.size()); }

  static constexpr AssignmentId kNoAssignment = AssignmentId(-1);

 private:
  absl::flat_hash_map<AssignmentKey, AssignmentId> ids_;
  util_intops::StrongVector<AssignmentId, AssignmentKey> keys_;
};

}  // namespace groundcrew

#endif  // GROUNDCREW_ALLOCATION_VARIABLE_TABLE_H_
