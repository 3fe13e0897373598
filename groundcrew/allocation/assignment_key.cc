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

#include "groundcrew/allocation/assignment_key.h"

#include <ostream>
#include <string>

#include "absl/strings/str_cat.h"

namespace groundcrew {

std::string AssignmentKey::DebugString() const {
  return absl::StrCat("(", flight, ", ", service, ", ", staff, ")");
}

std::ostream& operator<<(std::ostream& out, const AssignmentKey& key) {
  return out << key.DebugString();
}

}  // namespace groundcrew
