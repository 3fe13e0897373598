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

// The re-optimization protocol of a day of operations.
//
// SolveBaseline() staffs the whole day once. Each disruption then rebuilds a
// model restricted to the flights departing after the current time, minus the
// flights, services and staff members invalidated so far, and solves it with
// the current schedule as hints. The assignments of departed flights are
// never touched, and bind the staff members holding them in the new model. A
// solution is verified together with those kept assignments, then committed
// with the current time as cutoff. On any failure the schedule store and the
// invalidations are left unchanged.

#ifndef GROUNDCREW_ALLOCATION_INCREMENTAL_ENGINE_H_
#define GROUNDCREW_ALLOCATION_INCREMENTAL_ENGINE_H_

#include <cstdint>
#include <memory>
#include <string>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_set.h"
#include "absl/synchronization/mutex.h"
#include "groundcrew/allocation/allocation.pb.h"
#include "groundcrew/allocation/schedule_store.h"
#include "groundcrew/allocation/solver_adapter.h"
#include "groundcrew/allocation/variable_table.h"
#include "groundcrew/model/domain_model.h"
#include "groundcrew/model/staffing.pb.h"

namespace groundcrew {

class IncrementalUpdateEngine {
 public:
  // Does not take ownership of `solver` nor `store`, which must outlive the
  // engine.
  IncrementalUpdateEngine(DomainModel domain,
                          const AllocationParameters& parameters,
                          SolverAdapter* solver, ScheduleStore* store);

  // This type is neither copyable nor movable.
  IncrementalUpdateEngine(const IncrementalUpdateEngine&) = delete;
  IncrementalUpdateEngine& operator=(const IncrementalUpdateEngine&) = delete;

  // Staffs every flight of the day, without hints. Fails with MODEL_INVALID
  // once a disruption has been committed.
  AllocationResult SolveBaseline() ABSL_LOCKS_EXCLUDED(mutex_);

  // Re-optimizes the future work after `event`. Concurrent calls are
  // serialized.
  AllocationResult ApplyDisruption(const DisruptionEvent& event)
      ABSL_LOCKS_EXCLUDED(mutex_);

  // The reference data of the last committed update.
  std::shared_ptr<const DomainModel> domain() const ABSL_LOCKS_EXCLUDED(mutex_);

 private:
  struct Invalidation {
    absl::flat_hash_set<std::string> flights;
    absl::flat_hash_set<std::string> services;
    absl::flat_hash_set<std::string> staff;

    // Flights whose times or services changed. They stay in the model but
    // their previous assignments are not used as hints.
    absl::flat_hash_set<std::string> updated_flights;
  };

  AllocationResult Reoptimize(std::shared_ptr<const DomainModel> domain,
                              int64_t cutoff, const Invalidation& invalid)
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

  const AllocationParameters parameters_;
  SolverAdapter* const solver_;
  ScheduleStore* const store_;

  mutable absl::Mutex mutex_;
  std::shared_ptr<const DomainModel> domain_ ABSL_GUARDED_BY(mutex_);
  // The invalidations of the committed disruptions.
  Invalidation invalidated_ ABSL_GUARDED_BY(mutex_);
  VariableTable variables_ ABSL_GUARDED_BY(mutex_);
};

}  // namespace groundcrew

#endif  // GROUNDCREW_ALLOCATION_INCREMENTAL_ENGINE_H_
