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

// Staffs a day of operations, then replays a sequence of disruptions on it.
// Each step prints the committed assignments, and the final schedule can be
// exported as a ScheduleSnapshot.
//
// Example usage:
// ./groundcrew_allocate --problem=groundcrew/testdata/day.textproto
//     --disruptions=groundcrew/testdata/disruptions.textproto
//     --params="time_budget_seconds: 5 num_workers: 4"

#include <cstdlib>
#include <string>

#include "absl/flags/flag.h"
#include "absl/strings/str_cat.h"
#include "google/protobuf/text_format.h"
#include "groundcrew/allocation/allocation.pb.h"
#include "groundcrew/allocation/cp_sat_solver_adapter.h"
#include "groundcrew/allocation/incremental_engine.h"
#include "groundcrew/allocation/schedule_store.h"
#include "groundcrew/model/clock_time.h"
#include "groundcrew/model/domain_model.h"
#include "groundcrew/model/staffing.pb.h"
#include "ortools/base/file.h"
#include "ortools/base/init_google.h"
#include "ortools/base/logging.h"
#include "ortools/base/timer.h"

ABSL_FLAG(std::string, problem, "",
          "Input file containing a StaffingProblem in text format.");
ABSL_FLAG(std::string, disruptions, "",
          "Optional input file containing a DisruptionSequence in text format, "
          "applied in order after the baseline.");
ABSL_FLAG(std::string, params, "",
          "AllocationParameters in text format.");
ABSL_FLAG(std::string, snapshot_out, "",
          "If not empty, the final schedule is written there as a "
          "ScheduleSnapshot in text format.");

namespace groundcrew {
namespace {

void PrintResult(const AllocationResult& result) {
  LOG(INFO) << AllocationStatus_Name(result.status()) << " version "
            << result.schedule_version() << " at cutoff "
            << FormatClockTime(result.cutoff()) << ": "
            << result.num_variables() << " variables, "
            << result.num_constraints() << " constraints, "
            << result.num_hints_kept() << "/" << result.num_hints()
            << " hints kept, " << result.num_uncovered() << " uncovered";
  if (!result.message().empty()) LOG(INFO) << "  " << result.message();
  std::string flight;
  for (const AssignmentProto& assignment : result.assignments()) {
    if (assignment.flight() != flight) {
      flight = assignment.flight();
      LOG(INFO) << "  Flight " << flight << " (departs "
                << FormatClockTime(assignment.flight_departure()) << ")";
    }
    LOG(INFO) << "    " << assignment.service() << ": " << assignment.staff();
  }
}

}  // namespace

int Main() {
  AllocationParameters parameters;
  if (!google::protobuf::TextFormat::ParseFromString(
          absl::GetFlag(FLAGS_params), &parameters)) {
    LOG(ERROR) << "Cannot parse --params: " << absl::GetFlag(FLAGS_params);
    return EXIT_FAILURE;
  }

  StaffingProblem problem;
  const absl::Status read_status = file::GetTextProto(
      absl::GetFlag(FLAGS_problem), &problem, file::Defaults());
  if (!read_status.ok()) {
    LOG(ERROR) << read_status.message();
    return EXIT_FAILURE;
  }
  DisruptionSequence disruptions;
  if (!absl::GetFlag(FLAGS_disruptions).empty()) {
    const absl::Status status = file::GetTextProto(
        absl::GetFlag(FLAGS_disruptions), &disruptions, file::Defaults());
    if (!status.ok()) {
      LOG(ERROR) << status.message();
      return EXIT_FAILURE;
    }
  }

  absl::StatusOr<DomainModel> domain =
      DomainModel::Create(problem, parameters.default_travel_time());
  if (!domain.ok()) {
    LOG(ERROR) << "Invalid problem: " << domain.status().message();
    return EXIT_FAILURE;
  }

  WallTimer timer;
  timer.Start();
  CpSatSolverAdapter solver(parameters);
  ScheduleStore store;
  IncrementalUpdateEngine engine(*std::move(domain), parameters, &solver,
                                 &store);
  AllocationResult result = engine.SolveBaseline();
  PrintResult(result);
  if (result.status() != COMMITTED) return EXIT_FAILURE;

  for (const DisruptionEvent& event : disruptions.events()) {
    result = engine.ApplyDisruption(event);
    PrintResult(result);
  }
  LOG(INFO) << "Final schedule version " << store.version() << " in "
            << timer.GetDuration();

  if (!absl::GetFlag(FLAGS_snapshot_out).empty()) {
    const absl::Status status =
        file::SetTextProto(absl::GetFlag(FLAGS_snapshot_out),
                           store.ExportSnapshot(), file::Defaults());
    if (!status.ok()) {
      LOG(ERROR) << status.message();
      return EXIT_FAILURE;
    }
  }
  return EXIT_SUCCESS;
}

}  // namespace groundcrew

int main(int argc, char** argv) {
  InitGoogle(argv[0], &argc, &argv, true);
  return groundcrew::Main();
}
