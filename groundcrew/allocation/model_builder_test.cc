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

#include "groundcrew/allocation/model_builder.h"

#include <algorithm>
#include <cstdint>
#include <memory>
#include <numeric>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "groundcrew/allocation/allocation.pb.h"
#include "groundcrew/allocation/allocation_model.h"
#include "groundcrew/allocation/assignment_key.h"
#include "groundcrew/allocation/cp_sat_solver_adapter.h"
#include "groundcrew/allocation/solver_adapter.h"
#include "groundcrew/allocation/variable_table.h"
#include "groundcrew/model/clock_time.h"
#include "groundcrew/model/domain_model.h"
#include "groundcrew/model/staffing.pb.h"
#include "ortools/base/parse_text_proto.h"

namespace groundcrew {
namespace {

using ::google::protobuf::contrib::parse_proto::ParseTextOrDie;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

class ModelBuilderTest : public ::testing::Test {
 protected:
  ModelBuilderTest() { parameters_.set_num_workers(1); }

  void Load(absl::string_view problem_text) {
    absl::StatusOr<DomainModel> domain = DomainModel::Create(
        ParseTextOrDie<StaffingProblem>(problem_text),
        parameters_.default_travel_time());
    ASSERT_TRUE(domain.ok()) << domain.status();
    domain_ = std::make_unique<DomainModel>(*std::move(domain));
  }

  // Builds the model of all the flights with the whole roster.
  absl::StatusOr<AllocationModel> BuildAll(
      int64_t cutoff = kStartOfDayCutoff,
      const absl::flat_hash_set<std::string>& excluded_services = {}) {
    std::vector<int> flights(domain_->num_flights());
    std::iota(flights.begin(), flights.end(), 0);
    std::vector<int> roster(domain_->num_staff());
    std::iota(roster.begin(), roster.end(), 0);
    return ModelBuilder(domain_.get(), parameters_, &variables_)
        .Build(flights, roster, cutoff, excluded_services);
  }

  SolveResult Solve(const AllocationModel& model) {
    CpSatSolverAdapter solver(parameters_);
    return solver.Solve(model, {}, AllocationParameters::MINIMIZE_UNCOVERED,
                        absl::Seconds(10));
  }

  std::vector<AssignmentKey> Assigned(const SolveResult& result) const {
    std::vector<AssignmentKey> keys;
    for (const auto& [id, value] : result.assignments) {
      if (value) keys.push_back(variables_.key(id));
    }
    std::sort(keys.begin(), keys.end());
    return keys;
  }

  static std::vector<AssignmentKey> Keys(const AllocationModel& model) {
    std::vector<AssignmentKey> keys;
    for (const ModelVariable& variable : model.variables()) {
      keys.push_back(variable.key);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
  }

  AllocationParameters parameters_;
  VariableTable variables_;
  std::unique_ptr<DomainModel> domain_;
};

// Staff A holds both certifications, B can only clean toilets.
constexpr absl::string_view kRefuelingProblem = R"pb(
  services {
    id: "refuel"
    certifications: "refueling"
    service_class: COMMON_LEVEL
  }
  services {
    id: "toilet"
    certifications: "toilet"
    service_class: FLIGHT_LEVEL
  }
  flights {
    number: "F1"
    arrival: "08:00"
    departure: "09:00"
    services { service_id: "refuel" start: "A+10" end: "D-10" }
    services { service_id: "toilet" start: "A+10" end: "A+30" }
  }
  roster {
    id: "A"
    certifications: "refueling"
    certifications: "toilet"
    shifts { start: "06:00" end: "14:00" }
  }
  roster {
    id: "B"
    certifications: "toilet"
    shifts { start: "06:00" end: "14:00" }
  }
)pb";

TEST_F(ModelBuilderTest, EmptyWindowIsTriviallySolvable) {
  Load(kRefuelingProblem);
  const absl::StatusOr<AllocationModel> model =
      ModelBuilder(domain_.get(), parameters_, &variables_)
          .Build({}, {0, 1}, kStartOfDayCutoff);
  ASSERT_TRUE(model.ok()) << model.status();
  EXPECT_EQ(model->num_variables(), 0);
  EXPECT_EQ(model->num_flights(), 0);
  const SolveResult result = Solve(*model);
  EXPECT_EQ(result.status, SolveResult::Status::kOptimal);
  EXPECT_THAT(result.assignments, IsEmpty());
}

TEST_F(ModelBuilderTest, OnlyCertifiedTriplesAreMaterialized) {
  Load(kRefuelingProblem);
  const absl::StatusOr<AllocationModel> model = BuildAll();
  ASSERT_TRUE(model.ok()) << model.status();
  EXPECT_THAT(Keys(*model), ElementsAre(AssignmentKey("F1", "refuel", "A"),
                                        AssignmentKey("F1", "toilet", "A"),
                                        AssignmentKey("F1", "toilet", "B")));
  ASSERT_EQ(model->coverage().size(), 2);
  EXPECT_EQ(model->coverage()[0].service, "refuel");
  EXPECT_EQ(model->coverage()[0].variables.size(), 1);
  EXPECT_EQ(model->FindVariable(AssignmentKey("F1", "refuel", "B")), -1);
}

TEST_F(ModelBuilderTest, CommonLevelForcesAnotherStaffMember) {
  Load(kRefuelingProblem);
  const absl::StatusOr<AllocationModel> model = BuildAll();
  ASSERT_TRUE(model.ok()) << model.status();
  const SolveResult result = Solve(*model);
  ASSERT_TRUE(result.has_solution()) << result.message;
  EXPECT_THAT(Assigned(result),
              ElementsAre(AssignmentKey("F1", "refuel", "A"),
                          AssignmentKey("F1", "toilet", "B")));
}

TEST_F(ModelBuilderTest, CommonLevelAloneIsInfeasible) {
  Load(kRefuelingProblem);
  const absl::StatusOr<AllocationModel> model =
      ModelBuilder(domain_.get(), parameters_, &variables_)
          .Build({0}, {domain_->StaffIndex("A")}, kStartOfDayCutoff);
  ASSERT_TRUE(model.ok()) << model.status();
  const SolveResult result = Solve(*model);
  EXPECT_EQ(result.status, SolveResult::Status::kInfeasible);
  EXPECT_FALSE(result.timed_out);
}

TEST_F(ModelBuilderTest, MissingCertificationIsABuildError) {
  Load(kRefuelingProblem);
  const absl::StatusOr<AllocationModel> model =
      ModelBuilder(domain_.get(), parameters_, &variables_)
          .Build({0}, {domain_->StaffIndex("B")}, kStartOfDayCutoff);
  EXPECT_EQ(model.status().code(), absl::StatusCode::kFailedPrecondition);
  EXPECT_THAT(model.status().message(), HasSubstr("refuel"));
}

TEST_F(ModelBuilderTest, ExcludedServicesGenerateNoCoverage) {
  Load(kRefuelingProblem);
  const absl::StatusOr<AllocationModel> model =
      ModelBuilder(domain_.get(), parameters_, &variables_)
          .Build({0}, {domain_->StaffIndex("B")}, kStartOfDayCutoff,
                 {"refuel"});
  ASSERT_TRUE(model.ok()) << model.status();
  EXPECT_THAT(Keys(*model), ElementsAre(AssignmentKey("F1", "toilet", "B")));
  ASSERT_EQ(model->coverage().size(), 1);
}

TEST_F(ModelBuilderTest, FlightsDepartingBeforeTheCutoffAreSkipped) {
  Load(R"pb(
    services { id: "bags" service_class: FLIGHT_LEVEL }
    flights {
      number: "F1"
      arrival: "08:00"
      departure: "09:00"
      services { service_id: "bags" start: "A" end: "D" }
    }
    flights {
      number: "F2"
      arrival: "10:00"
      departure: "11:00"
      services { service_id: "bags" start: "A" end: "D" }
    }
    roster {
      id: "S1"
      shifts { start: "06:00" end: "14:00" }
    }
  )pb");
  // Departing exactly at the cutoff counts as past.
  const absl::StatusOr<AllocationModel> model =
      BuildAll(*ParseClockTime("09:00"));
  ASSERT_TRUE(model.ok()) << model.status();
  EXPECT_EQ(model->num_flights(), 1);
  EXPECT_THAT(Keys(*model), ElementsAre(AssignmentKey("F2", "bags", "S1")));
  EXPECT_EQ(model->time_cutoff(), 540);
}

TEST_F(ModelBuilderTest, KeysKeepTheirIdAcrossBuilds) {
  Load(kRefuelingProblem);
  const absl::StatusOr<AllocationModel> first = BuildAll();
  ASSERT_TRUE(first.ok()) << first.status();
  const absl::StatusOr<AllocationModel> second =
      ModelBuilder(domain_.get(), parameters_, &variables_)
          .Build({0}, {domain_->StaffIndex("B"), domain_->StaffIndex("A")},
                 kStartOfDayCutoff);
  ASSERT_TRUE(second.ok()) << second.status();
  for (const ModelVariable& variable : second->variables()) {
    const int index = first->FindVariable(variable.key);
    ASSERT_NE(index, -1);
    EXPECT_EQ(first->variables()[index].id, variable.id);
  }
  EXPECT_EQ(variables_.size(), 3);
}

// GPU is performed by one staff member across the overlapping F1 and F2.
constexpr absl::string_view kGpuProblem = R"pb(
  services {
    id: "gpu"
    certifications: "gpu"
    service_class: MULTI_FLIGHT
  }
  services {
    id: "water"
    certifications: "water"
    service_class: MULTI_FLIGHT
  }
  services {
    id: "bags"
    certifications: "bags"
    service_class: FLIGHT_LEVEL
  }
  flights {
    number: "F1"
    arrival: "08:00"
    departure: "09:00"
    services { service_id: "gpu" start: "A" end: "D" }
    services { service_id: "bags" start: "A+5" end: "A+35" }
  }
  flights {
    number: "F2"
    arrival: "08:15"
    departure: "09:15"
    services { service_id: "gpu" start: "A" end: "D" }
  }
  roster {
    id: "M1"
    certifications: "gpu"
    certifications: "bags"
    shifts { start: "06:00" end: "14:00" }
  }
  roster {
    id: "B1"
    certifications: "bags"
    shifts { start: "06:00" end: "14:00" }
  }
)pb";

TEST_F(ModelBuilderTest, MultiFlightServiceAcrossOverlappingFlights) {
  Load(kGpuProblem);
  const absl::StatusOr<AllocationModel> model = BuildAll();
  ASSERT_TRUE(model.ok()) << model.status();
  const SolveResult result = Solve(*model);
  ASSERT_TRUE(result.has_solution()) << result.message;
  EXPECT_THAT(Assigned(result), ElementsAre(AssignmentKey("F1", "bags", "B1"),
                                            AssignmentKey("F1", "gpu", "M1"),
                                            AssignmentKey("F2", "gpu", "M1")));
}

TEST_F(ModelBuilderTest, MultiFlightExcludesOtherServicesOfTheFlight) {
  Load(kGpuProblem);
  const absl::StatusOr<AllocationModel> model =
      ModelBuilder(domain_.get(), parameters_, &variables_)
          .Build({0, 1}, {domain_->StaffIndex("M1")}, kStartOfDayCutoff);
  ASSERT_TRUE(model.ok()) << model.status();
  EXPECT_EQ(Solve(*model).status, SolveResult::Status::kInfeasible);
}

TEST_F(ModelBuilderTest, AtMostOneMultiFlightIdentityPerStaffMember) {
  Load(kGpuProblem);
  StaffingProblem problem = domain_->problem();
  problem.mutable_flights(1)->mutable_services(0)->set_service_id("water");
  problem.mutable_roster(0)->add_certifications("water");
  absl::StatusOr<DomainModel> domain = DomainModel::Create(problem, 5);
  ASSERT_TRUE(domain.ok()) << domain.status();
  domain_ = std::make_unique<DomainModel>(*std::move(domain));

  // M1 is the only one able to do gpu on F1 and water on F2.
  const absl::StatusOr<AllocationModel> model = BuildAll();
  ASSERT_TRUE(model.ok()) << model.status();
  EXPECT_EQ(Solve(*model).status, SolveResult::Status::kInfeasible);
}

TEST_F(ModelBuilderTest, KeptMultiFlightServiceBindsTheWindow) {
  Load(kGpuProblem);
  const ModelBuilder builder(domain_.get(), parameters_, &variables_);
  const int m1 = domain_->StaffIndex("M1");
  // F1 departs at 09:00, only F2 is in the window.
  const absl::StatusOr<AllocationModel> same_identity =
      builder.Build({1}, {m1}, 540, {}, {AssignmentKey("F1", "gpu", "M1")});
  ASSERT_TRUE(same_identity.ok()) << same_identity.status();
  const SolveResult result = Solve(*same_identity);
  ASSERT_TRUE(result.has_solution()) << result.message;
  EXPECT_THAT(Assigned(result), ElementsAre(AssignmentKey("F2", "gpu", "M1")));

  // Bags on F1 ends at 08:35, after gpu on F2 starts.
  const absl::StatusOr<AllocationModel> overlapping =
      builder.Build({1}, {m1}, 540, {}, {AssignmentKey("F1", "bags", "M1")});
  ASSERT_TRUE(overlapping.ok()) << overlapping.status();
  EXPECT_EQ(Solve(*overlapping).status, SolveResult::Status::kInfeasible);

  // Kept assignments of staff members outside the roster are ignored.
  const absl::StatusOr<AllocationModel> other_staff =
      builder.Build({1}, {m1}, 540, {}, {AssignmentKey("F1", "bags", "B1")});
  ASSERT_TRUE(other_staff.ok()) << other_staff.status();
  EXPECT_TRUE(Solve(*other_staff).has_solution());
}

TEST_F(ModelBuilderTest, KeptMultiFlightIdentity) {
  Load(kGpuProblem);
  StaffingProblem problem = domain_->problem();
  problem.mutable_flights(1)->mutable_services(0)->set_service_id("water");
  problem.mutable_roster(0)->add_certifications("water");
  absl::StatusOr<DomainModel> domain = DomainModel::Create(problem, 5);
  ASSERT_TRUE(domain.ok()) << domain.status();
  domain_ = std::make_unique<DomainModel>(*std::move(domain));

  // M1 already holds gpu and is the only one able to do water on F2.
  const absl::StatusOr<AllocationModel> model =
      ModelBuilder(domain_.get(), parameters_, &variables_)
          .Build({1}, {0, 1}, 540, {}, {AssignmentKey("F1", "gpu", "M1")});
  ASSERT_TRUE(model.ok()) << model.status();
  EXPECT_EQ(Solve(*model).status, SolveResult::Status::kInfeasible);
}

TEST_F(ModelBuilderTest, InvalidKeptAssignments) {
  Load(kGpuProblem);
  const ModelBuilder builder(domain_.get(), parameters_, &variables_);
  EXPECT_EQ(
      builder.Build({1}, {0}, 540, {}, {AssignmentKey("F9", "gpu", "M1")})
          .status()
          .code(),
      absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(
      builder.Build({1}, {0}, 540, {}, {AssignmentKey("F1", "pca", "M1")})
          .status()
          .code(),
      absl::StatusCode::kInvalidArgument);
  // F2 is inside the window.
  EXPECT_EQ(
      builder.Build({1}, {0}, 540, {}, {AssignmentKey("F2", "gpu", "M1")})
          .status()
          .code(),
      absl::StatusCode::kInvalidArgument);
}

TEST_F(ModelBuilderTest, RequiredStaffCountAboveOne) {
  Load(R"pb(
    services {
      id: "cabin"
      certifications: "cabin"
      service_class: FLIGHT_LEVEL
    }
    flights {
      number: "F1"
      arrival: "08:00"
      departure: "09:00"
      services {
        service_id: "cabin"
        required_staff_count: 2
        start: "A"
        end: "D"
      }
    }
    roster {
      id: "S1"
      certifications: "cabin"
      shifts { start: "06:00" end: "14:00" }
    }
    roster {
      id: "S2"
      certifications: "cabin"
      shifts { start: "06:00" end: "14:00" }
    }
    roster {
      id: "S3"
      certifications: "cabin"
      certifications: "bags"
      shifts { start: "06:00" end: "14:00" }
    }
  )pb");
  const absl::StatusOr<AllocationModel> model = BuildAll();
  ASSERT_TRUE(model.ok()) << model.status();
  EXPECT_EQ(model->coverage()[0].required_count, 2);
  const SolveResult result = Solve(*model);
  ASSERT_TRUE(result.has_solution()) << result.message;
  // The two specialists are preferred over S3.
  EXPECT_THAT(Assigned(result),
              ElementsAre(AssignmentKey("F1", "cabin", "S1"),
                          AssignmentKey("F1", "cabin", "S2")));
}

TEST_F(ModelBuilderTest, ServicesOutsideShiftsAreFixedFalse) {
  Load(R"pb(
    services { id: "bags" service_class: FLIGHT_LEVEL }
    flights {
      number: "F1"
      arrival: "08:00"
      departure: "09:00"
      services { service_id: "bags" start: "A" end: "D" }
    }
    roster {
      id: "EARLY"
      shifts { start: "04:00" end: "08:30" }
    }
    roster {
      id: "DAY"
      certifications: "spare"
      shifts { start: "07:00" end: "15:00" }
    }
  )pb");
  const absl::StatusOr<AllocationModel> model = BuildAll();
  ASSERT_TRUE(model.ok()) << model.status();
  const int early = model->FindVariable(AssignmentKey("F1", "bags", "EARLY"));
  ASSERT_NE(early, -1);
  EXPECT_FALSE(model->variables()[early].available);

  const SolveResult result = Solve(*model);
  ASSERT_TRUE(result.has_solution()) << result.message;
  // DAY holds more certifications, but EARLY is not available.
  EXPECT_THAT(Assigned(result),
              ElementsAre(AssignmentKey("F1", "bags", "DAY")));
}

constexpr absl::string_view kFlightLevelProblem = R"pb(
  services {
    id: "bags"
    certifications: "ramp"
    service_class: FLIGHT_LEVEL
    cross_utilization_limit: 1
  }
  services {
    id: "cargo"
    certifications: "ramp"
    service_class: FLIGHT_LEVEL
  }
  services {
    id: "water"
    certifications: "water"
    service_class: FLIGHT_LEVEL
    exclude_services: "lavatory"
  }
  services {
    id: "lavatory"
    certifications: "water"
    service_class: FLIGHT_LEVEL
  }
  flights {
    number: "F1"
    arrival: "08:00"
    departure: "09:00"
    services { service_id: "bags" start: "A" end: "A+20" }
    services { service_id: "cargo" start: "A+20" end: "A+40" }
  }
  flights {
    number: "F2"
    arrival: "12:00"
    departure: "13:00"
    services { service_id: "water" start: "A" end: "A+20" }
    services { service_id: "lavatory" start: "A+20" end: "A+40" }
  }
  roster {
    id: "R1"
    certifications: "ramp"
    certifications: "water"
    shifts { start: "06:00" end: "14:00" }
  }
)pb";

TEST_F(ModelBuilderTest, CrossUtilizationLimit) {
  Load(kFlightLevelProblem);
  const absl::StatusOr<AllocationModel> limited =
      ModelBuilder(domain_.get(), parameters_, &variables_)
          .Build({0}, {0}, kStartOfDayCutoff);
  ASSERT_TRUE(limited.ok()) << limited.status();
  EXPECT_EQ(Solve(*limited).status, SolveResult::Status::kInfeasible);

  StaffingProblem problem = domain_->problem();
  problem.mutable_services(0)->set_cross_utilization_limit(2);
  absl::StatusOr<DomainModel> domain = DomainModel::Create(problem, 5);
  ASSERT_TRUE(domain.ok()) << domain.status();
  domain_ = std::make_unique<DomainModel>(*std::move(domain));
  const absl::StatusOr<AllocationModel> relaxed =
      ModelBuilder(domain_.get(), parameters_, &variables_)
          .Build({0}, {0}, kStartOfDayCutoff);
  ASSERT_TRUE(relaxed.ok()) << relaxed.status();
  EXPECT_THAT(Assigned(Solve(*relaxed)),
              ElementsAre(AssignmentKey("F1", "bags", "R1"),
                          AssignmentKey("F1", "cargo", "R1")));
}

TEST_F(ModelBuilderTest, ExcludedServicePairs) {
  Load(kFlightLevelProblem);
  const absl::StatusOr<AllocationModel> model =
      ModelBuilder(domain_.get(), parameters_, &variables_)
          .Build({1}, {0}, kStartOfDayCutoff);
  ASSERT_TRUE(model.ok()) << model.status();
  EXPECT_EQ(Solve(*model).status, SolveResult::Status::kInfeasible);

  parameters_.set_coverage_mode(AllocationParameters::SOFT_COVERAGE);
  const absl::StatusOr<AllocationModel> soft =
      ModelBuilder(domain_.get(), parameters_, &variables_)
          .Build({1}, {0}, kStartOfDayCutoff);
  ASSERT_TRUE(soft.ok()) << soft.status();
  EXPECT_TRUE(soft->soft_coverage());
  const SolveResult result = Solve(*soft);
  ASSERT_EQ(result.status, SolveResult::Status::kOptimal);
  EXPECT_EQ(Assigned(result).size(), 1);
}

TEST_F(ModelBuilderTest, FlightLevelNonOverlapIsOptional) {
  Load(R"pb(
    services { id: "bags" service_class: FLIGHT_LEVEL }
    services { id: "cargo" service_class: FLIGHT_LEVEL }
    flights {
      number: "F1"
      arrival: "08:00"
      departure: "09:00"
      services { service_id: "bags" start: "A" end: "A+30" }
      services { service_id: "cargo" start: "A+10" end: "A+40" }
    }
    roster {
      id: "R1"
      shifts { start: "06:00" end: "14:00" }
    }
  )pb");
  const absl::StatusOr<AllocationModel> concurrent = BuildAll();
  ASSERT_TRUE(concurrent.ok()) << concurrent.status();
  EXPECT_TRUE(Solve(*concurrent).has_solution());

  parameters_.set_enforce_flight_level_non_overlap(true);
  const absl::StatusOr<AllocationModel> sequential = BuildAll();
  ASSERT_TRUE(sequential.ok()) << sequential.status();
  EXPECT_EQ(Solve(*sequential).status, SolveResult::Status::kInfeasible);
}

// R1 cannot reach bay B2 in time for F2 after working F1 at B1.
constexpr absl::string_view kTransitionProblem = R"pb(
  services { id: "bags" service_class: FLIGHT_LEVEL }
  flights {
    number: "F1"
    arrival: "08:00"
    departure: "08:45"
    bay: "B1"
    services { service_id: "bags" start: "A" end: "A+30" }
  }
  flights {
    number: "F2"
    arrival: "08:35"
    departure: "09:30"
    bay: "B2"
    services { service_id: "bags" start: "A" end: "A+30" }
  }
  roster {
    id: "R1"
    shifts { start: "06:00" end: "14:00" }
  }
  bays {
    name: "B1"
    travel_minutes { key: "B2" value: 30 }
  }
  bays {
    name: "B2"
    travel_minutes { key: "B1" value: 30 }
  }
)pb";

TEST_F(ModelBuilderTest, TransitionTimesBetweenBays) {
  Load(kTransitionProblem);
  const absl::StatusOr<AllocationModel> model = BuildAll();
  ASSERT_TRUE(model.ok()) << model.status();
  EXPECT_EQ(Solve(*model).status, SolveResult::Status::kInfeasible);

  parameters_.set_enforce_transition_times(false);
  const absl::StatusOr<AllocationModel> relaxed = BuildAll();
  ASSERT_TRUE(relaxed.ok()) << relaxed.status();
  EXPECT_TRUE(Solve(*relaxed).has_solution());
}

TEST_F(ModelBuilderTest, KeptAssignmentTransitionTimes) {
  Load(kTransitionProblem);
  // F1 departs at 08:45 and R1 worked it at B1.
  const std::vector<AssignmentKey> kept = {AssignmentKey("F1", "bags", "R1")};
  const absl::StatusOr<AllocationModel> model =
      ModelBuilder(domain_.get(), parameters_, &variables_)
          .Build({1}, {0}, 525, {}, kept);
  ASSERT_TRUE(model.ok()) << model.status();
  EXPECT_EQ(Solve(*model).status, SolveResult::Status::kInfeasible);

  parameters_.set_enforce_transition_times(false);
  const absl::StatusOr<AllocationModel> relaxed =
      ModelBuilder(domain_.get(), parameters_, &variables_)
          .Build({1}, {0}, 525, {}, kept);
  ASSERT_TRUE(relaxed.ok()) << relaxed.status();
  EXPECT_TRUE(Solve(*relaxed).has_solution());
}

TEST_F(ModelBuilderTest, SameBayTransitionFitsInTheBuffer) {
  Load(kTransitionProblem);
  StaffingProblem problem = domain_->problem();
  problem.mutable_flights(1)->set_bay("B1");
  absl::StatusOr<DomainModel> domain = DomainModel::Create(problem, 5);
  ASSERT_TRUE(domain.ok()) << domain.status();
  domain_ = std::make_unique<DomainModel>(*std::move(domain));

  // F1 ends at 08:30, F2 starts at 08:35.
  const absl::StatusOr<AllocationModel> model = BuildAll();
  ASSERT_TRUE(model.ok()) << model.status();
  const SolveResult result = Solve(*model);
  ASSERT_TRUE(result.has_solution()) << result.message;
  EXPECT_THAT(Assigned(result), ElementsAre(AssignmentKey("F1", "bags", "R1"),
                                            AssignmentKey("F2", "bags", "R1")));
}

}  // namespace
}  // namespace groundcrew
