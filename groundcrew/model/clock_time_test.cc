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

#include "groundcrew/model/clock_time.h"

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "gtest/gtest.h"

namespace groundcrew {
namespace {

TEST(ParseClockTimeTest, ParsesHoursAndMinutes) {
  EXPECT_EQ(*ParseClockTime("00:00"), 0);
  EXPECT_EQ(*ParseClockTime("08:30"), 510);
  EXPECT_EQ(*ParseClockTime("8:30"), 510);
  EXPECT_EQ(*ParseClockTime(" 23:59 "), 23 * 60 + 59);
}

TEST(ParseClockTimeTest, RejectsMalformedInput) {
  for (const char* text : {"", "830", "8:3", "08:30:00", "ab:cd", "-1:30",
                           "24:00", "12:60", "123:00"}) {
    const absl::StatusOr<int64_t> minutes = ParseClockTime(text);
    EXPECT_EQ(minutes.status().code(), absl::StatusCode::kInvalidArgument)
        << text;
  }
}

TEST(FormatClockTimeTest, Formats) {
  EXPECT_EQ(FormatClockTime(0), "00:00");
  EXPECT_EQ(FormatClockTime(510), "08:30");
  EXPECT_EQ(FormatClockTime(kStartOfDayCutoff), "--:--");
}

TEST(ResolveRelativeTimeTest, ResolvesAgainstArrivalAndDeparture) {
  const int64_t arrival = 600;
  const int64_t departure = 660;
  EXPECT_EQ(*ResolveRelativeTime("A", arrival, departure), 600);
  EXPECT_EQ(*ResolveRelativeTime("A+10", arrival, departure), 610);
  EXPECT_EQ(*ResolveRelativeTime("A-5", arrival, departure), 595);
  EXPECT_EQ(*ResolveRelativeTime("D", arrival, departure), 660);
  EXPECT_EQ(*ResolveRelativeTime("D-15", arrival, departure), 645);
}

TEST(ResolveRelativeTimeTest, RejectsMalformedInput) {
  for (const char* text : {"", "B+5", "A+", "A*5", "D+-5", "A+x"}) {
    EXPECT_FALSE(ResolveRelativeTime(text, 0, 10).ok()) << text;
  }
}

TEST(TimeWindowTest, HalfOpenOverlap) {
  const TimeWindow morning{480, 600};
  EXPECT_TRUE(morning.Overlaps({590, 620}));
  EXPECT_FALSE(morning.Overlaps({600, 620}));
  EXPECT_FALSE(morning.Overlaps({400, 480}));
  EXPECT_TRUE(morning.Covers({480, 600}));
  EXPECT_FALSE(morning.Covers({470, 500}));
  EXPECT_EQ(morning.duration(), 120);
}

}  // namespace
}  // namespace groundcrew
