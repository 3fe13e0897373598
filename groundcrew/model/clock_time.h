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

#ifndef GROUNDCREW_MODEL_CLOCK_TIME_H_
#define GROUNDCREW_MODEL_CLOCK_TIME_H_

#include <cstdint>
#include <ostream>
#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace groundcrew {

// All times of the engine are expressed in minutes since the start of the
// operational day.
inline constexpr int64_t kMinutesPerDay = 24 * 60;

// Strictly before any clock time of the day. Used as the cutoff of the
// baseline schedule, which has no past.
inline constexpr int64_t kStartOfDayCutoff = -1;

// A half-open interval [start, end) of minutes.
struct TimeWindow {
  int64_t start = 0;
  int64_t end = 0;

  int64_t duration() const { return end - start; }

  bool Overlaps(const TimeWindow& other) const {
    return start < other.end && other.start < end;
  }

  // Returns true iff `other` lies entirely within this window.
  bool Covers(const TimeWindow& other) const {
    return start <= other.start && other.end <= end;
  }

  bool operator==(const TimeWindow& other) const {
    return start == other.start && end == other.end;
  }
};

std::ostream& operator<<(std::ostream& out, const TimeWindow& window);

// Parses "HH:MM" (or "H:MM") into minutes since the start of the day.
absl::StatusOr<int64_t> ParseClockTime(absl::string_view text);

// Formats minutes since the start of the day as "HH:MM". Negative values are
// printed as "--:--".
std::string FormatClockTime(int64_t minutes);

// Resolves a time given relative to a flight: "A" and "D" denote the arrival
// and departure of the flight, optionally followed by "+n" or "-n" minutes.
absl::StatusOr<int64_t> ResolveRelativeTime(absl::string_view text,
                                            int64_t arrival,
                                            int64_t departure);

}  // namespace groundcrew

#endif  // GROUNDCREW_MODEL_CLOCK_TIME_H_
