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

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"

namespace groundcrew {

std::ostream& operator<<(std::ostream& out, const TimeWindow& window) {
  return out << "[" << FormatClockTime(window.start) << ", "
             << FormatClockTime(window.end) << ")";
}

absl::StatusOr<int64_t> ParseClockTime(absl::string_view text) {
  const absl::string_view stripped = absl::StripAsciiWhitespace(text);
  const std::vector<absl::string_view> fields = absl::StrSplit(stripped, ':');
  int hours = 0;
  int minutes = 0;
  if (fields.size() != 2 || fields[0].empty() || fields[0].size() > 2 ||
      fields[1].size() != 2 || !absl::SimpleAtoi(fields[0], &hours) ||
      !absl::SimpleAtoi(fields[1], &minutes)) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Invalid clock time '%s', expected HH:MM.", text));
  }
  if (hours < 0 || hours > 23 || minutes < 0 || minutes > 59) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Clock time '%s' is out of range.", text));
  }
  return int64_t{60} * hours + minutes;
}

std::string FormatClockTime(int64_t minutes) {
  if (minutes < 0) return "--:--";
  return absl::StrFormat("%02d:%02d", minutes / 60, minutes % 60);
}

absl::StatusOr<int64_t> ResolveRelativeTime(absl::string_view text,
                                            int64_t arrival,
                                            int64_t departure) {
  const absl::string_view stripped = absl::StripAsciiWhitespace(text);
  if (stripped.empty()) {
    return absl::InvalidArgumentError("Empty relative time.");
  }
  int64_t base;
  switch (stripped[0]) {
    case 'A':
      base = arrival;
      break;
    case 'D':
      base = departure;
      break;
    default:
      return absl::InvalidArgumentError(absl::StrFormat(
          "Invalid relative time '%s', it must start with A or D.", text));
  }
  const absl::string_view offset = stripped.substr(1);
  if (offset.empty()) return base;

  int64_t minutes = 0;
  if ((offset[0] != '+' && offset[0] != '-') || offset.size() < 2 ||
      !absl::SimpleAtoi(offset.substr(1), &minutes) || minutes < 0) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Invalid offset in relative time '%s', expected +n or -n.", text));
  }
  return offset[0] == '+' ? base + minutes : base - minutes;
}

}  // namespace groundcrew
