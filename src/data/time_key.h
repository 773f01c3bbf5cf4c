#pragma once

/// @file time_key.h
/// @brief Month label normalization into (year, month, quarter)

#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include <absl/status/statusor.h>

namespace invsense::data {

/// @brief Calendar quarter
enum class Quarter {
    kQ1 = 1,
    kQ2 = 2,
    kQ3 = 3,
    kQ4 = 4
};

/// @brief Time key derived from a "Mon-YY" label
struct TimeKey {
    int year = 0;
    int month = 0;  ///< 1-12
    Quarter quarter = Quarter::kQ1;

    bool operator==(const TimeKey& other) const {
        return year == other.year && month == other.month;
    }
    bool operator!=(const TimeKey& other) const { return !(*this == other); }
    bool operator<(const TimeKey& other) const {
        return std::tie(year, month) < std::tie(other.year, other.month);
    }
};

/// @brief A (year, quarter) pair as used in quarter labels like "2022 Q2"
struct QuarterRef {
    int year = 0;
    Quarter quarter = Quarter::kQ1;

    bool operator==(const QuarterRef& other) const {
        return year == other.year && quarter == other.quarter;
    }
    bool operator!=(const QuarterRef& other) const { return !(*this == other); }
    bool operator<(const QuarterRef& other) const {
        return std::tie(year, quarter) < std::tie(other.year, other.quarter);
    }
};

/// @brief Quarter for a 1-based month: (month - 1) / 3 + 1
Quarter QuarterForMonth(int month);

/// @brief "Q1" .. "Q4"
std::string QuarterToString(Quarter quarter);

/// @brief Parse "Q1" .. "Q4"
std::optional<Quarter> ParseQuarter(std::string_view text);

/// @brief English three-letter month abbreviation ("Jan" .. "Dec")
std::string MonthAbbreviation(int month);

/// @brief Parse a single "Mon-YY" label such as "Feb-23"
///
/// The month abbreviation is matched case-insensitively; the year must be
/// exactly two digits and uses the POSIX pivot (69-99 -> 19xx, else 20xx).
/// @return ParseError status when the label does not match
absl::StatusOr<TimeKey> ParseMonthLabel(std::string_view label);

/// @brief Normalize a batch of labels; bad labels become nullopt
std::vector<std::optional<TimeKey>> NormalizeMonthLabels(
    const std::vector<std::string>& labels);

/// @brief Parse a quarter label ("2022 Q2", or the legacy "2022 2022Q2")
absl::StatusOr<QuarterRef> ParseQuarterLabel(std::string_view label);

/// @brief Format as "2022 Q2"
std::string FormatQuarterLabel(const QuarterRef& ref);

}  // namespace invsense::data
