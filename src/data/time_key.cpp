/// @file time_key.cpp
/// @brief Month label normalization implementation

#include "data/time_key.h"

#include <array>

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>
#include <absl/strings/strip.h>

#include "common/error.h"

namespace invsense::data {

namespace {

constexpr std::array<const char*, 12> kMonthAbbreviations = {
    "Jan", "Feb", "Mar", "Apr", "May", "Jun",
    "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"
};

std::optional<int> MonthFromAbbreviation(std::string_view text) {
    if (text.size() != 3) {
        return std::nullopt;
    }
    for (size_t i = 0; i < kMonthAbbreviations.size(); ++i) {
        if (absl::EqualsIgnoreCase(text, kMonthAbbreviations[i])) {
            return static_cast<int>(i) + 1;
        }
    }
    return std::nullopt;
}

}  // namespace

Quarter QuarterForMonth(int month) {
    return static_cast<Quarter>((month - 1) / 3 + 1);
}

std::string QuarterToString(Quarter quarter) {
    return absl::StrCat("Q", static_cast<int>(quarter));
}

std::optional<Quarter> ParseQuarter(std::string_view text) {
    if (text.size() != 2 || (text[0] != 'Q' && text[0] != 'q')) {
        return std::nullopt;
    }
    if (text[1] < '1' || text[1] > '4') {
        return std::nullopt;
    }
    return static_cast<Quarter>(text[1] - '0');
}

std::string MonthAbbreviation(int month) {
    if (month < 1 || month > 12) {
        return "";
    }
    return kMonthAbbreviations[month - 1];
}

absl::StatusOr<TimeKey> ParseMonthLabel(std::string_view label) {
    // Mon-YY: three letters, dash, two digits
    if (label.size() != 6 || label[3] != '-' ||
        !absl::ascii_isdigit(static_cast<unsigned char>(label[4])) ||
        !absl::ascii_isdigit(static_cast<unsigned char>(label[5]))) {
        return ParseError(absl::StrCat("Month label '", label,
                                       "' does not match Mon-YY"));
    }

    auto month = MonthFromAbbreviation(label.substr(0, 3));
    if (!month.has_value()) {
        return ParseError(absl::StrCat("Unknown month abbreviation in '", label, "'"));
    }

    int two_digit = (label[4] - '0') * 10 + (label[5] - '0');
    TimeKey key;
    key.year = two_digit >= 69 ? 1900 + two_digit : 2000 + two_digit;
    key.month = *month;
    key.quarter = QuarterForMonth(key.month);
    return key;
}

std::vector<std::optional<TimeKey>> NormalizeMonthLabels(
    const std::vector<std::string>& labels) {
    std::vector<std::optional<TimeKey>> keys;
    keys.reserve(labels.size());
    for (const auto& label : labels) {
        auto parsed = ParseMonthLabel(label);
        if (parsed.ok()) {
            keys.emplace_back(*parsed);
        } else {
            keys.emplace_back(std::nullopt);
        }
    }
    return keys;
}

absl::StatusOr<QuarterRef> ParseQuarterLabel(std::string_view label) {
    std::vector<std::string_view> parts =
        absl::StrSplit(absl::StripAsciiWhitespace(label), ' ', absl::SkipEmpty());
    if (parts.size() != 2) {
        return ParseError(absl::StrCat("Quarter label '", label,
                                       "' must look like '2022 Q2'"));
    }

    int year = 0;
    if (!absl::SimpleAtoi(parts[0], &year)) {
        return ParseError(absl::StrCat("Invalid year in quarter label '", label, "'"));
    }

    // Legacy dashboards send "2022 2022Q2"
    std::string_view quarter_text = parts[1];
    if (absl::ConsumePrefix(&quarter_text, parts[0]) && quarter_text.empty()) {
        quarter_text = parts[1];
    }

    auto quarter = ParseQuarter(quarter_text);
    if (!quarter.has_value()) {
        return ParseError(absl::StrCat("Invalid quarter in quarter label '", label, "'"));
    }

    return QuarterRef{year, *quarter};
}

std::string FormatQuarterLabel(const QuarterRef& ref) {
    return absl::StrCat(ref.year, " ", QuarterToString(ref.quarter));
}

}  // namespace invsense::data
