#include "duration.h"

#include <array>
#include <cctype>
#include <cstdint>

#include <absl/strings/str_cat.h>

namespace rulemux {

namespace {

struct Unit {
    std::string_view suffix;
    int64_t millis;
};

// Ordered from largest to smallest; "ms" must be matched before "m".
constexpr std::array<Unit, 7> kUnits = {{
    {"y", 365LL * 24 * 60 * 60 * 1000},
    {"w", 7LL * 24 * 60 * 60 * 1000},
    {"d", 24LL * 60 * 60 * 1000},
    {"h", 60LL * 60 * 1000},
    {"m", 60LL * 1000},
    {"s", 1000},
    {"ms", 1},
}};

}  // namespace

absl::StatusOr<std::chrono::milliseconds> ParseDuration(std::string_view text) {
    if (text == "0") {
        return std::chrono::milliseconds(0);
    }
    if (text.empty()) {
        return absl::InvalidArgumentError("empty duration string");
    }

    int64_t total = 0;
    size_t pos = 0;
    size_t last_unit = 0;
    bool first = true;

    while (pos < text.size()) {
        size_t digits_end = pos;
        while (digits_end < text.size() &&
               std::isdigit(static_cast<unsigned char>(text[digits_end]))) {
            ++digits_end;
        }
        if (digits_end == pos || digits_end - pos > 15) {
            return absl::InvalidArgumentError(
                absl::StrCat("not a valid duration string: \"", absl::string_view(text.data(), text.size()), "\""));
        }
        int64_t value = 0;
        for (size_t i = pos; i < digits_end; ++i) {
            value = value * 10 + (text[i] - '0');
        }

        std::string_view rest = text.substr(digits_end);
        size_t unit_index = kUnits.size();
        for (size_t i = 0; i < kUnits.size(); ++i) {
            const auto& suffix = kUnits[i].suffix;
            if (rest.substr(0, suffix.size()) != suffix) {
                continue;
            }
            // "m" must not swallow the "m" of "ms".
            if (suffix == "m" && rest.substr(0, 2) == "ms") {
                continue;
            }
            unit_index = i;
            break;
        }
        if (unit_index == kUnits.size() || (!first && unit_index <= last_unit)) {
            return absl::InvalidArgumentError(
                absl::StrCat("not a valid duration string: \"", absl::string_view(text.data(), text.size()), "\""));
        }

        total += value * kUnits[unit_index].millis;
        last_unit = unit_index;
        first = false;
        pos = digits_end + kUnits[unit_index].suffix.size();
    }

    return std::chrono::milliseconds(total);
}

std::string FormatDuration(std::chrono::milliseconds duration) {
    int64_t ms = duration.count();
    if (ms == 0) {
        return "0s";
    }

    std::string out;
    if (ms < 0) {
        out = "-";
        ms = -ms;
    }
    for (const auto& unit : kUnits) {
        // Years and weeks only when they divide the remainder exactly.
        if ((unit.suffix == "y" || unit.suffix == "w") && ms % unit.millis != 0) {
            continue;
        }
        if (ms >= unit.millis) {
            absl::StrAppend(&out, ms / unit.millis, absl::string_view(unit.suffix.data(), unit.suffix.size()));
            ms %= unit.millis;
        }
    }
    return out;
}

}  // namespace rulemux
