/// @file strategy.cpp
/// @brief Partial response strategy helpers

#include "rules/strategy.h"

#include <vector>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "common/error.h"

namespace rulemux::rules {

std::string StrategyName(Strategy strategy) {
    return v1::PartialResponseStrategy_Name(strategy);
}

std::string StrategyLabel(Strategy strategy) {
    return absl::AsciiStrToLower(StrategyName(strategy));
}

std::string StrategyValues() {
    std::vector<std::string> names;
    names.reserve(kAllStrategies.size());
    for (Strategy strategy : kAllStrategies) {
        names.push_back(StrategyName(strategy));
    }
    return absl::StrJoin(names, ",");
}

absl::StatusOr<Strategy> ParseStrategy(std::string_view text) {
    if (text.empty()) {
        return kDefaultStrategy;
    }

    const std::string upper = absl::AsciiStrToUpper(absl::string_view(text.data(), text.size()));
    for (Strategy strategy : kAllStrategies) {
        if (StrategyName(strategy) == upper) {
            return strategy;
        }
    }

    return MakeError(ErrorCode::kPolicyParseError,
                     absl::StrCat("failed to unmarshal 'partial_response_strategy'. "
                                  "Possible values are ", StrategyValues(),
                                  ". Got: ", absl::string_view(text.data(), text.size())));
}

}  // namespace rulemux::rules
