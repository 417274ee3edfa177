#pragma once

/// @file strategy.h
/// @brief Partial response strategy helpers
///
/// The strategy set is the closed protobuf enum; every rule group resolves to
/// exactly one member.

#include <array>
#include <string>
#include <string_view>

#include <absl/status/statusor.h>

#include "proto/rulemux/v1/rules.pb.h"

namespace rulemux::rules {

using Strategy = v1::PartialResponseStrategy;

/// @brief Strategy applied to groups that do not name one
inline constexpr Strategy kDefaultStrategy = v1::ABORT;

/// @brief Every strategy, in enum order; one rule engine exists per entry
inline constexpr std::array<Strategy, 3> kAllStrategies = {v1::WARN, v1::ABORT, v1::NONE};

/// @brief Upper-case enum name, e.g. "WARN"
std::string StrategyName(Strategy strategy);

/// @brief Lower-case name used in metric labels and logs, e.g. "warn"
std::string StrategyLabel(Strategy strategy);

/// @brief Comma separated list of accepted names, e.g. "WARN,ABORT,NONE"
std::string StrategyValues();

/// @brief Resolve a strategy tag as written in a rule file
///
/// Matching is case-insensitive. An empty tag resolves to kDefaultStrategy;
/// anything else that is not an enum member is a kPolicyParseError.
absl::StatusOr<Strategy> ParseStrategy(std::string_view text);

}  // namespace rulemux::rules
