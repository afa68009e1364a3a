#pragma once
// =============================================================================
// Tether - Config Field Validators
// =============================================================================
// A validator inspects one JSON value and returns Ok or a ValidationError
// whose message is fit for the user. Numeric validators also accept numeric
// strings ("60", " 3.5 "), as hand-edited files often contain them.
// =============================================================================

#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "result.hpp"

namespace tether::config {

using Validator = std::function<Result<void>(const nlohmann::json& value)>;

Validator intRange(long long min_value, long long max_value);
Validator realRange(double min_value, double max_value);
Validator choice(std::vector<std::string> choices);
Validator bitrate();                 // "20", "20M", 8.5; (0, 1000]
Validator boolean();
Validator text();
Validator textList();

// Coerces a JSON number or numeric string; false when not numeric
bool toNumber(const nlohmann::json& value, double& out);

} // namespace tether::config
