#include "config_validators.hpp"
#include "session_config.hpp"
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace tether::config {

namespace {

Result<void> invalid(std::string message) {
    return Err<void>(ErrorKind::ValidationError, std::move(message));
}

std::string formatNumber(double v) {
    char buf[32];
    snprintf(buf, sizeof(buf), "%g", v);
    return buf;
}

} // namespace

bool toNumber(const nlohmann::json& value, double& out) {
    if (value.is_number()) {
        out = value.get<double>();
        return std::isfinite(out);
    }
    if (!value.is_string()) return false;

    const auto& s = value.get_ref<const std::string&>();
    size_t b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return false;
    size_t e = s.find_last_not_of(" \t");
    std::string trimmed = s.substr(b, e - b + 1);

    char* end = nullptr;
    double v = std::strtod(trimmed.c_str(), &end);
    if (end != trimmed.c_str() + trimmed.size() || !std::isfinite(v)) return false;
    out = v;
    return true;
}

Validator intRange(long long min_value, long long max_value) {
    return [min_value, max_value](const nlohmann::json& value) -> Result<void> {
        if (value.is_null()) return invalid("Value cannot be null");
        double v;
        if (!toNumber(value, v) || std::floor(v) != v) {
            return invalid("Value must be a valid integer");
        }
        if (v < static_cast<double>(min_value)) {
            return invalid("Value must be at least " + std::to_string(min_value));
        }
        if (v > static_cast<double>(max_value)) {
            return invalid("Value must be at most " + std::to_string(max_value));
        }
        return Ok();
    };
}

Validator realRange(double min_value, double max_value) {
    return [min_value, max_value](const nlohmann::json& value) -> Result<void> {
        if (value.is_null()) return invalid("Value cannot be null");
        double v;
        if (!toNumber(value, v)) return invalid("Value must be a valid number");
        if (v < min_value) return invalid("Value must be at least " + formatNumber(min_value));
        if (v > max_value) return invalid("Value must be at most " + formatNumber(max_value));
        return Ok();
    };
}

Validator choice(std::vector<std::string> choices) {
    return [choices = std::move(choices)](const nlohmann::json& value) -> Result<void> {
        if (value.is_string()) {
            const auto& s = value.get_ref<const std::string&>();
            for (const auto& c : choices) {
                if (s == c) return Ok();
            }
        }
        std::string list;
        for (size_t i = 0; i < choices.size(); ++i) {
            if (i) list += ", ";
            list += choices[i];
        }
        return invalid("Value must be one of: " + list);
    };
}

Validator bitrate() {
    return [](const nlohmann::json& value) -> Result<void> {
        if (value.is_null()) return invalid("Bitrate cannot be null");

        double mbps;
        if (value.is_number()) {
            mbps = value.get<double>();
        } else if (value.is_string()) {
            const auto& s = value.get_ref<const std::string&>();
            if (s.find_first_not_of(" \t") == std::string::npos) {
                return invalid("Bitrate cannot be empty");
            }
            if (!parseBitrate(s, mbps)) return invalid("Bitrate must be a valid number");
        } else {
            return invalid("Bitrate must be a valid number");
        }

        if (mbps <= 0.0) return invalid("Bitrate must be greater than 0");
        if (mbps > 1000.0) return invalid("Bitrate too high (max 1000 Mbps)");
        return Ok();
    };
}

Validator boolean() {
    return [](const nlohmann::json& value) -> Result<void> {
        if (!value.is_boolean()) return invalid("Value must be true or false");
        return Ok();
    };
}

Validator text() {
    return [](const nlohmann::json& value) -> Result<void> {
        if (!value.is_string()) return invalid("Value must be a string");
        return Ok();
    };
}

Validator textList() {
    return [](const nlohmann::json& value) -> Result<void> {
        if (!value.is_array()) return invalid("Value must be a list of strings");
        for (const auto& item : value) {
            if (!item.is_string()) return invalid("Value must be a list of strings");
        }
        return Ok();
    };
}

} // namespace tether::config
