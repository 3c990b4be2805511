#include "config.hpp"

#include "errors.hpp"

#include <cstdlib>
#include <limits>
#include <string>

namespace dp {

namespace {

std::string trim(const std::string& value) {
    const auto start = value.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\n\r\f\v");
    return value.substr(start, end - start + 1);
}

bool readEnv(const char* name, std::string& out) {
    const char* env = std::getenv(name);
    if (env == nullptr) {
        return false;
    }
    out = trim(env);
    return !out.empty();
}

std::uint32_t parsePercent(const std::string& text) {
    if (text.find_first_not_of("0123456789") != std::string::npos) {
        throw InvalidConfigurationError("DP_FEE_PERCENT must be an integer, got \"" + text + "\"");
    }
    unsigned long value = 0;
    try {
        value = std::stoul(text);
    } catch (const std::exception& ex) {
        throw InvalidConfigurationError("DP_FEE_PERCENT is out of range: " + std::string(ex.what()));
    }
    if (value > std::numeric_limits<std::uint32_t>::max()) {
        throw InvalidConfigurationError("DP_FEE_PERCENT is out of range");
    }
    return static_cast<std::uint32_t>(value);
}

} // namespace

void validateConfig(const EngineConfig& cfg) {
    if (cfg.authority.empty()) {
        throw InvalidConfigurationError("Engine requires an authority identity (set DP_AUTHORITY)");
    }
    if (cfg.feePercent > kMaxFeePercent) {
        throw InvalidConfigurationError("Fee percent must be at most 100, got " +
                                        std::to_string(cfg.feePercent));
    }
}

EngineConfig loadEngineConfigFromEnv(EngineConfig base) {
    std::string value;
    if (readEnv("DP_AUTHORITY", value)) {
        base.authority = value;
    }
    if (readEnv("DP_MIN_STAKE", value)) {
        try {
            base.minStake = parseAmount(value);
        } catch (const std::runtime_error& ex) {
            throw InvalidConfigurationError(std::string("DP_MIN_STAKE: ") + ex.what());
        }
    }
    if (readEnv("DP_FEE_PERCENT", value)) {
        base.feePercent = parsePercent(value);
    }
    validateConfig(base);
    return base;
}

} // namespace dp
