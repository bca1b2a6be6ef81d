#include <subrelease/config.hpp>
#include <subrelease/errors.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>

namespace subrelease {

namespace {

constexpr std::array<const char*, 7> kLogLevels = {
    "trace", "debug", "info", "warn", "error", "critical", "off"};

// Reads an optional field, converting type mismatches into ConfigError
template <typename T>
void read_field(const nlohmann::json& j, const char* field, T& out) {
    if (!j.contains(field)) {
        return;
    }
    try {
        out = j.at(field).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(field, e.what());
    }
}

}  // namespace

ReleaseOptions default_release_options() {
    return ReleaseOptions{};
}

Config default_config() {
    Config config;
    config.release = default_release_options();
    config.matching = MatchOptions{.min_similarity = 0.75};
    config.log_level = "warn";
    return config;
}

Config make_config(const std::vector<ConfigOption>& options) {
    Config config = default_config();
    for (const auto& option : options) {
        option(config);
    }
    validate_config(config);
    return config;
}

void validate_config(const Config& config) {
    if (config.release.min_length == 0) {
        throw ConfigError("min_length", "must be at least 1");
    }
    for (const auto& ext : config.release.subtitle_extensions) {
        if (ext.empty()) {
            throw ConfigError("subtitle_extensions", "empty extension");
        }
    }
    if (config.matching.min_similarity < 0.0 || config.matching.min_similarity > 1.0) {
        throw ConfigError("min_similarity", "must be between 0 and 1");
    }
    auto it = std::find(kLogLevels.begin(), kLogLevels.end(), config.log_level);
    if (it == kLogLevels.end()) {
        throw ConfigError("log_level", "unknown level '" + config.log_level + "'");
    }
}

Config config_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("", "expected a JSON object");
    }

    if (j.contains("min_length") &&
        (!j["min_length"].is_number_integer() || j["min_length"].get<long long>() < 0)) {
        throw ConfigError("min_length", "expected a non-negative integer");
    }

    Config config = default_config();
    read_field(j, "release_name_mode", config.release.release_name_mode);
    read_field(j, "min_length", config.release.min_length);
    read_field(j, "subtitle_extensions", config.release.subtitle_extensions);
    read_field(j, "extra_codes", config.release.extra_codes);
    read_field(j, "extra_names", config.release.extra_names);
    read_field(j, "min_similarity", config.matching.min_similarity);
    read_field(j, "log_level", config.log_level);

    validate_config(config);
    return config;
}

void apply_log_level(const Config& config) {
    spdlog::set_level(spdlog::level::from_str(config.log_level));
}

ConfigOption with_release_name_mode(bool enabled) {
    return [enabled](Config& c) { c.release.release_name_mode = enabled; };
}

ConfigOption with_min_length(std::size_t min_length) {
    return [min_length](Config& c) { c.release.min_length = min_length; };
}

ConfigOption with_subtitle_extensions(const std::vector<std::string>& extensions) {
    return [extensions](Config& c) { c.release.subtitle_extensions = extensions; };
}

ConfigOption with_extra_codes(const std::vector<std::string>& codes) {
    return [codes](Config& c) { c.release.extra_codes = codes; };
}

ConfigOption with_extra_names(const std::vector<std::string>& names) {
    return [names](Config& c) { c.release.extra_names = names; };
}

ConfigOption with_min_similarity(double min_similarity) {
    return [min_similarity](Config& c) { c.matching.min_similarity = min_similarity; };
}

ConfigOption with_log_level(const std::string& level) {
    return [level](Config& c) { c.log_level = level; };
}

}  // namespace subrelease
