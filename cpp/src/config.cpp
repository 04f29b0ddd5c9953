/**
 * @file config.cpp
 * @brief KnockoutConfig defaults and JSON loading.
 */

#include "../include/kotrack/config.hpp"
#include "../include/kotrack/errors.hpp"
#include "../include/kotrack/logging.hpp"
#include <fstream>

namespace kotrack {

const char* const DEFAULT_HERO = "Hero";

const char* final_hand_rule_name(FinalHandRule rule) {
    switch (rule) {
        case FinalHandRule::MissingFromCollects:
            return "missing_from_collects";
        case FinalHandRule::ZeroFinalStack:
            return "zero_final_stack";
    }
    return "missing_from_collects";
}

FinalHandRule parse_final_hand_rule(const std::string& name) {
    if (name == "missing_from_collects") {
        return FinalHandRule::MissingFromCollects;
    }
    if (name == "zero_final_stack") {
        return FinalHandRule::ZeroFinalStack;
    }
    throw InputError::bad_config("unknown final_hand_rule '" + name + "'");
}

ChipCount parse_min_bb(const std::string& text) {
    ChipCount value = parse_chips(text);
    if (value == 0 && text != "0") {
        throw InputError::bad_config("invalid --min-bb value '" + text + "'");
    }
    return value;
}

KnockoutConfig config_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw InputError::bad_config("configuration must be a JSON object");
    }

    KnockoutConfig config;
    try {
        config.hero = j.value("hero", config.hero);
        config.min_bb = j.value("min_bb", config.min_bb);
        config.diagnostics = j.value("diagnostics", config.diagnostics);
        config.newest_first = j.value("newest_first", config.newest_first);
        config.extension = j.value("extension", config.extension);
        if (j.contains("final_hand_rule")) {
            config.final_hand_rule =
                parse_final_hand_rule(j.at("final_hand_rule").get<std::string>());
        }
    } catch (const nlohmann::json::exception& e) {
        throw InputError::bad_config(std::string("invalid configuration value: ") + e.what());
    }
    return config;
}

nlohmann::json config_to_json(const KnockoutConfig& config) {
    return {
        {"hero", config.hero},
        {"min_bb", config.min_bb},
        {"diagnostics", config.diagnostics},
        {"final_hand_rule", final_hand_rule_name(config.final_hand_rule)},
        {"newest_first", config.newest_first},
        {"extension", config.extension}
    };
}

KnockoutConfig load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw InputError::bad_config("cannot open configuration file " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw InputError::bad_config("failed to parse " + path + ": " + e.what());
    }

    KnockoutConfig config = config_from_json(j);
    if (config.diagnostics) {
        log_debug("config", "config_loaded", {{"path", path}, {"config", config_to_json(config)}});
    }
    return config;
}

} // namespace kotrack
