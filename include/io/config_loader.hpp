#ifndef CONFIG_LOADER_HPP
#define CONFIG_LOADER_HPP

#include "game/config.hpp"
#include "util/result.hpp"

#include <string>

#include <yaml-cpp/yaml.h>

struct RulesSettings {
    BlackjackConfig rules;
    int maxSearchDepth = blackjack::DefaultMaxSearchDepth;
};

// Missing fields take their defaults. Fields that are present but malformed or out of range are errors.
Result<RulesSettings> buildSettingsFromYaml(const YAML::Node& input);
Result<RulesSettings> loadSettingsFromFile(const std::string& filePath);

#endif // CONFIG_LOADER_HPP
