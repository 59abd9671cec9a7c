#include "io/config_loader.hpp"

#include "game/config.hpp"
#include "game/game_types.hpp"
#include "util/result.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace {
enum class FieldStatus : std::uint8_t {
    Loaded,
    Missing,
    Malformed
};

template <typename T>
FieldStatus loadField(T& field, const YAML::Node& root, const std::string& key) {
    const YAML::Node node = root[key];
    if (!node.IsDefined() || node.IsNull()) {
        return FieldStatus::Missing;
    }

    try {
        field = node.as<T>();
        std::cout << "Successfully loaded field " << key << ".\n";
        return FieldStatus::Loaded;
    }
    catch (const YAML::Exception&) {
        return FieldStatus::Malformed;
    }
}

template <typename T>
bool loadFieldOptional(T& field, const YAML::Node& root, const std::string& key, const T& defaultValue) {
    switch (loadField(field, root, key)) {
        case FieldStatus::Loaded:
            return true;
        case FieldStatus::Missing:
            std::cout << "Could not find field " << key << ", using default.\n";
            field = defaultValue;
            return true;
        case FieldStatus::Malformed:
            return false;
    }
    return false;
}

std::string getMalformedFieldError(const std::string& key) {
    return "Could not load field " + key + ".";
}

std::string getOutOfRangeError(const std::string& key, int minimum, int maximum) {
    return "Field " + key + " must be between " + std::to_string(minimum) + " and " + std::to_string(maximum) + ".";
}

Result<RulesSettings> buildSettings(const YAML::Node& input) {
    RulesSettings settings;
    if (!input.IsDefined() || input.IsNull()) {
        return settings;
    }
    if (!input.IsMap()) {
        return "Expected a map of rule fields.";
    }

    BlackjackConfig& rules = settings.rules;

    if (!loadFieldOptional(rules.targetTotal, input, "target-total", blackjack::DefaultTargetTotal)) {
        return getMalformedFieldError("target-total");
    }
    if (rules.targetTotal < 2 || rules.targetTotal > blackjack::MaxTargetTotal) {
        return getOutOfRangeError("target-total", 2, blackjack::MaxTargetTotal);
    }

    if (!loadFieldOptional(rules.dealerStandThreshold, input, "dealer-stand-threshold", blackjack::DefaultDealerStandThreshold)) {
        return getMalformedFieldError("dealer-stand-threshold");
    }
    if (rules.dealerStandThreshold < 1 || rules.dealerStandThreshold > rules.targetTotal) {
        return getOutOfRangeError("dealer-stand-threshold", 1, rules.targetTotal);
    }

    if (!loadFieldOptional(rules.dealerHitsSoft17, input, "dealer-hits-soft-17", false)) {
        return getMalformedFieldError("dealer-hits-soft-17");
    }

    if (!loadFieldOptional(rules.useSoftAces, input, "soft-aces", true)) {
        return getMalformedFieldError("soft-aces");
    }

    std::vector<int> rankValues;
    std::vector<int> standardRankValues(blackjack::StandardRankValues.begin(), blackjack::StandardRankValues.end());
    if (!loadFieldOptional(rankValues, input, "rank-values", standardRankValues)) {
        return getMalformedFieldError("rank-values");
    }
    if (rankValues.size() != NumRanks) {
        return "Field rank-values must list " + std::to_string(NumRanks) + " values, from Ace to King.";
    }
    for (std::size_t i = 0; i < NumRanks; ++i) {
        if (rankValues[i] < 1 || rankValues[i] > blackjack::MaxRankValue) {
            return getOutOfRangeError("rank-values", 1, blackjack::MaxRankValue);
        }
        rules.rankValues[i] = rankValues[i];
    }

    if (!loadFieldOptional(rules.initialCardsPerHand, input, "initial-cards-per-hand", blackjack::DefaultInitialCardsPerHand)) {
        return getMalformedFieldError("initial-cards-per-hand");
    }
    if (rules.initialCardsPerHand < 1 || rules.initialCardsPerHand > blackjack::MaxInitialCardsPerHand) {
        return getOutOfRangeError("initial-cards-per-hand", 1, blackjack::MaxInitialCardsPerHand);
    }

    if (!loadFieldOptional(settings.maxSearchDepth, input, "max-search-depth", blackjack::DefaultMaxSearchDepth)) {
        return getMalformedFieldError("max-search-depth");
    }
    if (settings.maxSearchDepth < 1 || settings.maxSearchDepth > blackjack::MaxSearchDepth) {
        return getOutOfRangeError("max-search-depth", 1, blackjack::MaxSearchDepth);
    }

    return settings;
}
} // namespace

Result<RulesSettings> buildSettingsFromYaml(const YAML::Node& input) {
    return buildSettings(input).withErrorContext("Error loading rules: ");
}

Result<RulesSettings> loadSettingsFromFile(const std::string& filePath) {
    YAML::Node input;

    try {
        input = YAML::LoadFile(filePath);
    }
    catch (const YAML::Exception& e) {
        return "Error loading rules: Could not load settings file. " + std::string{ e.what() };
    }

    return buildSettingsFromYaml(input);
}
