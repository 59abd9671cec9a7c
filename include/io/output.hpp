#ifndef OUTPUT_HPP
#define OUTPUT_HPP

#include "game/blackjack.hpp"
#include "solver/search_agent.hpp"

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

nlohmann::ordered_json buildRulesJSON(const Blackjack& rules);
nlohmann::ordered_json buildStrategyJSON(const Blackjack& rules, const std::vector<SearchAgent>& agents, int numThreads);

// Returns false if the file could not be opened
bool writeStrategyToJSON(const Blackjack& rules, const std::vector<SearchAgent>& agents, int numThreads, const std::string& filePath);

#endif // OUTPUT_HPP
