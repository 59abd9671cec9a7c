#include "io/output.hpp"

#include "game/blackjack.hpp"
#include "game/config.hpp"
#include "game/game_types.hpp"
#include "game/game_utils.hpp"
#include "solver/decision_table.hpp"
#include "solver/search_agent.hpp"

#include <fstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

using json = nlohmann::ordered_json;

namespace {
json buildJSONDecision(const SearchResult& result) {
    json j;
    j["Action"] = getActionName(result.bestAction);
    j["Stand Value"] = result.standValue;
    if (result.isHitValueExact) {
        j["Hit Value"] = result.hitValue;
    }
    else {
        j["Hit Value Upper Bound"] = result.hitValue;
    }
    j["Nodes Visited"] = result.nodesVisited;
    return j;
}

json buildJSONAgent(const Blackjack& rules, const SearchAgent& agent, int numThreads) {
    json j;
    j["Max Search Depth"] = agent.getMaxDepth();

    auto& strategy = j["Strategy"];
    for (const DecisionTableEntry& entry : buildDecisionTable(rules, agent, numThreads)) {
        strategy[getHandName(entry.playerHand)][getHandName(entry.dealerHand)] = buildJSONDecision(entry.result);
    }

    return j;
}
} // namespace

json buildRulesJSON(const Blackjack& rules) {
    const BlackjackConfig& config = rules.getConfig();

    json j;
    j["Target Total"] = config.targetTotal;
    j["Dealer Stand Threshold"] = config.dealerStandThreshold;
    j["Dealer Hits Soft 17"] = config.dealerHitsSoft17;
    j["Soft Aces"] = config.useSoftAces;
    j["Initial Cards Per Hand"] = config.initialCardsPerHand;

    auto& rankValues = j["Rank Values"];
    for (Rank rank : getAllRanks()) {
        rankValues[std::string{ getRankName(rank) }] = rules.getRankValue(rank);
    }

    return j;
}

json buildStrategyJSON(const Blackjack& rules, const std::vector<SearchAgent>& agents, int numThreads) {
    json j;
    j["Rules"] = buildRulesJSON(rules);

    auto& agentsJSON = j["Agents"];
    for (const SearchAgent& agent : agents) {
        agentsJSON[agent.getName()] = buildJSONAgent(rules, agent, numThreads);
    }

    return j;
}

bool writeStrategyToJSON(const Blackjack& rules, const std::vector<SearchAgent>& agents, int numThreads, const std::string& filePath) {
    std::ofstream file(filePath);
    if (!file.is_open()) {
        return false;
    }

    file << buildStrategyJSON(rules, agents, numThreads).dump(4) << std::endl;
    return file.good();
}
