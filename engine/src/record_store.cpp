#include "gi/record_store.h"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>

namespace gi {

// --- InMemoryRecordStore ---

InMemoryRecordStore::InMemoryRecordStore(std::vector<TeamRow> teams, std::vector<GameRow> games,
                                         std::vector<PlayRow> plays)
    : teams_(std::move(teams)), games_(std::move(games)), plays_(std::move(plays)) {}

std::vector<TeamRow> InMemoryRecordStore::teams() const {
    return teams_;
}

std::optional<TeamRow> InMemoryRecordStore::findTeam(const std::string& abbr) const {
    auto it = std::find_if(teams_.begin(), teams_.end(),
                           [&](const TeamRow& t) { return t.abbr == abbr; });
    if (it == teams_.end()) return std::nullopt;
    return *it;
}

std::optional<GameRow> InMemoryRecordStore::findGame(const std::string& gameId) const {
    auto it = std::find_if(games_.begin(), games_.end(),
                           [&](const GameRow& g) { return g.gameId == gameId; });
    if (it == games_.end()) return std::nullopt;
    return *it;
}

std::vector<GameRow> InMemoryRecordStore::gamesInWindow(int season, const std::string& startDate,
                                                        const std::string& endDate) const {
    std::vector<GameRow> result;
    for (const auto& g : games_) {
        // ISO dates order lexicographically
        if (g.season == season && g.gameDate >= startDate && g.gameDate <= endDate) {
            result.push_back(g);
        }
    }
    return result;
}

std::vector<PlayRow> InMemoryRecordStore::offensivePlays(const std::string& team, int season) const {
    std::vector<PlayRow> result;
    for (const auto& p : plays_) {
        if (p.season == season && p.posteam == team) result.push_back(p);
    }
    return result;
}

std::vector<PlayRow> InMemoryRecordStore::defensivePlays(const std::string& team, int season) const {
    std::vector<PlayRow> result;
    for (const auto& p : plays_) {
        if (p.season == season && p.defteam == team) result.push_back(p);
    }
    return result;
}

std::vector<PlayRow> InMemoryRecordStore::gamePlays(const std::string& gameId) const {
    std::vector<PlayRow> result;
    for (const auto& p : plays_) {
        if (p.gameId == gameId) result.push_back(p);
    }
    return result;
}

// --- JSON Loading ---

namespace {

std::optional<int> optionalInt(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return j[key].get<int>();
}

std::optional<std::string> optionalString(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return j[key].get<std::string>();
}

bool flag(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return false;
    return j[key].get<bool>();
}

TeamRow parseTeam(const nlohmann::json& j) {
    TeamRow t;
    t.abbr = j.at("team_abbr").get<std::string>();
    t.name = optionalString(j, "team_name").value_or("");
    t.nickname = optionalString(j, "team_nick").value_or("");
    t.conference = optionalString(j, "team_conf").value_or("");
    t.division = optionalString(j, "team_division").value_or("");
    return t;
}

GameRow parseGame(const nlohmann::json& j) {
    GameRow g;
    g.gameId = j.at("game_id").get<std::string>();
    g.season = j.at("season").get<int>();
    g.week = optionalInt(j, "week").value_or(0);
    g.gameDate = optionalString(j, "game_date").value_or("");
    g.homeTeam = j.at("home_team").get<std::string>();
    g.awayTeam = j.at("away_team").get<std::string>();
    g.homeScore = optionalInt(j, "home_score");
    g.awayScore = optionalInt(j, "away_score");
    g.surface = optionalString(j, "surface").value_or("");
    g.roof = optionalString(j, "roof").value_or("");
    g.temperature = optionalInt(j, "temp");
    g.wind = optionalInt(j, "wind");
    return g;
}

PlayRow parsePlay(const nlohmann::json& j) {
    PlayRow p;
    p.playId = optionalString(j, "play_id").value_or("");
    p.gameId = j.at("game_id").get<std::string>();
    p.season = j.at("season").get<int>();
    p.week = optionalInt(j, "week").value_or(0);
    p.posteam = optionalString(j, "posteam").value_or("");
    p.defteam = optionalString(j, "defteam").value_or("");
    p.quarter = optionalInt(j, "qtr");
    p.gameSecondsRemaining = optionalInt(j, "game_seconds_remaining");
    p.down = optionalInt(j, "down");
    p.ydstogo = optionalInt(j, "ydstogo");
    p.yardline100 = optionalInt(j, "yardline_100");
    p.scoreDifferential = optionalInt(j, "score_differential");
    p.playType = optionalString(j, "play_type");
    p.yardsGained = optionalInt(j, "yards_gained");
    p.touchdown = flag(j, "touchdown");
    p.interception = flag(j, "interception");
    p.fumbleLost = flag(j, "fumble_lost");
    return p;
}

std::unique_ptr<InMemoryRecordStore> parseStore(const nlohmann::json& j) {
    auto store = std::make_unique<InMemoryRecordStore>();
    if (j.contains("teams")) {
        for (auto& t : j["teams"]) store->addTeam(parseTeam(t));
    }
    if (j.contains("games")) {
        for (auto& g : j["games"]) store->addGame(parseGame(g));
    }
    if (j.contains("plays")) {
        for (auto& p : j["plays"]) store->addPlay(parsePlay(p));
    }
    return store;
}

} // anonymous namespace

std::unique_ptr<InMemoryRecordStore> loadRecordStore(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::warn("Cannot open record file {}", path);
        return nullptr;
    }
    nlohmann::json j = nlohmann::json::parse(file);
    std::unique_ptr<InMemoryRecordStore> store = parseStore(j);
    spdlog::debug("Loaded {} teams, {} games, {} plays from {}", store->teams().size(),
                  store->gameCount(), store->playCount(), path);
    return store;
}

std::unique_ptr<InMemoryRecordStore> loadRecordStoreFromString(const std::string& json) {
    auto j = nlohmann::json::parse(json);
    return parseStore(j);
}

} // namespace gi
