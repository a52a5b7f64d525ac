#pragma once

#include "gi/records.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gi {

// Read-only access to season/team/game/play rows.
class RecordStore {
public:
    virtual ~RecordStore() = default;

    virtual std::vector<TeamRow> teams() const = 0;
    virtual std::optional<TeamRow> findTeam(const std::string& abbr) const = 0;
    virtual std::optional<GameRow> findGame(const std::string& gameId) const = 0;

    // Games of a season with startDate <= gameDate <= endDate (ISO dates)
    virtual std::vector<GameRow> gamesInWindow(int season, const std::string& startDate,
                                               const std::string& endDate) const = 0;

    virtual std::vector<PlayRow> offensivePlays(const std::string& team, int season) const = 0;
    virtual std::vector<PlayRow> defensivePlays(const std::string& team, int season) const = 0;
    virtual std::vector<PlayRow> gamePlays(const std::string& gameId) const = 0;
};

class InMemoryRecordStore : public RecordStore {
    std::vector<TeamRow> teams_;
    std::vector<GameRow> games_;
    std::vector<PlayRow> plays_;

public:
    InMemoryRecordStore() = default;
    InMemoryRecordStore(std::vector<TeamRow> teams, std::vector<GameRow> games,
                        std::vector<PlayRow> plays);

    void addTeam(TeamRow team) { teams_.push_back(std::move(team)); }
    void addGame(GameRow game) { games_.push_back(std::move(game)); }
    void addPlay(PlayRow play) { plays_.push_back(std::move(play)); }

    std::vector<TeamRow> teams() const override;
    std::optional<TeamRow> findTeam(const std::string& abbr) const override;
    std::optional<GameRow> findGame(const std::string& gameId) const override;
    std::vector<GameRow> gamesInWindow(int season, const std::string& startDate,
                                       const std::string& endDate) const override;
    std::vector<PlayRow> offensivePlays(const std::string& team, int season) const override;
    std::vector<PlayRow> defensivePlays(const std::string& team, int season) const override;
    std::vector<PlayRow> gamePlays(const std::string& gameId) const override;

    size_t playCount() const { return plays_.size(); }
    size_t gameCount() const { return games_.size(); }
};

// Load {"teams": [...], "games": [...], "plays": [...]} from a JSON file; nullptr if unreadable
std::unique_ptr<InMemoryRecordStore> loadRecordStore(const std::string& path);

// Load from JSON string (for testing)
std::unique_ptr<InMemoryRecordStore> loadRecordStoreFromString(const std::string& json);

} // namespace gi
