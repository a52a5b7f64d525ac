#include "gi/baseline_classifier.h"
#include "gi/config.h"
#include "gi/game_insights.h"
#include "gi/market.h"
#include "gi/narrative.h"
#include "gi/odds.h"
#include "gi/rankings.h"
#include "gi/record_store.h"
#include "gi/serialization.h"
#include "gi/team_insights.h"
#include "gi/validation.h"
#include "gi/value_betting.h"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

using namespace gi;

namespace {

struct Options {
    std::string command;
    std::string dataPath;
    std::string configPath;
    std::string team;
    std::string team2;
    int season = 2023;
    std::string gameId;
    std::string metric = "offensive_epa_per_play";
    int limit = 10;
    std::string startDate = "0000-00-00";
    std::string endDate = "9999-99-99";
    std::optional<double> probability;
    std::optional<int> odds;
    std::optional<int64_t> asOf;
    PlayInput play;
    bool verbose = false;
};

void printUsage() {
    std::cerr << "Usage: gridiron_cli --command=CMD [options]\n"
              << "\nCommands:\n"
              << "  play        Metrics for one play (--down, --togo, --yardline, ...)\n"
              << "  team        Season insight for --team\n"
              << "  game        Insight for --game\n"
              << "  leaders     League leaders for --metric\n"
              << "  metrics     List rankable metrics\n"
              << "  compare     Compare --team and --team2\n"
              << "  narrative   Season narrative for --team\n"
              << "  value-bets  Value bets on unplayed games between --start and --end\n"
              << "  validate    Back-test predictions on completed games between --start and --end\n"
              << "  odds        Price --probability against --odds\n"
              << "\nOptions:\n"
              << "  --data=PATH        Records JSON {\"teams\", \"games\", \"plays\"}\n"
              << "  --config=PATH      Analytics config JSON\n"
              << "  --team=ABBR        Team abbreviation\n"
              << "  --team2=ABBR       Second team for compare\n"
              << "  --season=N         Season (default: 2023)\n"
              << "  --game=ID          Game id\n"
              << "  --metric=NAME      Metric for leaders (default: offensive_epa_per_play)\n"
              << "  --limit=N          Number of leaders (default: 10)\n"
              << "  --start=DATE       Window start, YYYY-MM-DD\n"
              << "  --end=DATE         Window end, YYYY-MM-DD\n"
              << "  --probability=P    Fixed home win probability (replaces the EPA classifier)\n"
              << "  --odds=N           American odds\n"
              << "  --as-of=UNIX       Market quote time (default: now)\n"
              << "  --down=N --togo=N --yardline=N --quarter=N --seconds=N --score-diff=N\n"
              << "  --gained=N --play-type=T --touchdown --interception --fumble\n"
              << "  --verbose          Debug logging\n"
              << "  --help             Show this help\n";
}

Options parseArgs(int argc, char* argv[]) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.find("--command=") == 0) opts.command = arg.substr(10);
        else if (arg.find("--data=") == 0) opts.dataPath = arg.substr(7);
        else if (arg.find("--config=") == 0) opts.configPath = arg.substr(9);
        else if (arg.find("--team=") == 0) opts.team = arg.substr(7);
        else if (arg.find("--team2=") == 0) opts.team2 = arg.substr(8);
        else if (arg.find("--season=") == 0) opts.season = std::stoi(arg.substr(9));
        else if (arg.find("--game=") == 0) opts.gameId = arg.substr(7);
        else if (arg.find("--metric=") == 0) opts.metric = arg.substr(9);
        else if (arg.find("--limit=") == 0) opts.limit = std::stoi(arg.substr(8));
        else if (arg.find("--start=") == 0) opts.startDate = arg.substr(8);
        else if (arg.find("--end=") == 0) opts.endDate = arg.substr(6);
        else if (arg.find("--probability=") == 0) opts.probability = std::stod(arg.substr(14));
        else if (arg.find("--odds=") == 0) opts.odds = std::stoi(arg.substr(7));
        else if (arg.find("--as-of=") == 0) opts.asOf = std::stoll(arg.substr(8));
        else if (arg.find("--down=") == 0) opts.play.down = std::stoi(arg.substr(7));
        else if (arg.find("--togo=") == 0) opts.play.ydstogo = std::stoi(arg.substr(7));
        else if (arg.find("--yardline=") == 0) opts.play.yardline100 = std::stoi(arg.substr(11));
        else if (arg.find("--quarter=") == 0) opts.play.quarter = std::stoi(arg.substr(10));
        else if (arg.find("--seconds=") == 0) opts.play.gameSecondsRemaining = std::stoi(arg.substr(10));
        else if (arg.find("--score-diff=") == 0) opts.play.scoreDifferential = std::stoi(arg.substr(13));
        else if (arg.find("--gained=") == 0) opts.play.yardsGained = std::stoi(arg.substr(9));
        else if (arg.find("--play-type=") == 0) opts.play.playType = arg.substr(12);
        else if (arg == "--touchdown") opts.play.touchdown = true;
        else if (arg == "--interception") opts.play.interception = true;
        else if (arg == "--fumble") opts.play.fumbleLost = true;
        else if (arg == "--verbose") opts.verbose = true;
        else if (arg == "--help") { printUsage(); exit(0); }
        else { std::cerr << "Unknown option: " << arg << "\n"; printUsage(); exit(1); }
    }
    return opts;
}

int64_t nowSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string teamName(const RecordStore& store, const std::string& abbr) {
    std::optional<TeamRow> team = store.findTeam(abbr);
    return team ? team->fullName() : abbr;
}

nlohmann::json oddsReport(double probability, int odds) {
    double implied = oddsToProbability(odds);
    return {
        {"odds", odds},
        {"implied_probability", roundTo(implied, 4)},
        {"decimal_odds", roundTo(decimalOdds(odds), 4)},
        {"model_probability", roundTo(probability, 4)},
        {"fair_odds", probabilityToOdds(probability)},
        {"edge", roundTo(probability - implied, 4)},
        {"expected_value", roundTo(expectedValue(probability, odds), 4)},
        {"kelly_fraction", roundTo(kellyCriterion(probability, odds), 4)},
        {"label", favoriteLabel(probability)},
        {"confidence", confidenceLevel(probability)},
    };
}

// Returns the exit code
int run(const Options& opts) {
    AnalyticsConfig config;
    if (!opts.configPath.empty()) {
        std::unique_ptr<AnalyticsConfig> loaded = loadConfig(opts.configPath);
        if (!loaded) {
            std::cerr << "Failed to load config from: " << opts.configPath << "\n";
            return 1;
        }
        config = *loaded;
    }

    PlayMetricsEngine engine;

    if (opts.command == "play") {
        std::cout << nlohmann::json(engine.computeMetrics(opts.play)).dump(2) << "\n";
        return 0;
    }
    if (opts.command == "odds") {
        if (!opts.probability || !opts.odds) {
            std::cerr << "odds needs --probability and --odds\n";
            return 1;
        }
        std::cout << oddsReport(*opts.probability, *opts.odds).dump(2) << "\n";
        return 0;
    }
    if (opts.command == "metrics") {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& m : availableMetrics()) {
            out.push_back({{"name", m.name}, {"category", m.category}, {"description", m.description}});
        }
        std::cout << out.dump(2) << "\n";
        return 0;
    }

    if (opts.dataPath.empty()) {
        std::cerr << opts.command << " needs --data\n";
        return 1;
    }
    std::unique_ptr<InMemoryRecordStore> store = loadRecordStore(opts.dataPath);
    if (!store) {
        std::cerr << "Failed to load records from: " << opts.dataPath << "\n";
        return 1;
    }

    nlohmann::json out;
    if (opts.command == "team" || opts.command == "narrative") {
        std::optional<TeamInsight> insight = generateTeamInsight(*store, engine, opts.team, opts.season);
        if (!insight) {
            std::cerr << "No data for " << opts.team << " in " << opts.season << "\n";
            return 1;
        }
        if (opts.command == "team") {
            out = *insight;
        } else {
            std::cout << seasonNarrative(*insight, teamName(*store, opts.team)) << "\n";
            return 0;
        }
    } else if (opts.command == "game") {
        std::optional<GameInsight> insight =
            generateGameInsight(*store, engine, opts.gameId, config.momentumThreshold);
        if (!insight) {
            std::cerr << "Game not found: " << opts.gameId << "\n";
            return 1;
        }
        out = *insight;
    } else if (opts.command == "leaders") {
        out = leagueLeaders(*store, engine, opts.season, opts.metric, opts.limit);
    } else if (opts.command == "compare") {
        std::optional<TeamComparison> comparison = compareTeams(
            *store, engine, opts.team, opts.team2, opts.season, config.advantageThreshold);
        if (!comparison) {
            std::cerr << "Cannot compare " << opts.team << " and " << opts.team2 << "\n";
            return 1;
        }
        out = *comparison;
    } else if (opts.command == "value-bets" || opts.command == "validate") {
        std::unique_ptr<WinProbabilityClassifier> classifier;
        if (opts.probability) {
            classifier = std::make_unique<FixedClassifier>(*opts.probability);
        } else {
            classifier = std::make_unique<NetEpaClassifier>(*store, engine);
        }
        MockMarket market(config.market);
        int64_t asOf = opts.asOf.value_or(nowSeconds());

        if (opts.command == "value-bets") {
            out = upcomingValueBets(*store, *classifier, market, opts.season,
                                    opts.startDate, opts.endDate, asOf, config.valueBets);
        } else {
            ValidationMetrics metrics = validateWindow(*store, *classifier, market, opts.season,
                                                       opts.startDate, opts.endDate, asOf,
                                                       config.validationMinEdge);
            out = metrics;
            out["interpretation"] = {
                {"agreement", agreementLabel(metrics.agreementRate)},
                {"calibration", calibrationLabel(metrics.calibrationError)},
                {"value_potential", valuePotentialLabel(metrics.kellyRoi)},
            };
        }
    } else {
        std::cerr << "Unknown command: " << opts.command << "\n";
        printUsage();
        return 1;
    }

    std::cout << out.dump(2) << "\n";
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        Options opts = parseArgs(argc, argv);
        spdlog::set_level(opts.verbose ? spdlog::level::debug : spdlog::level::warn);

        if (opts.command.empty()) {
            printUsage();
            return 1;
        }
        return run(opts);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
