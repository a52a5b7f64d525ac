#include "gi/play_metrics.h"
#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace gi {

Situation situationBefore(const PlayInput& play) {
    return Situation(play.down.value_or(1),
                     play.ydstogo.value_or(10),
                     play.yardline100.value_or(50),
                     play.quarter.value_or(1),
                     play.gameSecondsRemaining.value_or(GAME_SECONDS),
                     play.scoreDifferential.value_or(0),
                     play.timeoutsRemaining.value_or(3),
                     play.playType.value_or("pass"));
}

const char* outcomeName(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::TOUCHDOWN: return "touchdown";
        case OutcomeKind::TURNOVER: return "turnover";
        case OutcomeKind::NORMAL_GAIN: return "normal_gain";
        case OutcomeKind::TURNOVER_ON_DOWNS: return "turnover_on_downs";
    }
    return "unknown";
}

PlayOutcome classifyOutcome(const PlayInput& play, const Situation& before) {
    if (play.touchdown) {
        return {OutcomeKind::TOUCHDOWN, std::nullopt};
    }
    if (play.interception || play.fumbleLost) {
        return {OutcomeKind::TURNOVER, std::nullopt};
    }

    int gained = play.yardsGained.value_or(0);
    bool firstDown = gained >= before.ydstogo();
    int newDown = firstDown ? 1 : before.down() + 1;

    // Situation clamps the down, so turnover on downs is decided here
    Situation after(newDown,
                    firstDown ? 10 : before.ydstogo() - gained,
                    std::max(0, before.yardline100() - gained),
                    before.quarter(),
                    std::max(0, before.gameSecondsRemaining() - PLAY_CLOCK_SECONDS),
                    before.scoreDifferential(),
                    before.timeoutsRemaining(),
                    before.playType());

    OutcomeKind kind = newDown > MAX_DOWN ? OutcomeKind::TURNOVER_ON_DOWNS
                                          : OutcomeKind::NORMAL_GAIN;
    return {kind, after};
}

bool isSuccessfulPlay(int down, int ydstogo, int yardsGained) {
    if (down <= 2) {
        return yardsGained >= std::max(4.0, ydstogo * 0.5);
    }
    return yardsGained >= ydstogo;
}

double clutchMultiplier(const Situation& before, bool success) {
    double multiplier = 1.0;
    if (before.gameSecondsRemaining() < 300) {
        multiplier = 1.5;
    }
    if (before.isCloseGame()) {
        multiplier *= 1.3;
    }
    return success ? multiplier : multiplier * 0.5;
}

MetricBundle PlayMetricsEngine::computeMetrics(const PlayInput& play) const {
    Situation before = situationBefore(play);
    PlayOutcome outcome = classifyOutcome(play, before);

    MetricBundle m;
    m.outcome = outcome.kind;
    m.expectedPointsBefore = epModel_.expectedPoints(before);
    m.winProbBefore = wpModel_.winProbability(before);

    switch (outcome.kind) {
        case OutcomeKind::TOUCHDOWN:
            m.expectedPointsAfter = TOUCHDOWN_POINTS;
            m.winProbAfter = std::min(0.95, m.winProbBefore + 0.15);
            break;
        case OutcomeKind::TURNOVER:
            // Opponent takes over at the same spot
            m.expectedPointsAfter = -m.expectedPointsBefore;
            m.winProbAfter = 1.0 - m.winProbBefore;
            break;
        case OutcomeKind::NORMAL_GAIN:
            m.expectedPointsAfter = epModel_.expectedPoints(*outcome.after);
            m.winProbAfter = wpModel_.winProbability(*outcome.after);
            break;
        case OutcomeKind::TURNOVER_ON_DOWNS:
            m.expectedPointsAfter = -epModel_.expectedPoints(*outcome.after);
            m.winProbAfter = 1.0 - wpModel_.winProbability(*outcome.after);
            break;
    }

    m.epa = m.expectedPointsAfter - m.expectedPointsBefore;
    m.wpa = m.winProbAfter - m.winProbBefore;
    m.leverage = std::max(MIN_LEVERAGE, std::abs(m.wpa));

    int gained = play.yardsGained.value_or(0);
    bool success = isSuccessfulPlay(before.down(), before.ydstogo(), gained);
    m.successRate = success ? 1.0 : 0.0;
    m.clutchIndex = m.epa * clutchMultiplier(before, success);
    m.explosivePlay = gained >= EXPLOSIVE_YARDS || play.touchdown;

    return m;
}

} // namespace gi
