#include "gi/records.h"

namespace gi {

std::string TeamRow::fullName() const {
    if (name.empty()) return abbr;
    if (nickname.empty()) return name;
    return name + " " + nickname;
}

PlayInput toPlayInput(const PlayRow& row) {
    PlayInput play;
    play.down = row.down;
    play.ydstogo = row.ydstogo;
    play.yardline100 = row.yardline100;
    play.quarter = row.quarter;
    play.gameSecondsRemaining = row.gameSecondsRemaining;
    if (!play.gameSecondsRemaining) {
        play.gameSecondsRemaining = GAME_SECONDS - (row.quarter.value_or(1) - 1) * QUARTER_SECONDS;
    }
    play.scoreDifferential = row.scoreDifferential;
    play.playType = row.playType;
    play.yardsGained = row.yardsGained;
    play.touchdown = row.touchdown;
    play.interception = row.interception;
    play.fumbleLost = row.fumbleLost;
    return play;
}

} // namespace gi
