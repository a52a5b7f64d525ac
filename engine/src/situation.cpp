#include "gi/situation.h"
#include <algorithm>
#include <cstdlib>

namespace gi {

Situation::Situation(int down, int ydstogo, int yardline100, int quarter,
                     int gameSecondsRemaining, int scoreDifferential,
                     int timeoutsRemaining, std::string playType)
    : down_(std::clamp(down, 1, MAX_DOWN)),
      ydstogo_(std::max(0, ydstogo)),
      yardline100_(std::clamp(yardline100, 0, FIELD_LENGTH)),
      quarter_(quarter),
      gameSecondsRemaining_(gameSecondsRemaining),
      scoreDifferential_(scoreDifferential),
      timeoutsRemaining_(timeoutsRemaining),
      playType_(std::move(playType)) {}

Situation Situation::fromFields(const SituationFields& fields) {
    return Situation(fields.down.value_or(1),
                     fields.ydstogo.value_or(10),
                     fields.yardline100.value_or(50),
                     fields.quarter.value_or(1),
                     fields.gameSecondsRemaining.value_or(HALF_SECONDS),
                     fields.scoreDifferential.value_or(0),
                     fields.timeoutsRemaining.value_or(3),
                     fields.playType.value_or("pass"));
}

bool Situation::isCloseGame() const {
    return std::abs(scoreDifferential_) <= 7;
}

} // namespace gi
