// src/game/clock.cpp
#include "chesscore/game/clock.h"
#include <spdlog/fmt/fmt.h>
#include <utility>

namespace chesscore {
namespace game {

using core::PieceColor;

Clock::Clock(int seconds, TimeSource timeSource)
    : white_time_(std::chrono::seconds(seconds)),
      black_time_(std::chrono::seconds(seconds)),
      now_(timeSource ? std::move(timeSource) : TimeSource([] { return std::chrono::steady_clock::now(); })) {
}

void Clock::start(PieceColor color) {
    if (running_) {
        stop();
    }
    active_color_ = color;
    turn_start_ = now_();
    running_ = true;
}

void Clock::stop() {
    if (turn_start_ && active_color_) {
        Duration& remaining = *active_color_ == PieceColor::WHITE ? white_time_ : black_time_;
        Duration spent = elapsed();
        remaining = spent < remaining ? remaining - spent : Duration::zero();
    }
    turn_start_.reset();
    active_color_.reset();
    running_ = false;
}

Clock::Duration Clock::elapsed() const {
    if (!turn_start_) {
        return Duration::zero();
    }
    return std::chrono::duration_cast<Duration>(now_() - *turn_start_);
}

Clock::Duration Clock::getTime(PieceColor color) const {
    Duration base = color == PieceColor::WHITE ? white_time_ : black_time_;

    // Deduct the running turn
    if (running_ && active_color_ == color) {
        Duration spent = elapsed();
        return spent < base ? base - spent : Duration::zero();
    }
    return base;
}

bool Clock::isTimeUp(PieceColor color) const {
    return getTime(color) == Duration::zero();
}

bool Clock::anyTimeUp() const {
    return isTimeUp(PieceColor::WHITE) || isTimeUp(PieceColor::BLACK);
}

std::optional<PieceColor> Clock::timeUpColor() const {
    if (isTimeUp(PieceColor::WHITE)) {
        return PieceColor::WHITE;
    }
    if (isTimeUp(PieceColor::BLACK)) {
        return PieceColor::BLACK;
    }
    return std::nullopt;
}

std::string Clock::formatTime(PieceColor color) const {
    auto millisTotal = getTime(color).count();
    auto totalSeconds = millisTotal / 1000;
    auto millis = millisTotal % 1000;
    auto minutes = totalSeconds / 60;
    auto seconds = totalSeconds % 60;

    if (minutes > 0) {
        return fmt::format("{:02}:{:02}", minutes, seconds);
    }
    return fmt::format("{:02}.{:03}", seconds, millis);
}

} // namespace game
} // namespace chesscore
