// include/chesscore/game/clock.h
#ifndef CHESSCORE_CLOCK_H
#define CHESSCORE_CLOCK_H

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include "chesscore/core/piece.h"

namespace chesscore {
namespace game {

/**
 * @brief Chess clock with one countdown per color
 *
 * Only the active color's time runs. Remaining time never goes below zero.
 */
class Clock {
public:
    using Duration = std::chrono::milliseconds;
    using TimePoint = std::chrono::steady_clock::time_point;
    using TimeSource = std::function<TimePoint()>;

    static constexpr int DEFAULT_SECONDS = 10 * 60;

    /**
     * @brief Constructor
     *
     * @param seconds Time per player
     * @param timeSource Current time provider, steady_clock by default
     */
    explicit Clock(int seconds = DEFAULT_SECONDS, TimeSource timeSource = nullptr);

    /**
     * @brief Start running the clock of a color
     *
     * A clock already running for the other color is stopped first.
     */
    void start(core::PieceColor color);

    /**
     * @brief Stop the clock and charge the elapsed time to the active color
     */
    void stop();

    /**
     * @brief Remaining time, including the turn in progress
     */
    Duration getTime(core::PieceColor color) const;

    bool isTimeUp(core::PieceColor color) const;
    bool anyTimeUp() const;

    /**
     * @brief The color that ran out of time, White checked first
     */
    std::optional<core::PieceColor> timeUpColor() const;

    /**
     * @brief "MM:SS" from one minute up, "SS.mmm" below
     */
    std::string formatTime(core::PieceColor color) const;

    bool isRunning() const { return running_; }
    std::optional<core::PieceColor> activeColor() const { return active_color_; }

private:
    Duration white_time_;
    Duration black_time_;
    std::optional<TimePoint> turn_start_;
    std::optional<core::PieceColor> active_color_;
    bool running_ = false;
    TimeSource now_;

    Duration elapsed() const;
};

} // namespace game
} // namespace chesscore

#endif // CHESSCORE_CLOCK_H
