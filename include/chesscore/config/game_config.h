// include/chesscore/config/game_config.h
#ifndef CHESSCORE_GAME_CONFIG_H
#define CHESSCORE_GAME_CONFIG_H

#include <optional>
#include <string>
#include "chesscore/adapters/engine.h"

namespace chesscore {
namespace config {

/**
 * @brief Settings passed explicitly to whatever sets up a game
 *
 * Every field is optional in the JSON form; missing fields keep their
 * defaults.
 */
struct GameConfig {
    std::optional<std::string> engine_path;
    std::string log_level = "off";
    int bot_depth = adapters::EngineSettings::DEFAULT_DEPTH;
    std::optional<adapters::BotDifficulty> bot_difficulty;  // Empty means full strength
    int clock_seconds = 0;                                   // 0 disables the clock

    /**
     * @brief Engine search limits derived from the bot fields
     */
    adapters::EngineSettings engineSettings() const;

    /**
     * @brief Check ranges and names
     *
     * @throws core::ConfigException describing the first invalid field
     */
    void validate() const;

    // Serialization methods
    std::string toJson() const;

    /**
     * @throws core::ConfigException on malformed JSON or invalid values
     */
    static GameConfig fromJson(const std::string& json);

    bool saveToFile(const std::string& filename) const;

    /**
     * @throws core::ConfigException if the file cannot be read or parsed
     */
    static GameConfig loadFromFile(const std::string& filename);
};

} // namespace config
} // namespace chesscore

#endif // CHESSCORE_GAME_CONFIG_H
