// src/config/game_config.cpp
#include "chesscore/config/game_config.h"
#include "chesscore/core/exceptions.h"
#include "chesscore/util/logging.h"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace chesscore {
namespace config {

using json = nlohmann::json;
using core::ConfigException;

adapters::EngineSettings GameConfig::engineSettings() const {
    adapters::EngineSettings settings;
    settings.depth = bot_depth;
    settings.difficulty = bot_difficulty;
    return settings;
}

void GameConfig::validate() const {
    if (bot_depth < 1 || bot_depth > 255) {
        throw ConfigException("bot_depth must be between 1 and 255, got " + std::to_string(bot_depth));
    }
    if (clock_seconds < 0) {
        throw ConfigException("clock_seconds must not be negative");
    }
    if (!util::parseLogLevel(log_level)) {
        throw ConfigException("Unknown log_level: " + log_level);
    }
    if (engine_path && engine_path->empty()) {
        throw ConfigException("engine_path must not be empty");
    }
}

std::string GameConfig::toJson() const {
    json j;
    j["engine_path"] = engine_path ? json(*engine_path) : json(nullptr);
    j["log_level"] = log_level;
    j["bot_depth"] = bot_depth;
    j["bot_difficulty"] = bot_difficulty
        ? json(adapters::difficultyPreset(*bot_difficulty).name)
        : json(nullptr);
    j["clock_seconds"] = clock_seconds;
    return j.dump(4);  // Pretty print with 4-space indent
}

GameConfig GameConfig::fromJson(const std::string& jsonStr) {
    GameConfig config;
    try {
        json j = json::parse(jsonStr);

        if (j.contains("engine_path") && !j["engine_path"].is_null()) {
            config.engine_path = j["engine_path"].get<std::string>();
        }
        if (j.contains("log_level") && !j["log_level"].is_null()) {
            config.log_level = j["log_level"].get<std::string>();
        }
        if (j.contains("bot_depth") && !j["bot_depth"].is_null()) {
            config.bot_depth = j["bot_depth"].get<int>();
        }
        if (j.contains("bot_difficulty") && !j["bot_difficulty"].is_null()) {
            const json& difficulty = j["bot_difficulty"];
            if (difficulty.is_number_integer()) {
                int index = difficulty.get<int>();
                if (index < 0 || index >= static_cast<int>(adapters::DIFFICULTY_PRESETS.size())) {
                    throw ConfigException("bot_difficulty index out of range: " + std::to_string(index));
                }
                config.bot_difficulty = static_cast<adapters::BotDifficulty>(index);
            } else {
                std::string name = difficulty.get<std::string>();
                config.bot_difficulty = adapters::difficultyFromName(name);
                if (!config.bot_difficulty) {
                    throw ConfigException("Unknown bot_difficulty: " + name);
                }
            }
        }
        if (j.contains("clock_seconds") && !j["clock_seconds"].is_null()) {
            config.clock_seconds = j["clock_seconds"].get<int>();
        }
    } catch (const json::exception& e) {
        throw ConfigException("Failed to parse JSON: " + std::string(e.what()));
    }

    config.validate();
    return config;
}

bool GameConfig::saveToFile(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << toJson();
    return static_cast<bool>(file);
}

GameConfig GameConfig::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw ConfigException("Could not open file: " + filename);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    return fromJson(buffer.str());
}

} // namespace config
} // namespace chesscore
