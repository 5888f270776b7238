// include/chesscore/adapters/engine.h
#ifndef CHESSCORE_ENGINE_H
#define CHESSCORE_ENGINE_H

#include <array>
#include <optional>
#include <string>
#include "chesscore/game/chess_game.h"

namespace chesscore {
namespace adapters {

/**
 * @brief Strength presets for the engine opponent
 */
enum class BotDifficulty {
    EASY,
    MEDIUM,
    HARD,
    MAGNUS
};

struct DifficultyPreset {
    const char* name;
    int depth;
    int movetime_ms;
    int elo;
};

extern const std::array<DifficultyPreset, 4> DIFFICULTY_PRESETS;

const DifficultyPreset& difficultyPreset(BotDifficulty difficulty);

/**
 * @brief Parse a preset name ("easy", "Medium", ...)
 */
std::optional<BotDifficulty> difficultyFromName(const std::string& name);

/**
 * @brief Search limits sent with every request
 *
 * Without a difficulty the engine searches to @c depth at full strength.
 */
struct EngineSettings {
    static constexpr int DEFAULT_DEPTH = 10;

    int depth = DEFAULT_DEPTH;
    std::optional<BotDifficulty> difficulty;

    int effectiveDepth() const;
    std::optional<int> movetimeMs() const;
    std::optional<int> elo() const;
};

/**
 * @brief External move-suggestion engine
 *
 * The call blocks until the engine answers. Implementations report failures
 * with core::EngineException.
 */
class IMoveEngine {
public:
    virtual ~IMoveEngine() = default;

    /**
     * @brief Ask for the best move in a position
     *
     * @param fen Position in FEN
     * @param settings Search limits
     * @return Long algebraic move, e.g. "e2e4" or "e7e8q"
     */
    virtual std::string bestMove(const std::string& fen, const EngineSettings& settings) = 0;
};

/**
 * @brief Line-oriented connection to a UCI engine
 */
class IUciTransport {
public:
    virtual ~IUciTransport() = default;

    virtual void writeLine(const std::string& line) = 0;

    /**
     * @brief Next line from the engine
     *
     * @return The line, or empty once the engine has gone away
     */
    virtual std::optional<std::string> readLine() = 0;
};

/**
 * @brief UCI command builders and reply parsers
 */
class UciProtocol {
public:
    static std::string uciCommand() { return "uci"; }
    static std::string isReadyCommand() { return "isready"; }
    static std::string quitCommand() { return "quit"; }
    static std::string setOptionCommand(const std::string& name, const std::string& value);
    static std::string positionCommand(const std::string& fen);

    /**
     * @brief "go depth N" with an optional "movetime" limit
     */
    static std::string goCommand(int depth, std::optional<int> movetimeMs);

    static bool isBestMoveLine(const std::string& line);

    /**
     * @brief Extract the move from a "bestmove" reply
     *
     * @return The move, or empty for malformed replies and "(none)"
     */
    static std::optional<std::string> parseBestMove(const std::string& line);
};

/**
 * @brief IMoveEngine speaking UCI over a transport
 */
class UciEngine : public IMoveEngine {
public:
    explicit UciEngine(IUciTransport& transport);

    std::string bestMove(const std::string& fen, const EngineSettings& settings) override;

    /**
     * @brief Send "quit"
     */
    void quit();

private:
    IUciTransport& transport_;
    bool initialized_ = false;
    std::optional<int> configured_elo_;

    void handshake();
    void configureStrength(const EngineSettings& settings);
    std::string waitFor(const std::string& prefix);
};

/**
 * @brief Plays the engine's side of a game
 */
class BotOpponent {
public:
    /**
     * @brief Constructor
     *
     * @param engine Engine to consult, must outlive the opponent
     * @param settings Search limits
     * @param color Color the engine plays
     */
    BotOpponent(IMoveEngine& engine, EngineSettings settings, core::PieceColor color);

    core::PieceColor color() const { return color_; }
    const EngineSettings& settings() const { return settings_; }

    /**
     * @brief Whether the game is waiting for the engine
     */
    bool isBotTurn(const game::ChessGame& game) const;

    /**
     * @brief Ask the engine for a move and play it
     *
     * @return The move played
     * @throws core::EngineException if the engine fails or answers with a
     *         malformed or illegal move
     */
    core::PieceMove playTurn(game::ChessGame& game);

private:
    IMoveEngine& engine_;
    EngineSettings settings_;
    core::PieceColor color_;
};

} // namespace adapters
} // namespace chesscore

#endif // CHESSCORE_ENGINE_H
