// include/chesscore/adapters/remote.h
#ifndef CHESSCORE_REMOTE_H
#define CHESSCORE_REMOTE_H

#include <string>
#include "chesscore/game/chess_game.h"

namespace chesscore {
namespace adapters {

/**
 * @brief Message channel to a network peer
 *
 * Implementations report transport failures with core::ChannelException.
 */
class IMoveChannel {
public:
    virtual ~IMoveChannel() = default;

    virtual void send(const std::string& message) = 0;

    /**
     * @brief Block until the peer sends a message
     *
     * @return The message; empty when the connection was closed
     */
    virtual std::string receive() = 0;
};

/**
 * @brief Plays the network peer's side of a game
 *
 * Moves travel as network tokens. Any failure ends the game from the
 * caller's point of view; nothing is retried here.
 */
class RemoteOpponent {
public:
    /**
     * @brief Constructor
     *
     * @param channel Channel to the peer, must outlive the opponent
     * @param color Color the peer plays
     */
    RemoteOpponent(IMoveChannel& channel, core::PieceColor color);

    core::PieceColor color() const { return color_; }

    /**
     * @brief Send a local move, including its promotion letter
     */
    void sendMove(const core::PieceMove& move);

    /**
     * @brief Send the latest move of a game
     *
     * @return false if the game has no move yet
     */
    bool sendLastMove(const game::ChessGame& game);

    /**
     * @brief Tell the peer the game is over
     */
    void sendEnd();

    /**
     * @brief Wait for the peer's move and play it
     *
     * @return The move played
     * @throws core::ChannelException if the peer ended the game, the channel
     *         failed, or the token is not a legal move
     */
    core::PieceMove receiveMove(game::ChessGame& game);

private:
    IMoveChannel& channel_;
    core::PieceColor color_;
};

} // namespace adapters
} // namespace chesscore

#endif // CHESSCORE_REMOTE_H
