// src/adapters/remote.cpp
#include "chesscore/adapters/remote.h"
#include "chesscore/core/exceptions.h"
#include "chesscore/notation/move_codec.h"
#include <spdlog/spdlog.h>

namespace chesscore {
namespace adapters {

using core::ChannelException;
using notation::MoveCodec;

RemoteOpponent::RemoteOpponent(IMoveChannel& channel, core::PieceColor color)
    : channel_(channel), color_(color) {
}

void RemoteOpponent::sendMove(const core::PieceMove& move) {
    std::string token = MoveCodec::formatNetworkToken({move.from, move.to, move.promotion});
    spdlog::debug("RemoteOpponent: Sending {}", token);
    channel_.send(token);
}

bool RemoteOpponent::sendLastMove(const game::ChessGame& game) {
    auto move = game.gameBoard().lastMove();
    if (!move) {
        return false;
    }
    sendMove(*move);
    return true;
}

void RemoteOpponent::sendEnd() {
    spdlog::info("RemoteOpponent: Ending game");
    channel_.send(MoveCodec::END_TOKEN);
}

core::PieceMove RemoteOpponent::receiveMove(game::ChessGame& game) {
    std::string token = channel_.receive();

    if (MoveCodec::isEndToken(token)) {
        spdlog::error("RemoteOpponent: Game ended by the other opponent");
        throw ChannelException("Game ended by the other opponent", true);
    }

    if (game.turn() != color_ || !game.applyNetworkMove(token)) {
        spdlog::error("RemoteOpponent: Invalid move received '{}'", token);
        throw ChannelException("Invalid move received: " + token, false);
    }

    auto move = game.gameBoard().lastMove();
    if (!move) {
        throw ChannelException("Move was not recorded: " + token, false);
    }
    return *move;
}

} // namespace adapters
} // namespace chesscore
