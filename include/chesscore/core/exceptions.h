// include/chesscore/core/exceptions.h
#ifndef CHESSCORE_EXCEPTIONS_H
#define CHESSCORE_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace chesscore {
namespace core {

/**
 * @brief Base class for all chesscore errors
 */
class ChessException : public std::runtime_error {
public:
    explicit ChessException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief A PGN move token could not be resolved to a legal move
 */
class PgnParseException : public ChessException {
public:
    PgnParseException(const std::string& token, const std::string& reason)
        : ChessException("Cannot apply move '" + token + "': " + reason),
          token_(token), reason_(reason) {}
    const std::string& getToken() const { return token_; }
    const std::string& getReason() const { return reason_; }
private:
    std::string token_;
    std::string reason_;
};

/**
 * @brief Malformed FEN text
 */
class FenParseException : public ChessException {
public:
    explicit FenParseException(const std::string& message)
        : ChessException(message) {}
};

/**
 * @brief The external move engine failed or answered with an unusable move
 */
class EngineException : public ChessException {
public:
    explicit EngineException(const std::string& message)
        : ChessException(message) {}
};

/**
 * @brief The remote peer channel failed or the peer ended the game
 */
class ChannelException : public ChessException {
public:
    ChannelException(const std::string& message, bool remoteEnded)
        : ChessException(message), remote_ended_(remoteEnded) {}
    bool isRemoteEnded() const { return remote_ended_; }
private:
    bool remote_ended_;
};

/**
 * @brief Invalid or unreadable configuration
 */
class ConfigException : public ChessException {
public:
    explicit ConfigException(const std::string& message)
        : ChessException(message) {}
};

} // namespace core
} // namespace chesscore

#endif // CHESSCORE_EXCEPTIONS_H
