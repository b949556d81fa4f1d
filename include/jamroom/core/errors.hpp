#pragma once

#include <stdexcept>
#include <string>

namespace jamroom {

/**
 * @brief Base class for every error raised by the collaboration core
 */
class JamRoomError : public std::runtime_error {
  public:
    explicit JamRoomError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Connectivity or broadcast failure
 *
 * Transient: the transport retries with backoff and the session reports
 * a "reconnecting" state. Never fatal.
 */
class TransportError : public JamRoomError {
  public:
    explicit TransportError(const std::string& message) : JamRoomError(message) {}
};

/**
 * @brief A mutation event that cannot be merged (malformed, wrong project, out of range)
 *
 * Remote events raising this are logged and dropped; the table is left untouched.
 */
class ConflictApplyError : public JamRoomError {
  public:
    explicit ConflictApplyError(const std::string& message) : JamRoomError(message) {}
};

/**
 * @brief A durable store write failed after the optimistic local apply
 *
 * The local state is kept; the caller should flag "changes may not be saved".
 */
class PersistenceError : public JamRoomError {
  public:
    explicit PersistenceError(const std::string& message) : JamRoomError(message) {}
};

/**
 * @brief A mixdown attempt failed. Never accompanied by a partial result.
 */
class MixdownError : public JamRoomError {
  public:
    enum class Kind {
        EmptyInput,
        DecodeFailure,
        UnsupportedFormat,
        InvalidRequest,
        Cancelled,
        Internal  // anything the engine did not classify, e.g. out of memory
    };

    MixdownError(Kind kind, const std::string& message)
        : JamRoomError(message), kind_(kind) {}

    Kind getKind() const {
        return kind_;
    }

  private:
    Kind kind_;
};

inline const char* getMixdownErrorKindName(MixdownError::Kind kind) {
    switch (kind) {
        case MixdownError::Kind::EmptyInput:
            return "EmptyInput";
        case MixdownError::Kind::DecodeFailure:
            return "DecodeFailure";
        case MixdownError::Kind::UnsupportedFormat:
            return "UnsupportedFormat";
        case MixdownError::Kind::InvalidRequest:
            return "InvalidRequest";
        case MixdownError::Kind::Cancelled:
            return "Cancelled";
        case MixdownError::Kind::Internal:
            return "Internal";
    }
    return "Unknown";
}

}  // namespace jamroom
