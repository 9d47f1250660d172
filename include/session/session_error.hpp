// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <stdexcept>
#include <string>

namespace peerlink {
namespace session {

// Top-level failure taxonomy of the engine
enum class ErrorKind {
  SessionUnsupported, // platform/device cannot host a peer link
  NoCounterpart,      // peer unreachable and not installed, or binary send while unreachable
  TransportFailure,   // collaborator reported an error (see TransportErrorCode)
  DecodeFailure,      // unregistered type key or malformed payload
  EncodeFailure       // binary serialization failed
};

// Error reported by the underlying transport, carried by TransportFailure
enum class TransportErrorCode {
  None,
  Generic,
  SessionNotActivated,
  SessionInactive,
  DeviceNotPaired,
  CompanionNotInstalled,
  NotReachable,
  MessageReplyFailed,
  MessageReplyTimedOut,
  PayloadTooLarge,
  PayloadUnsupportedTypes,
  InvalidParameter,
  TransferTimedOut
};

std::string ErrorKindToString(ErrorKind kind);
std::string TransportErrorCodeToString(TransportErrorCode code);

/**
 * SessionError - value describing one failure
 *
 * Returned inside SendOutcome::Failed, published on the diagnostic
 * channels and carried by SessionException.
 */
class SessionError {
public:
  SessionError() = default;
  SessionError(ErrorKind kind, std::string detail,
               TransportErrorCode code = TransportErrorCode::None)
      : kind_(kind), code_(code), detail_(std::move(detail)) {}

  static SessionError Unsupported(const std::string &detail);
  static SessionError NoCounterpart(const std::string &detail);
  static SessionError Transport(TransportErrorCode code,
                                const std::string &detail = "");
  static SessionError Decode(const std::string &detail);
  static SessionError Encode(const std::string &detail);

  ErrorKind kind() const { return kind_; }
  TransportErrorCode transport_code() const { return code_; }
  const std::string &detail() const { return detail_; }

  // "TransportFailure(MessageReplyTimedOut): no reply within 10000 ms"
  std::string ToString() const;

  bool operator==(const SessionError &other) const {
    return kind_ == other.kind_ && code_ == other.code_;
  }
  bool operator!=(const SessionError &other) const { return !(*this == other); }

private:
  ErrorKind kind_{ErrorKind::TransportFailure};
  TransportErrorCode code_{TransportErrorCode::None};
  std::string detail_;
};

/**
 * SessionException - thrown by activate() and by the throwing
 * TransportSession operations (activate, send_queued)
 */
class SessionException : public std::runtime_error {
public:
  explicit SessionException(SessionError error)
      : std::runtime_error(error.ToString()), error_(std::move(error)) {}

  const SessionError &error() const { return error_; }
  ErrorKind kind() const { return error_.kind(); }

private:
  SessionError error_;
};

} // namespace session
} // namespace peerlink
