// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "session/session_error.hpp"

namespace peerlink {
namespace session {

std::string ErrorKindToString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::SessionUnsupported:
    return "SessionUnsupported";
  case ErrorKind::NoCounterpart:
    return "NoCounterpart";
  case ErrorKind::TransportFailure:
    return "TransportFailure";
  case ErrorKind::DecodeFailure:
    return "DecodeFailure";
  case ErrorKind::EncodeFailure:
    return "EncodeFailure";
  }
  return "Unknown";
}

std::string TransportErrorCodeToString(TransportErrorCode code) {
  switch (code) {
  case TransportErrorCode::None:
    return "None";
  case TransportErrorCode::Generic:
    return "Generic";
  case TransportErrorCode::SessionNotActivated:
    return "SessionNotActivated";
  case TransportErrorCode::SessionInactive:
    return "SessionInactive";
  case TransportErrorCode::DeviceNotPaired:
    return "DeviceNotPaired";
  case TransportErrorCode::CompanionNotInstalled:
    return "CompanionNotInstalled";
  case TransportErrorCode::NotReachable:
    return "NotReachable";
  case TransportErrorCode::MessageReplyFailed:
    return "MessageReplyFailed";
  case TransportErrorCode::MessageReplyTimedOut:
    return "MessageReplyTimedOut";
  case TransportErrorCode::PayloadTooLarge:
    return "PayloadTooLarge";
  case TransportErrorCode::PayloadUnsupportedTypes:
    return "PayloadUnsupportedTypes";
  case TransportErrorCode::InvalidParameter:
    return "InvalidParameter";
  case TransportErrorCode::TransferTimedOut:
    return "TransferTimedOut";
  }
  return "Unknown";
}

SessionError SessionError::Unsupported(const std::string &detail) {
  return SessionError(ErrorKind::SessionUnsupported, detail);
}

SessionError SessionError::NoCounterpart(const std::string &detail) {
  return SessionError(ErrorKind::NoCounterpart, detail);
}

SessionError SessionError::Transport(TransportErrorCode code,
                                     const std::string &detail) {
  return SessionError(ErrorKind::TransportFailure, detail, code);
}

SessionError SessionError::Decode(const std::string &detail) {
  return SessionError(ErrorKind::DecodeFailure, detail);
}

SessionError SessionError::Encode(const std::string &detail) {
  return SessionError(ErrorKind::EncodeFailure, detail);
}

std::string SessionError::ToString() const {
  std::string out = ErrorKindToString(kind_);
  if (code_ != TransportErrorCode::None) {
    out += "(" + TransportErrorCodeToString(code_) + ")";
  }
  if (!detail_.empty()) {
    out += ": " + detail_;
  }
  return out;
}

} // namespace session
} // namespace peerlink
