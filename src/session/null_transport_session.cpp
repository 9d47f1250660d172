// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "session/null_transport_session.hpp"
#include "util/logging.hpp"

namespace peerlink {
namespace session {

namespace {
const char *const NO_LINK = "no peer link on this host";
} // namespace

void NullTransportSession::activate() {
  LOG_TRANSPORT_DEBUG("activate() on host without peer link");
  throw SessionException(SessionError::Unsupported(NO_LINK));
}

void NullTransportSession::send_interactive(const GenericMessage &,
                                            InteractiveCompletion completion) {
  if (completion) {
    completion(EmptyMessage(), SessionError::Unsupported(NO_LINK));
  }
}

void NullTransportSession::send_queued(const GenericMessage &) {
  throw SessionException(SessionError::Unsupported(NO_LINK));
}

void NullTransportSession::send_binary(const Bytes &,
                                       BinaryCompletion completion) {
  if (completion) {
    completion(Bytes{}, SessionError::Unsupported(NO_LINK));
  }
}

void NullTransportSession::set_delegate(
    std::shared_ptr<TransportSessionDelegate>) {
  // Nothing is ever delivered
}

} // namespace session
} // namespace peerlink
