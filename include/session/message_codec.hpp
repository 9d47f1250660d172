// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "session/generic_message.hpp"
#include "session/session_error.hpp"
#include "session/type_registry.hpp"
#include "session/typed_message.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace peerlink {
namespace session {

// Send options (bit set)
enum class SendOptions : uint32_t {
  None = 0,
  // Send a binary-capable type over the dictionary transport
  ForceDictionary = 1u << 0
};

inline SendOptions operator|(SendOptions a, SendOptions b) {
  return static_cast<SendOptions>(static_cast<uint32_t>(a) |
                                  static_cast<uint32_t>(b));
}

inline bool HasOption(SendOptions options, SendOptions flag) {
  return (static_cast<uint32_t>(options) & static_cast<uint32_t>(flag)) != 0;
}

// Wire format a message travels in
enum class TransportKind { Dictionary, Binary };

std::string TransportKindToString(TransportKind kind);

/**
 * CodecState - outcome of one encode or decode attempt
 *
 * UNDECODABLE means "no registered type for this payload" and is not an
 * error for the receive path; MALFORMED means the payload was claimed by a
 * type (or by the trailer format) but could not be read.
 */
class CodecState {
public:
  enum class Result {
    VALID,
    UNDECODABLE, // missing or unregistered type key
    MALFORMED,   // bad envelope, bad trailer, or decoder rejected the payload
    UNENCODABLE  // binary serialization threw
  };

  CodecState() : result_(Result::VALID) {}

  bool IsValid() const { return result_ == Result::VALID; }
  bool IsUndecodable() const { return result_ == Result::UNDECODABLE; }
  bool IsMalformed() const { return result_ == Result::MALFORMED; }
  bool IsUnencodable() const { return result_ == Result::UNENCODABLE; }
  Result GetResult() const { return result_; }

  bool Undecodable(const std::string &reject_reason,
                   const std::string &debug_message = "") {
    return Set(Result::UNDECODABLE, reject_reason, debug_message);
  }

  bool Malformed(const std::string &reject_reason,
                 const std::string &debug_message = "") {
    return Set(Result::MALFORMED, reject_reason, debug_message);
  }

  bool Unencodable(const std::string &reject_reason,
                   const std::string &debug_message = "") {
    return Set(Result::UNENCODABLE, reject_reason, debug_message);
  }

  const std::string &GetRejectReason() const { return reject_reason_; }
  const std::string &GetDebugMessage() const { return debug_message_; }

  // DecodeFailure or EncodeFailure carrying the reject reason
  SessionError ToError() const;

private:
  bool Set(Result result, const std::string &reject_reason,
           const std::string &debug_message) {
    result_ = result;
    reject_reason_ = reject_reason;
    debug_message_ = debug_message;
    return false;
  }

  Result result_;
  std::string reject_reason_;
  std::string debug_message_;
};

// Output of MessageCodec::Encode
struct EncodedMessage {
  TransportKind kind{TransportKind::Dictionary};
  // Envelope; for binary sends this records what was sent
  GenericMessage dictionary;
  // Payload with trailer (Binary only)
  Bytes binary;
};

/**
 * MessageCodec - typed message <-> wire form
 *
 * Dictionary form: {"typeKey": key, "parameters": {...}}
 *
 * Binary form: [payload][type key UTF-8][u32 LE length of type key]
 * The trailer is the application-level discriminator of the binary
 * transport; DecodeBinaryAs() decodes a bare payload whose type is known
 * out of band.
 *
 * Decode functions never throw: failures are reported through CodecState
 * and a nullptr result.
 */
class MessageCodec {
public:
  // Trailer length field size
  static constexpr size_t TRAILER_LENGTH_SIZE = 4;

  explicit MessageCodec(std::shared_ptr<const TypeRegistry> registry);

  /**
   * Encode for sending. Binary-capable messages use the binary form unless
   * options contain ForceDictionary.
   *
   * @return false (state UNENCODABLE) if EncodeBinary threw or produced an
   *         invalid dictionary
   */
  bool Encode(const TypedMessage &message, SendOptions options,
              EncodedMessage &out, CodecState &state) const;

  // Envelope for the dictionary transport (binary types embed their
  // payload under parameters["data"]). May throw what Encode() throws.
  static GenericMessage EncodeEnvelope(const TypedMessage &message);

  // [payload][key][len]
  static Bytes AppendTrailer(Bytes payload, const std::string &type_key);

  // Split trailer off data. Returns false (MALFORMED) on short buffer,
  // oversized length or empty key.
  static bool SplitTrailer(const Bytes &data, std::string &type_key,
                           Bytes &payload, CodecState &state);

  // Envelope -> typed message (nullptr + state on failure)
  TypedMessagePtr Decode(const GenericMessage &message,
                         CodecState &state) const;

  // Payload with trailer -> typed message
  TypedMessagePtr DecodeBinary(const Bytes &data, CodecState &state) const;

  // Bare payload of a type known out of band -> typed message
  TypedMessagePtr DecodeBinaryAs(const std::string &type_key,
                                 const Bytes &payload,
                                 CodecState &state) const;

  const TypeRegistry &registry() const { return *registry_; }

private:
  std::shared_ptr<const TypeRegistry> registry_;
};

} // namespace session
} // namespace peerlink
