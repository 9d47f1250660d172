// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "session/message_codec.hpp"
#include "util/logging.hpp"
#include <stdexcept>

namespace peerlink {
namespace session {

std::string TransportKindToString(TransportKind kind) {
  switch (kind) {
  case TransportKind::Dictionary:
    return "dictionary";
  case TransportKind::Binary:
    return "binary";
  }
  return "unknown";
}

SessionError CodecState::ToError() const {
  std::string detail = reject_reason_;
  if (!debug_message_.empty()) {
    detail += ": " + debug_message_;
  }
  if (result_ == Result::UNENCODABLE) {
    return SessionError::Encode(detail);
  }
  return SessionError::Decode(detail);
}

GenericMessage BinaryTypedMessage::Encode() const {
  GenericMessage parameters = GenericMessage::object();
  parameters[keys::DATA] = BytesValue(EncodeBinary());
  return parameters;
}

MessageCodec::MessageCodec(std::shared_ptr<const TypeRegistry> registry)
    : registry_(std::move(registry)) {
  if (!registry_) {
    throw std::invalid_argument("MessageCodec requires a TypeRegistry");
  }
}

GenericMessage MessageCodec::EncodeEnvelope(const TypedMessage &message) {
  return MakeEnvelope(message.TypeKey(), message.Encode());
}

Bytes MessageCodec::AppendTrailer(Bytes payload, const std::string &type_key) {
  payload.insert(payload.end(), type_key.begin(), type_key.end());
  const uint32_t length = static_cast<uint32_t>(type_key.size());
  payload.push_back(static_cast<uint8_t>(length & 0xff));
  payload.push_back(static_cast<uint8_t>((length >> 8) & 0xff));
  payload.push_back(static_cast<uint8_t>((length >> 16) & 0xff));
  payload.push_back(static_cast<uint8_t>((length >> 24) & 0xff));
  return payload;
}

bool MessageCodec::SplitTrailer(const Bytes &data, std::string &type_key,
                                Bytes &payload, CodecState &state) {
  if (data.size() < TRAILER_LENGTH_SIZE) {
    return state.Malformed("short-trailer",
                           "buffer of " + std::to_string(data.size()) +
                               " bytes has no length field");
  }

  const size_t pos = data.size() - TRAILER_LENGTH_SIZE;
  const uint32_t length = static_cast<uint32_t>(data[pos]) |
                          (static_cast<uint32_t>(data[pos + 1]) << 8) |
                          (static_cast<uint32_t>(data[pos + 2]) << 16) |
                          (static_cast<uint32_t>(data[pos + 3]) << 24);

  if (length > pos) {
    return state.Malformed("oversized-trailer",
                           "type key length " + std::to_string(length) +
                               " exceeds " + std::to_string(pos) +
                               " available bytes");
  }
  if (length == 0) {
    return state.Malformed("empty-type-key");
  }

  const size_t key_start = pos - length;
  type_key.assign(data.begin() + key_start, data.begin() + pos);
  payload.assign(data.begin(), data.begin() + key_start);
  return true;
}

bool MessageCodec::Encode(const TypedMessage &message, SendOptions options,
                          EncodedMessage &out, CodecState &state) const {
  const std::string type_key = message.TypeKey();
  const auto *binary = dynamic_cast<const BinaryTypedMessage *>(&message);

  try {
    if (binary && !HasOption(options, SendOptions::ForceDictionary)) {
      Bytes payload = binary->EncodeBinary();
      GenericMessage parameters = GenericMessage::object();
      parameters[keys::DATA] = BytesValue(payload);
      out.kind = TransportKind::Binary;
      out.dictionary = MakeEnvelope(type_key, parameters);
      out.binary = AppendTrailer(std::move(payload), type_key);
      LOG_CODEC_TRACE("Encoded {} as binary ({} bytes)", type_key,
                      out.binary.size());
      return true;
    }

    out.kind = TransportKind::Dictionary;
    out.dictionary = EncodeEnvelope(message);
    out.binary.clear();
  } catch (const std::exception &e) {
    LOG_CODEC_WARN("Failed to encode {}: {}", type_key, e.what());
    return state.Unencodable("encode-threw", type_key + ": " + e.what());
  }

  std::string reason;
  if (!IsWellFormed(out.dictionary, &reason)) {
    LOG_CODEC_WARN("Encoded {} is not a flat message: {}", type_key, reason);
    return state.Unencodable("not-flat", type_key + ": " + reason);
  }

  LOG_CODEC_TRACE("Encoded {} as dictionary", type_key);
  return true;
}

TypedMessagePtr MessageCodec::Decode(const GenericMessage &message,
                                     CodecState &state) const {
  if (!message.is_object()) {
    state.Malformed("not-an-object");
    return nullptr;
  }

  auto key_it = message.find(keys::TYPE_KEY);
  if (key_it == message.end() || !key_it->is_string()) {
    state.Undecodable("missing-type-key");
    return nullptr;
  }
  const std::string type_key = key_it->get<std::string>();

  auto entry = registry_->Find(type_key);
  if (!entry) {
    state.Undecodable("unknown-type-key", type_key);
    return nullptr;
  }

  GenericMessage parameters = GenericMessage::object();
  auto params_it = message.find(keys::PARAMETERS);
  if (params_it != message.end()) {
    if (!params_it->is_object()) {
      state.Malformed("bad-parameters", type_key + ": parameters is not an object");
      return nullptr;
    }
    parameters = *params_it;
  }

  TypedMessagePtr decoded;
  try {
    decoded = entry->decode(parameters);
  } catch (const nlohmann::json::exception &e) {
    state.Malformed("bad-parameters", type_key + ": " + e.what());
    return nullptr;
  } catch (const std::exception &e) {
    state.Malformed("decoder-threw", type_key + ": " + e.what());
    return nullptr;
  }

  if (!decoded) {
    state.Malformed("bad-parameters", type_key);
    return nullptr;
  }
  return decoded;
}

TypedMessagePtr MessageCodec::DecodeBinary(const Bytes &data,
                                           CodecState &state) const {
  std::string type_key;
  Bytes payload;
  if (!SplitTrailer(data, type_key, payload, state)) {
    return nullptr;
  }
  return DecodeBinaryAs(type_key, payload, state);
}

TypedMessagePtr MessageCodec::DecodeBinaryAs(const std::string &type_key,
                                             const Bytes &payload,
                                             CodecState &state) const {
  auto entry = registry_->Find(type_key);
  if (!entry) {
    state.Undecodable("unknown-type-key", type_key);
    return nullptr;
  }
  if (!entry->IsBinary()) {
    state.Malformed("not-binary-type", type_key);
    return nullptr;
  }

  TypedMessagePtr decoded;
  try {
    decoded = entry->decode_binary(payload);
  } catch (const std::exception &e) {
    state.Malformed("decoder-threw", type_key + ": " + e.what());
    return nullptr;
  }

  if (!decoded) {
    state.Malformed("bad-payload",
                    type_key + ": " + std::to_string(payload.size()) + " bytes");
    return nullptr;
  }
  return decoded;
}

} // namespace session
} // namespace peerlink
