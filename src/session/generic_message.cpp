// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "session/generic_message.hpp"

namespace peerlink {
namespace session {

namespace {

// Invalid UTF-8 in a peer's strings is replaced, never thrown
std::string DumpLenient(const nlohmann::json &value) {
  return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool IsFlatObject(const nlohmann::json &object, std::string *reason,
                  const std::string &prefix) {
  if (!object.is_object()) {
    if (reason) *reason = prefix.empty() ? "not an object" : prefix + " is not an object";
    return false;
  }
  for (auto it = object.begin(); it != object.end(); ++it) {
    if (!IsScalar(it.value())) {
      if (reason) *reason = "non-scalar value for key '" + prefix + it.key() + "'";
      return false;
    }
  }
  return true;
}

std::string DescribeValue(const nlohmann::json &value) {
  if (value.is_binary()) {
    return "<" + std::to_string(value.get_binary().size()) + " bytes>";
  }
  if (value.is_object()) {
    return Describe(value);
  }
  return DumpLenient(value);
}

} // namespace

GenericMessage EmptyMessage() { return GenericMessage::object(); }

bool IsScalar(const nlohmann::json &value) {
  return value.is_boolean() || value.is_number() || value.is_string() ||
         value.is_binary();
}

bool IsWellFormed(const GenericMessage &message, std::string *reason) {
  if (!message.is_object()) {
    if (reason) *reason = "not an object";
    return false;
  }
  for (auto it = message.begin(); it != message.end(); ++it) {
    if (it.key() == keys::PARAMETERS) {
      if (!IsFlatObject(it.value(), reason, std::string(keys::PARAMETERS) + ".")) {
        return false;
      }
      continue;
    }
    if (!IsScalar(it.value())) {
      if (reason) *reason = "non-scalar value for key '" + it.key() + "'";
      return false;
    }
  }
  return true;
}

GenericMessage MakeEnvelope(const std::string &type_key,
                            const GenericMessage &parameters) {
  GenericMessage envelope = GenericMessage::object();
  envelope[keys::TYPE_KEY] = type_key;
  envelope[keys::PARAMETERS] =
      parameters.is_null() ? GenericMessage::object() : parameters;
  return envelope;
}

nlohmann::json BytesValue(const Bytes &data) {
  return nlohmann::json::binary(data);
}

std::optional<Bytes> GetBytes(const GenericMessage &message,
                              const std::string &key) {
  if (!message.is_object()) {
    return std::nullopt;
  }
  auto it = message.find(key);
  if (it == message.end() || !it->is_binary()) {
    return std::nullopt;
  }
  const auto &blob = it->get_binary();
  return Bytes(blob.begin(), blob.end());
}

std::string Describe(const GenericMessage &message) {
  if (!message.is_object()) {
    return DumpLenient(message);
  }
  std::string out = "{";
  bool first = true;
  for (auto it = message.begin(); it != message.end(); ++it) {
    if (!first) out += ",";
    first = false;
    out += "\"" + it.key() + "\":" + DescribeValue(it.value());
  }
  out += "}";
  return out;
}

} // namespace session
} // namespace peerlink
