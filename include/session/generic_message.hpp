// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace peerlink {
namespace session {

using Bytes = std::vector<uint8_t>;

/**
 * GenericMessage - wire form of the dictionary transport
 *
 * A JSON object mapping string keys to scalars: boolean, integer,
 * floating point, string, or byte blob (json::binary_t). Key order
 * carries no meaning. The only nested object allowed is the value of
 * the envelope key "parameters".
 */
using GenericMessage = nlohmann::json;

namespace keys {
// Envelope keys (reserved)
constexpr const char *TYPE_KEY = "typeKey";
constexpr const char *PARAMETERS = "parameters";
// Parameter key holding the binary form of a binary-capable type
// when it travels over the dictionary transport
constexpr const char *DATA = "data";
} // namespace keys

// Empty object (not null)
GenericMessage EmptyMessage();

// True for the value types a GenericMessage may carry
bool IsScalar(const nlohmann::json &value);

/**
 * Check that a message is a flat object of scalars. If the message is an
 * envelope, its "parameters" value must itself be a flat object.
 * On failure, *reason (if given) names the offending key.
 */
bool IsWellFormed(const GenericMessage &message, std::string *reason = nullptr);

// {typeKey: type_key, parameters: parameters}
GenericMessage MakeEnvelope(const std::string &type_key,
                            const GenericMessage &parameters);

// Byte blob value
nlohmann::json BytesValue(const Bytes &data);

// Read a byte blob stored under key (nullopt if absent or not a blob)
std::optional<Bytes> GetBytes(const GenericMessage &message,
                              const std::string &key);

// Compact text form for logs; blobs are summarized by size and invalid
// UTF-8 is replaced (never throws)
std::string Describe(const GenericMessage &message);

} // namespace session
} // namespace peerlink
