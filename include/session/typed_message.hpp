// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "session/generic_message.hpp"
#include <memory>
#include <string>

namespace peerlink {
namespace session {

/**
 * TypedMessage - base for application messages routed by type key
 *
 * A concrete type T used with TypeRegistry::Register<T>() provides:
 *   static constexpr const char *TYPE_KEY = "...";
 *   static std::shared_ptr<T> Decode(const GenericMessage &parameters);
 *
 * Decode returns nullptr (or throws nlohmann::json::exception) when the
 * parameters are malformed.
 */
class TypedMessage {
public:
  virtual ~TypedMessage() = default;

  // Registry discriminator
  virtual std::string TypeKey() const = 0;

  // Dictionary form: the "parameters" object of the envelope
  virtual GenericMessage Encode() const = 0;

  // Downcast helper for subscribers
  template <typename T> const T *As() const {
    return dynamic_cast<const T *>(this);
  }
};

/**
 * BinaryTypedMessage - typed message with a raw byte form
 *
 * Sent over the binary transport unless SendOptions::ForceDictionary is set.
 * A concrete type T additionally provides:
 *   static std::shared_ptr<T> DecodeBinary(const Bytes &data);
 *
 * EncodeBinary may throw; the codec reports that as EncodeFailure.
 */
class BinaryTypedMessage : public TypedMessage {
public:
  virtual Bytes EncodeBinary() const = 0;

  // Dictionary form carries the binary form under keys::DATA
  GenericMessage Encode() const override;
};

using TypedMessagePtr = std::shared_ptr<const TypedMessage>;

} // namespace session
} // namespace peerlink
