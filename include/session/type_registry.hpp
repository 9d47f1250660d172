// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "session/typed_message.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace peerlink {
namespace session {

/**
 * TypeRegistry - runtime dispatch table from type key to decode routines
 *
 * Design:
 * - One entry per type key
 * - Collision policy: last registration wins. Re-registering a key
 *   replaces the previous entry and logs a warning; the outcome depends
 *   only on call order, never on hashing or container order.
 * - Reader/writer lock: decodes take a shared lock and copy the entry out,
 *   so registration may run concurrently with decoding
 *
 * Usage:
 *   TypeRegistry registry;
 *   registry.Register<ColorMessage>();
 *   auto entry = registry.Find("color");
 */
class TypeRegistry {
public:
  // Decode the "parameters" object of an envelope
  using DictionaryDecoder =
      std::function<TypedMessagePtr(const GenericMessage &parameters)>;
  // Decode a raw binary payload (trailer already removed)
  using BinaryDecoder = std::function<TypedMessagePtr(const Bytes &data)>;

  struct Entry {
    std::string type_key;
    DictionaryDecoder decode;
    BinaryDecoder decode_binary; // empty for dictionary-only types

    bool IsBinary() const { return static_cast<bool>(decode_binary); }
  };

  TypeRegistry() = default;

  // Non-copyable
  TypeRegistry(const TypeRegistry &) = delete;
  TypeRegistry &operator=(const TypeRegistry &) = delete;

  /**
   * Register a message type T (see TypedMessage for the requirements on T)
   * Binary-capable types also decode from the dictionary form, reading
   * their binary payload from parameters[keys::DATA].
   *
   * @return false if T::TYPE_KEY is empty
   */
  template <typename T> bool Register() {
    static_assert(std::is_base_of_v<TypedMessage, T>,
                  "registered types must derive from TypedMessage");
    if constexpr (std::is_base_of_v<BinaryTypedMessage, T>) {
      BinaryDecoder binary = [](const Bytes &data) -> TypedMessagePtr {
        return T::DecodeBinary(data);
      };
      DictionaryDecoder dictionary =
          [binary](const GenericMessage &parameters) -> TypedMessagePtr {
        auto data = GetBytes(parameters, keys::DATA);
        if (!data) {
          return nullptr;
        }
        return binary(*data);
      };
      return RegisterDecoder(T::TYPE_KEY, std::move(dictionary),
                             std::move(binary));
    } else {
      return RegisterDecoder(
          T::TYPE_KEY,
          [](const GenericMessage &parameters) -> TypedMessagePtr {
            return T::Decode(parameters);
          });
    }
  }

  /**
   * Register decode routines under an explicit key
   *
   * @param type_key Discriminator (must not be empty)
   * @param decode Dictionary decoder (required, must not be empty)
   * @param decode_binary Binary decoder (optional)
   * @return false if the key or the dictionary decoder is empty
   */
  bool RegisterDecoder(const std::string &type_key, DictionaryDecoder decode,
                       BinaryDecoder decode_binary = nullptr);

  // Remove an entry. Returns true if one was removed.
  bool Unregister(const std::string &type_key);

  bool Contains(const std::string &type_key) const;
  bool IsBinary(const std::string &type_key) const;

  // Copy of the entry for type_key (nullopt on miss)
  std::optional<Entry> Find(const std::string &type_key) const;

  // Sorted list of registered keys (for diagnostics)
  std::vector<std::string> RegisteredKeys() const;

  size_t Size() const;

private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, Entry> entries_;
};

} // namespace session
} // namespace peerlink
