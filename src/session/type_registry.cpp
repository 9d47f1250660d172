// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "session/type_registry.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <mutex>

namespace peerlink {
namespace session {

bool TypeRegistry::RegisterDecoder(const std::string &type_key,
                                   DictionaryDecoder decode,
                                   BinaryDecoder decode_binary) {
  if (type_key.empty()) {
    LOG_CODEC_WARN("Attempted to register message type with empty key");
    return false;
  }

  // Prevent std::bad_function_call on decode
  if (!decode) {
    LOG_CODEC_ERROR("Attempted to register empty decoder for type: {}", type_key);
    return false;
  }

  Entry entry{type_key, std::move(decode), std::move(decode_binary)};
  const bool binary = entry.IsBinary();

  std::unique_lock<std::shared_mutex> lock(mutex_);
  const bool inserted =
      entries_.insert_or_assign(type_key, std::move(entry)).second;
  if (!inserted) {
    LOG_CODEC_WARN("Type key '{}' re-registered, previous decoder replaced",
                   type_key);
  } else {
    LOG_CODEC_DEBUG("Registered {} type: {}", binary ? "binary" : "dictionary",
                    type_key);
  }
  return true;
}

bool TypeRegistry::Unregister(const std::string &type_key) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (entries_.erase(type_key) > 0) {
    LOG_CODEC_DEBUG("Unregistered type: {}", type_key);
    return true;
  }
  return false;
}

bool TypeRegistry::Contains(const std::string &type_key) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entries_.count(type_key) > 0;
}

bool TypeRegistry::IsBinary(const std::string &type_key) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = entries_.find(type_key);
  return it != entries_.end() && it->second.IsBinary();
}

std::optional<TypeRegistry::Entry>
TypeRegistry::Find(const std::string &type_key) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = entries_.find(type_key);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<std::string> TypeRegistry::RegisteredKeys() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<std::string> result;
  result.reserve(entries_.size());
  for (const auto &[key, _] : entries_) {
    result.push_back(key);
  }
  std::sort(result.begin(), result.end());
  return result;
}

size_t TypeRegistry::Size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entries_.size();
}

} // namespace session
} // namespace peerlink
