// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Message types shared by the fuzz targets

#pragma once

#include "session/type_registry.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace peerlink {
namespace fuzz {

// Dictionary type with every scalar kind
struct SampleMessage : public session::TypedMessage {
    static constexpr const char *TYPE_KEY = "sample";

    int64_t count{0};
    double ratio{0.0};
    bool flag{false};
    std::string label;

    std::string TypeKey() const override { return TYPE_KEY; }

    session::GenericMessage Encode() const override {
        return session::GenericMessage{
            {"count", count}, {"ratio", ratio}, {"flag", flag}, {"label", label}};
    }

    static std::shared_ptr<SampleMessage> Decode(const session::GenericMessage &p) {
        auto sample = std::make_shared<SampleMessage>();
        sample->count = p.at("count").get<int64_t>();
        sample->ratio = p.at("ratio").get<double>();
        sample->flag = p.at("flag").get<bool>();
        sample->label = p.at("label").get<std::string>();
        return sample;
    }
};

// Binary type: any payload of at most 64 bytes
struct BlobMessage : public session::BinaryTypedMessage {
    static constexpr const char *TYPE_KEY = "blob";
    static constexpr size_t MAX_SIZE = 64;

    session::Bytes data;

    std::string TypeKey() const override { return TYPE_KEY; }
    session::Bytes EncodeBinary() const override { return data; }

    static std::shared_ptr<BlobMessage> DecodeBinary(const session::Bytes &payload) {
        if (payload.size() > MAX_SIZE) {
            return nullptr;
        }
        auto blob = std::make_shared<BlobMessage>();
        blob->data = payload;
        return blob;
    }
};

inline std::shared_ptr<session::TypeRegistry> MakeFuzzRegistry() {
    auto registry = std::make_shared<session::TypeRegistry>();
    registry->Register<SampleMessage>();
    registry->Register<BlobMessage>();
    return registry;
}

} // namespace fuzz
} // namespace peerlink
