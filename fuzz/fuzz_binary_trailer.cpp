// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Fuzz target for the binary transport trailer ([payload][key][u32 LE len])

#include "fuzz_targets.hpp"
#include "session/message_codec.hpp"
#include <cstddef>
#include <cstdint>

using namespace peerlink;
using namespace peerlink::session;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    static const MessageCodec codec(fuzz::MakeFuzzRegistry());

    const Bytes input(data, data + size);

    std::string type_key;
    Bytes payload;
    CodecState split_state;
    const bool split = MessageCodec::SplitTrailer(input, type_key, payload, split_state);

    if (split) {
        // CRITICAL: split parts must account for every byte
        if (payload.size() + type_key.size() + MessageCodec::TRAILER_LENGTH_SIZE != size) {
            __builtin_trap();
        }
        if (type_key.empty()) {
            __builtin_trap();
        }
        // CRITICAL: re-appending the trailer reproduces the input
        if (MessageCodec::AppendTrailer(payload, type_key) != input) {
            __builtin_trap();
        }
    } else if (!split_state.IsMalformed()) {
        // Trailer errors are always reported as malformed - BUG!
        __builtin_trap();
    }

    CodecState state;
    TypedMessagePtr decoded = codec.DecodeBinary(input, state);
    if (decoded) {
        if (!split || decoded->TypeKey() != type_key) {
            __builtin_trap();
        }
        const auto *blob = decoded->As<fuzz::BlobMessage>();
        if (!blob || blob->data != payload) {
            __builtin_trap();
        }

        // Round trip through the encoder
        EncodedMessage encoded;
        CodecState encode_state;
        if (!codec.Encode(*decoded, SendOptions::None, encoded, encode_state) ||
            encoded.kind != TransportKind::Binary || encoded.binary != input) {
            __builtin_trap();
        }
    } else if (state.IsValid()) {
        __builtin_trap();
    }

    return 0;
}
