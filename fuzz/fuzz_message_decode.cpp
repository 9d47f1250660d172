// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Fuzz target for dictionary decoding of untrusted peer messages
//
// Input is parsed as JSON; any value that parses is fed to the codec.
// Decode must never throw, and a successfully decoded message must
// re-encode to a flat envelope that decodes to the same type.

#include "fuzz_targets.hpp"
#include "session/message_codec.hpp"
#include <cstddef>
#include <cstdint>

using namespace peerlink;
using namespace peerlink::session;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    static const MessageCodec codec(fuzz::MakeFuzzRegistry());

    GenericMessage message =
        GenericMessage::parse(data, data + size, nullptr, /*allow_exceptions=*/false);
    if (message.is_discarded()) {
        return 0;
    }

    // Must not throw for any input
    std::string reason;
    const bool well_formed = IsWellFormed(message, &reason);
    if (!well_formed && reason.empty()) {
        // Rejection without a reason - BUG!
        __builtin_trap();
    }
    (void)Describe(message);

    CodecState state;
    TypedMessagePtr decoded = codec.Decode(message, state);
    if (!decoded) {
        if (state.IsValid()) {
            // Failure without a diagnostic - BUG!
            __builtin_trap();
        }
        return 0;
    }

    // Re-encode through the dictionary transport
    EncodedMessage encoded;
    CodecState encode_state;
    if (!codec.Encode(*decoded, SendOptions::ForceDictionary, encoded, encode_state)) {
        // Decoded values come from scalars, so they must encode - BUG!
        __builtin_trap();
    }
    if (!IsWellFormed(encoded.dictionary)) {
        __builtin_trap();
    }

    CodecState again_state;
    TypedMessagePtr again = codec.Decode(encoded.dictionary, again_state);
    if (!again || again->TypeKey() != decoded->TypeKey()) {
        // Re-decode of our own encoding failed - BUG!
        __builtin_trap();
    }

    return 0;
}
