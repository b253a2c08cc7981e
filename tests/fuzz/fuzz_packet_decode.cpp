#include "rainbow.hpp"
#include "rainbow_error.hpp"
#include "rainbow_http_synth.hpp"
#include <cstdint>
#include <cstddef>
#include <vector>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 16) return 0;  // Shorter than any request line

    static const rainbow::Rainbow engine;
    rainbow::ByteVector packet(data, data + size);

    // Malformed input must surface as RainbowError, nothing else
    for (bool is_client : {true, false}) {
        try {
            engine.decrypt_single_read(packet, 0, is_client);
        } catch (const rainbow::RainbowError&) {
        }
    }

    try {
        auto msg = rainbow::MessageSynthesizer::parse(packet);
        rainbow::MessageSynthesizer::carrier_body(msg);
    } catch (const rainbow::RainbowError&) {
    }

    return 0;
}
