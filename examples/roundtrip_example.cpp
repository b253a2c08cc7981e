/**
 * @file roundtrip_example.cpp
 * @brief Example: hide a message in client requests, recover it, then reply
 */

#include <iostream>
#include <string>
#include "../src/core/include/rainbow.hpp"
#include "../src/core/include/rainbow_logger.hpp"

using namespace rainbow;

int main() {
    std::cout << "=== Rainbow Round Trip Example ===\n\n";

    Logger::instance().setLevel(LogLevel::INFO);

    Rainbow engine;
    const std::string message = "Hello, Steganography!";
    ByteVector payload(message.begin(), message.end());

    // 1. Client side: payload -> request packets
    EncodeResult out = engine.encode_write(payload, true);
    std::cout << "1. Encoded " << out.total_len << " bytes into " << out.chunk_count << " request(s)\n";
    for (size_t i = 0; i < out.packets.size(); ++i) {
        const Packet& p = out.packets[i];
        std::cout << "   - packet " << p.index << ": " << technique_to_string(p.technique)
                  << ", " << p.bytes.size() << " bytes, expect ~"
                  << out.expected_return_lengths[i] << " bytes back\n";
    }

    // 2. Server side: packets -> payload
    std::cout << "\n2. Decoding\n";
    ByteVector recovered;
    for (size_t i = 0; i < out.packets.size(); ++i) {
        DecodeResult r = engine.decrypt_single_read(out.packets[i].bytes, i, true);
        recovered.insert(recovered.end(), r.data.begin(), r.data.end());
        if (r.is_read_end) break;
    }
    std::cout << "   Recovered: \"" << std::string(recovered.begin(), recovered.end()) << "\"\n";

    // 3. Server reply forced into one carrier type
    ByteVector reply(3000, 0x5A);
    EncodeResult back = engine.encode_write(reply, false, std::string("text/css"));
    std::cout << "\n3. Reply of " << reply.size() << " bytes as text/css: "
              << back.chunk_count << " response(s)\n";
    std::cout << "   Reassembled: "
              << (engine.decode_all([&] {
                     std::vector<ByteVector> v;
                     for (const auto& p : back.packets) v.push_back(p.bytes);
                     return v;
                 }(), false) == reply ? "match" : "MISMATCH") << "\n";

    // 4. Cover traffic
    ByteVector cover = engine.generate_cover_packet(1500, true);
    std::cout << "\n4. Cover request of " << cover.size() << " bytes\n";

    // Header block only; the body may be binary (audio/wav)
    std::string first(out.packets[0].bytes.begin(), out.packets[0].bytes.end());
    std::cout << "\n--- First request headers ---\n" << first.substr(0, first.find("\r\n\r\n")) << "\n";
    return 0;
}
