// apps/frame_tool/src/main.cpp
// serlink: frame_tool
// Purpose: inspect the wire format by hand.
//
// Usage:
//   ./frame_tool encode <port> <hex-word>...    print the frame, one word per line
//   ./frame_tool decode [timeout-ticks]         read hex words from stdin, print packets
//
// Notes:
// - Words are 32 bits, 4 bytes each (the default link configuration).
// - decode feeds one word per tick into a depacketizer with an always-ready
//   consumer, then idles long enough for a truncated frame to time out.

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "serlink/config/constants.hpp"
#include "serlink/framing/depacketizer.hpp"
#include "serlink/framing/header.hpp"
#include "serlink/framing/packetizer.hpp"
#include "serlink/stream/payload_layout.hpp"

namespace {

using serlink::stream::Word;
namespace constants = serlink::config::constants;

constexpr std::uint64_t kDefaultTimeoutTicks = 64;

bool parse_hex(std::string_view s, Word& out) {
    if (s.starts_with("0x") || s.starts_with("0X")) s.remove_prefix(2);
    if (s.empty()) return false;
    const auto* end = s.data() + s.size();
    auto [p, ec] = std::from_chars(s.data(), end, out, 16);
    return ec == std::errc{} && p == end;
}

void print_word(Word w) {
    std::cout << "0x" << std::hex << std::setw(8) << std::setfill('0') << w << std::dec << "\n";
}

int usage() {
    std::cerr << "usage: frame_tool encode <port> <hex-word>...\n"
                 "       frame_tool decode [timeout-ticks] < words.txt\n";
    return 2;
}

int encode(int argc, char** argv) {
    if (argc < 4) return usage();

    unsigned port = 0;
    const std::string_view ps = argv[2];
    auto [p, ec] = std::from_chars(ps.data(), ps.data() + ps.size(), port);
    if (ec != std::errc{} || p != ps.data() + ps.size() || port > 0xFF) {
        std::cerr << "frame_tool: bad port '" << ps << "'\n";
        return 2;
    }

    const auto length = serlink::framing::payload_length(static_cast<std::size_t>(argc - 3),
                                                          constants::DEFAULT_BYTES_PER_WORD);
    if (!length) {
        std::cerr << "frame_tool: " << (argc - 3) << " words do not fit the 16-bit length field\n";
        return 2;
    }

    serlink::stream::Packet pkt;
    pkt.port = static_cast<serlink::stream::Port>(port);
    for (int i = 3; i < argc; ++i) {
        Word w = 0;
        if (!parse_hex(argv[i], w) || w > 0xFFFFFFFFull) {
            std::cerr << "frame_tool: bad word '" << argv[i] << "'\n";
            return 2;
        }
        pkt.payload.push_back(w);
    }
    pkt.length = *length;

    for (Word w : serlink::framing::encode_frame(pkt)) print_word(w);
    return 0;
}

int decode(int argc, char** argv) {
    std::uint64_t timeout = kDefaultTimeoutTicks;
    if (argc > 2) {
        const std::string_view ts = argv[2];
        auto [p, ec] = std::from_chars(ts.data(), ts.data() + ts.size(), timeout);
        if (ec != std::errc{} || p != ts.data() + ts.size() || timeout == 0) {
            std::cerr << "frame_tool: bad timeout '" << ts << "'\n";
            return 2;
        }
    }

    std::vector<Word> words;
    for (std::string tok; std::cin >> tok;) {
        Word w = 0;
        if (!parse_hex(tok, w)) {
            std::cerr << "frame_tool: bad word '" << tok << "'\n";
            return 2;
        }
        words.push_back(w);
    }

    serlink::framing::Depacketizer d(serlink::stream::PayloadLayout::data(constants::DEFAULT_WORD_BITS),
                                     constants::DEFAULT_BYTES_PER_WORD, timeout);
    std::size_t frames = 0, discarded = 0, timeouts = 0;
    std::vector<Word> payload;

    auto step = [&](const serlink::stream::WordFlit& in) {
        const auto o = d.tick({in, true});
        if (o.discarded) ++discarded;
        if (o.timed_out) {
            ++timeouts;
            payload.clear();
        }
        if (o.source.valid) {
            if (o.source.first) payload.clear();
            payload.push_back(o.source.data);
        }
        if (o.frame_done) {
            ++frames;
            std::cout << "port=" << unsigned(o.source.port) << " length=" << o.source.length
                      << " payload=[";
            for (std::size_t i = 0; i < payload.size(); ++i) {
                std::cout << (i ? " " : "") << "0x" << std::hex << payload[i] << std::dec;
            }
            std::cout << "]\n";
            payload.clear();
        }
        return o.sink_ready;
    };

    for (std::size_t i = 0; i < words.size();) {
        if (step(serlink::stream::WordFlit{true, false, words[i]})) ++i;
    }
    // Drain: let a truncated trailing frame run into the idle timer.
    while (d.state() != serlink::framing::DepacketizerState::Preamble) step({});

    std::cerr << "frames=" << frames << " discarded=" << discarded << " timeouts=" << timeouts << "\n";
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) return usage();
    const std::string_view cmd = argv[1];
    if (cmd == "encode") return encode(argc, argv);
    if (cmd == "decode") return decode(argc, argv);
    return usage();
}
