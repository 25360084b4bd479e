/**
 * @file test_link.cpp
 * @brief End-to-end tests for LinkCore over an in-memory lane pair.
 *
 * Validates:
 *  - Registration errors (duplicate ports, invalid configuration)
 *  - Exact wire sequence of a single frame
 *  - Port fidelity and per-port dispatch, unrouted frames
 *  - Packet atomicity under a paused producer, lossless backpressure
 *  - Idle-timeout recovery and link-down reset
 *  - The scalar signal channel, alone and next to another producer
 */

#include <gtest/gtest.h>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

#include "serlink/framing/header.hpp"
#include "serlink/link/link_core.hpp"
#include "serlink/link/serio.hpp"
#include "serlink/obs/observability.hpp"
#include "serlink/phy/loopback.hpp"
#include "serlink/stream/packet_queue.hpp"

using namespace serlink;
using config::ConfigError;
using config::LinkConfig;
using link::LinkBuilder;
using link::LinkCore;
using stream::Packet;
using stream::PacketQueueSink;
using stream::PacketQueueSource;
using stream::Word;

namespace {

/// Two link cores facing each other over one LoopbackLink.
struct Harness {
  explicit Harness(LinkConfig cfg = {}, phy::LoopbackOptions opts = {})
      : wire(opts), ba(wire.a(), cfg, "a"), bb(wire.b(), cfg, "b") {}

  void build() {
    auto x = std::move(ba).finalize();
    auto y = std::move(bb).finalize();
    ASSERT_TRUE(x);
    ASSERT_TRUE(y);
    a.emplace(std::move(*x));
    b.emplace(std::move(*y));
  }

  void run(int ticks) {
    for (int t = 0; t < ticks; ++t) {
      a->tick();
      b->tick();
      wire.tick();
    }
  }

  /// Tick until @p done holds; false if it never did within @p max ticks.
  bool run_until(const std::function<bool()>& done, int max = 1000) {
    for (int t = 0; t < max; ++t) {
      if (done()) return true;
      run(1);
    }
    return done();
  }

  phy::LoopbackLink       wire;
  LinkBuilder             ba;
  LinkBuilder             bb;
  std::optional<LinkCore> a;
  std::optional<LinkCore> b;
};

Packet make_packet(stream::Port port, std::vector<Word> payload) {
  const auto len = static_cast<std::uint16_t>(payload.size() * 4);
  return Packet{port, len, std::move(payload)};
}

/// Same packet as seen by the consumer of @p port.
Packet on_port(Packet p, stream::Port port) {
  p.port = port;
  return p;
}

} // namespace

// --------------------------- Composition --------------------------------------

TEST(LinkBuilder, DuplicatePort_Rejected) {
  phy::LoopbackLink wire;
  LinkBuilder b(wire.a(), LinkConfig{});
  PacketQueueSource s1, s2;
  PacketQueueSink   k1, k2;

  EXPECT_TRUE(b.attach_downstream(1, s1));
  auto dup = b.attach_downstream(1, s2);
  ASSERT_FALSE(dup);
  EXPECT_EQ(dup.error(), ConfigError::DuplicatePort);

  // Directions have separate tables.
  EXPECT_TRUE(b.attach_upstream(1, k1));
  auto dup_up = b.attach_upstream(1, k2);
  ASSERT_FALSE(dup_up);
  EXPECT_EQ(dup_up.error(), ConfigError::DuplicatePort);

  auto core = std::move(b).finalize();
  ASSERT_TRUE(core);
  EXPECT_EQ(core->downstream_count(), 1u);
  EXPECT_EQ(core->upstream_count(), 1u);
}

TEST(LinkBuilder, Finalize_InvalidConfig) {
  phy::LoopbackLink wire;

  LinkConfig narrow;
  narrow.word_bits = 24;
  auto r1 = LinkBuilder(wire.a(), narrow).finalize();
  ASSERT_FALSE(r1);
  EXPECT_EQ(r1.error(), ConfigError::WordWidthInvalid);

  LinkConfig no_buf;
  no_buf.tx_buffer_depth = 0;
  auto r2 = LinkBuilder(wire.a(), no_buf).finalize();
  ASSERT_FALSE(r2);
  EXPECT_EQ(r2.error(), ConfigError::BufferDepthZero);
}

/**
 * @test Finalize_WidthDivisorMismatch
 * @brief The length divisor must equal the byte width of the link word;
 *        otherwise frames would be cut at the wrong word.
 */
TEST(LinkBuilder, Finalize_WidthDivisorMismatch) {
  phy::LoopbackLink wire;

  LinkConfig wide;
  wide.word_bits = 64; // bytes_per_word left at 4
  ASSERT_TRUE(wide.validate());
  auto bad = LinkBuilder(wire.a(), wide).finalize();
  ASSERT_FALSE(bad);
  EXPECT_EQ(bad.error(), ConfigError::PayloadWidthMismatch);

  wide.bytes_per_word = 8;
  EXPECT_TRUE(LinkBuilder(wire.a(), wide).finalize());
}

// --------------------------- Wire format --------------------------------------

/**
 * @test ScenarioFrame_OnTheWire
 * @brief One two-word packet on port 3 produces exactly preamble, header, payload.
 */
TEST(LinkCore, ScenarioFrame_OnTheWire) {
  phy::LoopbackLink wire;
  PacketQueueSource src;
  LinkBuilder b(wire.a(), LinkConfig{});
  ASSERT_TRUE(b.attach_downstream(3, src));
  auto core = std::move(b).finalize();
  ASSERT_TRUE(core);

  ASSERT_TRUE(src.enqueue(make_packet(0, {0xAAAABBBB, 0xCCCCDDDD})));
  for (int t = 0; t < 10; ++t) {
    core->tick();
    wire.tick();
  }

  std::vector<Word> seen;
  while (auto w = wire.b().rx_peek()) {
    seen.push_back(*w);
    wire.b().rx_pop();
  }
  EXPECT_EQ(seen, (std::vector<Word>{0x5AA55AA5, 0x00000803, 0xAAAABBBB, 0xCCCCDDDD}));
  EXPECT_EQ(src.packets_sent(), 1u);
}

// --------------------------- Multiplexing -------------------------------------

/**
 * @test RoundTrip_PortFidelity
 * @brief Packets from two producers arrive whole, each at the consumer of its
 *        registered port, regardless of the port the producer wrote.
 */
TEST(LinkCore, RoundTrip_PortFidelity) {
  Harness h;
  PacketQueueSource s5, s9;
  PacketQueueSink   k5, k9;
  ASSERT_TRUE(h.ba.attach_downstream(5, s5));
  ASSERT_TRUE(h.ba.attach_downstream(9, s9));
  ASSERT_TRUE(h.bb.attach_upstream(5, k5));
  ASSERT_TRUE(h.bb.attach_upstream(9, k9));
  h.build();

  std::vector<Packet> want5, want9;
  for (int i = 0; i < 3; ++i) {
    auto p = make_packet(0xEE, {Word(i), Word(i) << 8, 0x55});
    auto q = make_packet(0xEE, {Word(0x900 + i)});
    ASSERT_TRUE(s5.enqueue(p));
    ASSERT_TRUE(s9.enqueue(q));
    want5.push_back(on_port(p, 5));
    want9.push_back(on_port(q, 9));
  }

  ASSERT_TRUE(h.run_until([&] { return k5.received().size() == 3 && k9.received().size() == 3; }));
  EXPECT_EQ(k5.received(), want5);
  EXPECT_EQ(k9.received(), want9);
  EXPECT_EQ(k5.partials_dropped(), 0u);
}

TEST(LinkCore, RoundTrip_WideWords) {
  LinkConfig cfg;
  cfg.word_bits      = 64;
  cfg.bytes_per_word = 8;
  Harness h(cfg);
  PacketQueueSource src;
  PacketQueueSink   sink;
  ASSERT_TRUE(h.ba.attach_downstream(1, src));
  ASSERT_TRUE(h.bb.attach_upstream(1, sink));
  h.build();

  const Packet p1{1, 8, {0x0123456789ABCDEF}};
  const Packet p2{1, 16, {0xFEDCBA9876543210, 0x5AA55AA5}};
  ASSERT_TRUE(src.enqueue(p1));
  ASSERT_TRUE(src.enqueue(p2));
  ASSERT_TRUE(h.run_until([&] { return sink.received().size() == 2; }));
  EXPECT_EQ(sink.received()[0], p1);
  EXPECT_EQ(sink.received()[1], p2);
  EXPECT_EQ(sink.partials_dropped(), 0u);
}

TEST(LinkCore, RoundTrip_SlowLane) {
  Harness h(LinkConfig{}, phy::LoopbackOptions{.lane_capacity = 4, .ce_divisor = 3});
  PacketQueueSource src;
  PacketQueueSink   sink;
  ASSERT_TRUE(h.ba.attach_downstream(4, src));
  ASSERT_TRUE(h.bb.attach_upstream(4, sink));
  h.build();

  const auto p = make_packet(4, {1, 2, 3, 4, 5, 6, 7, 8, 9, 10});
  ASSERT_TRUE(src.enqueue(p));
  ASSERT_TRUE(src.enqueue(p));
  ASSERT_TRUE(h.run_until([&] { return sink.received().size() == 2; }));
  EXPECT_EQ(sink.received()[0], p);
  EXPECT_EQ(sink.received()[1], p);
}

/**
 * @test Dispatch_OnlyMatchingConsumer
 * @brief A frame for port 2 never touches the consumer registered on port 1.
 */
TEST(LinkCore, Dispatch_OnlyMatchingConsumer) {
  Harness h;
  PacketQueueSource src;
  PacketQueueSink   k1, k2;
  ASSERT_TRUE(h.ba.attach_downstream(2, src));
  ASSERT_TRUE(h.bb.attach_upstream(1, k1));
  ASSERT_TRUE(h.bb.attach_upstream(2, k2));
  h.build();

  ASSERT_TRUE(src.enqueue(make_packet(2, {0x10, 0x20})));
  ASSERT_TRUE(h.run_until([&] { return k2.received().size() == 1; }));
  EXPECT_EQ(k2.received()[0], make_packet(2, {0x10, 0x20}));
  EXPECT_EQ(k1.flits_seen(), 0u);
}

TEST(LinkCore, Unrouted_CountedAndDropped) {
  Harness h;
  auto obs_b = obs::make_counting_observer();
  h.bb.observer(obs_b.get());

  PacketQueueSource s1, s7;
  PacketQueueSink   k1;
  ASSERT_TRUE(h.ba.attach_downstream(7, s7));
  ASSERT_TRUE(h.ba.attach_downstream(1, s1));
  ASSERT_TRUE(h.bb.attach_upstream(1, k1));
  h.build();

  ASSERT_TRUE(s7.enqueue(make_packet(7, {1, 2, 3})));
  ASSERT_TRUE(s1.enqueue(make_packet(1, {4})));
  ASSERT_TRUE(h.run_until([&] { return obs_b->snapshot().frames_received == 1 &&
                                       obs_b->snapshot().unrouted_frames == 1; }));
  ASSERT_EQ(k1.received().size(), 1u);
  EXPECT_EQ(k1.received()[0], make_packet(1, {4}));
  EXPECT_EQ(k1.flits_seen(), 1u);
}

/**
 * @test Atomicity_PausedProducer
 * @brief A producer that drops `valid` mid-packet keeps the link; the other
 *        producer waits instead of interleaving.
 */
TEST(LinkCore, Atomicity_PausedProducer) {
  Harness h;
  PacketQueueSource sa, sb;
  PacketQueueSink   ka, kb;
  ASSERT_TRUE(h.ba.attach_downstream(1, sa));
  ASSERT_TRUE(h.ba.attach_downstream(2, sb));
  ASSERT_TRUE(h.bb.attach_upstream(1, ka));
  ASSERT_TRUE(h.bb.attach_upstream(2, kb));
  h.build();

  const auto pa = make_packet(1, {0xA0, 0xA1, 0xA2, 0xA3});
  const auto pb = make_packet(2, {0xB0, 0xB1, 0xB2, 0xB3});
  ASSERT_TRUE(sa.enqueue(pa));
  ASSERT_TRUE(sb.enqueue(pb));

  ASSERT_TRUE(h.run_until([&] { return sa.words_sent() >= 1; }));
  sa.set_paused(true);
  for (int t = 0; t < 30; ++t) {
    h.run(1);
    EXPECT_EQ(sb.words_sent(), 0u);
  }
  EXPECT_TRUE(h.a->arbiter().locked());

  sa.set_paused(false);
  ASSERT_TRUE(h.run_until([&] { return ka.received().size() == 1 && kb.received().size() == 1; }));
  EXPECT_EQ(ka.received()[0], pa);
  EXPECT_EQ(kb.received()[0], pb);
}

/**
 * @test Backpressure_Lossless
 * @brief A stalled consumer fills the buffers and stalls the producer; nothing
 *        is lost once it resumes.
 */
TEST(LinkCore, Backpressure_Lossless) {
  Harness h(LinkConfig{}, phy::LoopbackOptions{.lane_capacity = 4});
  PacketQueueSource src;
  PacketQueueSink   sink;
  ASSERT_TRUE(h.ba.attach_downstream(6, src));
  ASSERT_TRUE(h.bb.attach_upstream(6, sink));
  h.build();

  std::vector<Packet> want;
  for (int i = 0; i < 4; ++i) {
    want.push_back(make_packet(6, {Word(i), 1, 2, 3, 4}));
    ASSERT_TRUE(src.enqueue(want.back()));
  }

  sink.set_paused(true);
  h.run(200);
  EXPECT_LT(src.packets_sent(), 4u);
  EXPECT_LE(h.a->tx_buffered(), 8u);
  EXPECT_LE(h.b->rx_buffered(), 8u);
  EXPECT_TRUE(sink.received().empty());

  sink.set_paused(false);
  ASSERT_TRUE(h.run_until([&] { return sink.received().size() == 4; }));
  EXPECT_EQ(sink.received(), want);
}

// --------------------------- Recovery -----------------------------------------

/**
 * @test Timeout_RecoversFromTruncatedFrame
 * @brief A frame cut short on the wire is abandoned by the idle timer; the
 *        consumer drops the partial packet when the next frame begins.
 */
TEST(LinkCore, Timeout_RecoversFromTruncatedFrame) {
  LinkConfig cfg;
  cfg.clk_freq_hz = 1;
  cfg.timeout_s   = 20;
  Harness h(cfg);
  auto obs_b = obs::make_counting_observer();
  h.bb.observer(obs_b.get());

  PacketQueueSource src;
  PacketQueueSink   sink;
  ASSERT_TRUE(h.ba.attach_downstream(1, src));
  ASSERT_TRUE(h.bb.attach_upstream(1, sink));
  h.build();

  // Truncated frame: announces two words, carries one.
  h.wire.a_to_b().push(framing::kPreamble);
  h.wire.a_to_b().push(framing::encode_header(1, 8));
  h.wire.a_to_b().push(0x77);

  h.run(40);
  EXPECT_EQ(obs_b->snapshot().timeouts, 1u);
  EXPECT_TRUE(sink.received().empty());
  EXPECT_EQ(sink.partial_words(), 1u);

  const auto p = make_packet(1, {0x100, 0x200});
  ASSERT_TRUE(src.enqueue(p));
  ASSERT_TRUE(h.run_until([&] { return sink.received().size() == 1; }));
  EXPECT_EQ(sink.received()[0], p);
  EXPECT_EQ(sink.partials_dropped(), 1u);
  EXPECT_EQ(obs_b->snapshot().timeouts, 1u);
}

TEST(LinkCore, Resync_GarbageBeforeFrame) {
  Harness h;
  auto obs_b = obs::make_counting_observer();
  h.bb.observer(obs_b.get());
  PacketQueueSource src;
  PacketQueueSink   sink;
  ASSERT_TRUE(h.ba.attach_downstream(2, src));
  ASSERT_TRUE(h.bb.attach_upstream(2, sink));
  h.build();

  h.wire.a_to_b().push(0xDEAD);
  h.wire.a_to_b().push(0xBEEF);
  ASSERT_TRUE(src.enqueue(make_packet(2, {9})));
  ASSERT_TRUE(h.run_until([&] { return sink.received().size() == 1; }));
  EXPECT_EQ(obs_b->snapshot().words_discarded, 2u);
}

/**
 * @test LinkDown_ResetsMidFrame
 * @brief Link loss mid-packet drops the partial packet on both ends; traffic
 *        after recovery is delivered intact.
 */
TEST(LinkCore, LinkDown_ResetsMidFrame) {
  Harness h;
  auto obs_a = obs::make_counting_observer();
  h.ba.observer(obs_a.get());
  PacketQueueSource src;
  PacketQueueSink   sink;
  ASSERT_TRUE(h.ba.attach_downstream(1, src));
  ASSERT_TRUE(h.bb.attach_upstream(1, sink));
  h.build();

  ASSERT_TRUE(src.enqueue(make_packet(1, {1, 2, 3, 4, 5, 6, 7, 8})));
  ASSERT_TRUE(h.run_until([&] { return src.words_sent() >= 3; }));

  h.wire.set_link_ready(false);
  h.run(5);
  EXPECT_FALSE(h.a->link_ready());
  EXPECT_EQ(src.packets_dropped(), 1u);
  EXPECT_EQ(src.pending(), 0u);
  EXPECT_EQ(h.a->tx_buffered(), 0u);
  EXPECT_EQ(h.b->rx_buffered(), 0u);
  EXPECT_EQ(sink.partial_words(), 0u);
  EXPECT_EQ(obs_a->snapshot().link_resets, 1u);

  h.wire.set_link_ready(true);
  const auto p = make_packet(1, {0xF0, 0xF1});
  ASSERT_TRUE(src.enqueue(p));
  ASSERT_TRUE(h.run_until([&] { return sink.received().size() == 1; }));
  EXPECT_TRUE(h.a->link_ready());
  EXPECT_EQ(sink.received()[0], p);
  EXPECT_EQ(obs_a->snapshot().link_resets, 1u);
}

TEST(LinkCore, LinkDown_NoResetWhenDisabled) {
  LinkConfig cfg;
  cfg.reset_on_link_down = false;
  Harness h(cfg);
  auto obs_a = obs::make_counting_observer();
  h.ba.observer(obs_a.get());
  PacketQueueSource src;
  ASSERT_TRUE(h.ba.attach_downstream(1, src));
  h.build();

  ASSERT_TRUE(src.enqueue(make_packet(1, {1, 2, 3, 4, 5, 6, 7, 8})));
  ASSERT_TRUE(h.run_until([&] { return src.words_sent() >= 3; }));
  h.wire.set_link_ready(false);
  h.run(5);
  EXPECT_EQ(src.packets_dropped(), 0u);
  EXPECT_EQ(obs_a->snapshot().link_resets, 0u);
}

// --------------------------- SERIO --------------------------------------------

TEST(SerioChannel, MirrorsInputAcrossLink) {
  Harness h;
  link::SerioChannel sa, sb;
  ASSERT_TRUE(sa.attach(h.ba));
  ASSERT_TRUE(sb.attach(h.bb));
  h.build();

  sa.set_input(0x1234);
  ASSERT_TRUE(h.run_until([&] { return sb.updates() == 1; }));
  EXPECT_EQ(sb.output(), 0x1234u);

  // Unchanged input sends nothing.
  h.run(50);
  EXPECT_EQ(sb.updates(), 1u);

  sa.set_input(0x5678);
  ASSERT_TRUE(h.run_until([&] { return sb.updates() == 2; }));
  EXPECT_EQ(sb.output(), 0x5678u);

  // After a link flap the current value is sent again.
  h.wire.set_link_ready(false);
  h.run(3);
  h.wire.set_link_ready(true);
  ASSERT_TRUE(h.run_until([&] { return sb.updates() == 3; }));
  EXPECT_EQ(sb.output(), 0x5678u);
}

/**
 * @test InputGlitch_DoesNotStallOtherPorts
 * @brief The input returns to its last sent value before the update is
 *        accepted; the update still completes and the link keeps serving
 *        the other producer.
 */
TEST(SerioChannel, InputGlitch_DoesNotStallOtherPorts) {
  Harness h;
  link::SerioChannel sa, sb;
  PacketQueueSource  bulk;
  PacketQueueSink    bulk_rx;
  ASSERT_TRUE(sa.attach(h.ba));
  ASSERT_TRUE(h.ba.attach_downstream(2, bulk));
  ASSERT_TRUE(sb.attach(h.bb));
  ASSERT_TRUE(h.bb.attach_upstream(2, bulk_rx));
  h.build();

  sa.set_input(5);
  h.run(1);
  EXPECT_TRUE(h.a->arbiter().locked());
  sa.set_input(0); // back to the last sent value before the word went out

  const auto p = make_packet(2, {0xC0FFEE, 0xBEEF});
  ASSERT_TRUE(bulk.enqueue(p));
  ASSERT_TRUE(h.run_until([&] { return bulk_rx.received().size() == 1; }));
  EXPECT_EQ(bulk_rx.received()[0], p);

  ASSERT_TRUE(h.run_until([&] { return sb.updates() == 1; }));
  EXPECT_EQ(sb.output(), 0u);
  h.run(20);
  EXPECT_FALSE(h.a->arbiter().locked());
  EXPECT_EQ(sb.updates(), 1u);
}

TEST(SerioChannel, PortTakenByOtherChannel) {
  phy::LoopbackLink wire;
  LinkBuilder b(wire.a(), LinkConfig{});
  PacketQueueSource other;
  ASSERT_TRUE(b.attach_downstream(config::constants::PORT_SERIO, other));

  link::SerioChannel serio;
  auto r = serio.attach(b);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), ConfigError::DuplicatePort);
}
