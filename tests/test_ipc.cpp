/**
 * @file test_ipc.cpp
 * @brief Tests for the message protocol, shared-memory Channel and endpoint Directory.
 *
 * Validates:
 *  - builders (correlation ids, reply mirroring, error reasons) and the envelope codec
 *  - Channel factory validation, FIFO, back pressure, receive timeout
 *  - FIFO per producer across forked processes
 *  - Directory acquire / duplicate / release semantics
 */
#include <gtest/gtest.h>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "warden/ipc/channel.hpp"
#include "warden/ipc/directory.hpp"
#include "warden/ipc/message.hpp"
#include "warden/ipc/shared_arena.hpp"
#include "warden/runtime/process.hpp"

using namespace std::chrono_literals;
using warden::ErrorCode;
using warden::ipc::Channel;
using warden::ipc::Directory;
using warden::ipc::EndpointKind;
using warden::ipc::Message;
using warden::ipc::MessageKind;
using warden::ipc::Payload;
using warden::ipc::SharedArena;
using warden::runtime::ProcessHandle;

static SharedArena make_arena(std::size_t bytes = 1u << 20) {
  auto a = SharedArena::create(bytes);
  EXPECT_TRUE(a) << a.error().detail;
  return a ? std::move(*a) : SharedArena{};
}

static std::span<const std::byte> as_bytes(const std::string& s) {
  return std::as_bytes(std::span<const char>(s.data(), s.size()));
}

// ---------- Message protocol ----------

TEST(Message, Request_Has_Unique_CorrelationIds) {
  std::set<std::string> ids;
  for (int i = 0; i < 1000; ++i) {
    auto m = warden::ipc::build_request("gw", "ping", "ping", {}, "client:gw");
    EXPECT_EQ(m.kind, MessageKind::Request);
    EXPECT_TRUE(ids.insert(m.correlation_id).second) << m.correlation_id;
  }
}

TEST(Message, Response_Mirrors_Request) {
  auto req  = warden::ipc::build_request("orders", "users", "validate_user",
                                         Payload{{"user_id", std::int64_t{7}}}, "orders");
  auto resp = warden::ipc::build_response(req, Payload{{"valid", true}});
  EXPECT_EQ(resp.correlation_id, req.correlation_id);
  EXPECT_EQ(resp.kind, MessageKind::Response);
  EXPECT_EQ(resp.source, "users");
  EXPECT_EQ(resp.target, "orders");
  EXPECT_TRUE(resp.reason.empty());

  auto no = warden::ipc::build_response(req, {}, false);
  EXPECT_EQ(no.kind, MessageKind::Error);
  EXPECT_EQ(no.reason, "rejected");
}

TEST(Message, Error_Carries_Reason_And_Detail) {
  auto req = warden::ipc::build_request("gw", "users", "frobnicate", {}, "client:gw");
  auto err = warden::ipc::build_error(req, warden::ipc::reason::UnknownAction, "no such action");
  EXPECT_EQ(err.kind, MessageKind::Error);
  EXPECT_EQ(err.reason, "unknown_action");
  const auto* text = warden::ipc::get_if<std::string>(err.payload, warden::ipc::kErrorMessageKey);
  ASSERT_NE(text, nullptr);
  EXPECT_EQ(*text, "no such action");
  EXPECT_TRUE(warden::ipc::validate_envelope(err));
}

TEST(Message, Codec_Preserves_Every_Field) {
  auto m = warden::ipc::build_request(
      "orders", "users", "create_user",
      Payload{{"flag", true}, {"n", std::int64_t{-42}}, {"x", 2.5}, {"s", std::string("alice")}},
      "orders");
  const std::string wire = warden::ipc::encode(m);
  auto back = warden::ipc::decode(as_bytes(wire));
  ASSERT_TRUE(back);
  EXPECT_EQ(*back, m);
}

TEST(Message, Decode_Rejects_Garbage) {
  const std::string junk("\xff\xff\xff\xff\xff\xff\xff\xff\xff\xff\xff", 11);
  auto r = warden::ipc::decode(as_bytes(junk));
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
}

TEST(Message, Validate_Envelope_Shape) {
  Message m = warden::ipc::build_request("gw", "ping", "ping", {}, "");
  EXPECT_TRUE(warden::ipc::validate_envelope(m));

  Message no_target = m;
  no_target.target.clear();
  EXPECT_FALSE(warden::ipc::validate_envelope(no_target));

  Message no_action = m;
  no_action.action.clear();
  EXPECT_FALSE(warden::ipc::validate_envelope(no_action));

  Message err_no_reason = m;
  err_no_reason.kind = MessageKind::Error;
  EXPECT_FALSE(warden::ipc::validate_envelope(err_no_reason));
}

// ---------- Channel ----------

TEST(Channel, Create_Validation) {
  auto arena = make_arena();
  EXPECT_FALSE(Channel::create(arena, 0, 128));
  EXPECT_FALSE(Channel::create(arena, 1, 128));
  EXPECT_FALSE(Channel::create(arena, 100, 128));
  EXPECT_FALSE(Channel::create(arena, 8, 0));
  auto ok = Channel::create(arena, 8, 128);
  ASSERT_TRUE(ok);
  EXPECT_EQ(ok->capacity(), 8u);
  EXPECT_TRUE(ok->empty());
}

TEST(Channel, Create_Fails_When_Arena_Exhausted) {
  auto arena = make_arena(4096);
  auto r = Channel::create(arena, 1024, 4096);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().code, ErrorCode::Capacity);
}

TEST(Channel, SingleProcess_Fifo_With_Wrap) {
  auto arena = make_arena();
  auto ch = Channel::create(arena, 4, 512);
  ASSERT_TRUE(ch);

  std::vector<std::string> sent;
  for (int round = 0; round < 3; ++round) {
    for (int i = 0; i < 3; ++i) {
      auto m = warden::ipc::build_request("p", "c", "step",
                                          Payload{{"i", std::int64_t{round * 10 + i}}}, "");
      sent.push_back(m.correlation_id);
      ASSERT_TRUE(ch->send(m));
    }
    for (int i = 0; i < 3; ++i) {
      auto m = ch->receive(100ms);
      ASSERT_TRUE(m);
      EXPECT_EQ(m->correlation_id, sent[round * 3 + i]);
      EXPECT_EQ(*warden::ipc::get_if<std::int64_t>(m->payload, "i"), round * 10 + i);
    }
  }
  EXPECT_TRUE(ch->empty());
  EXPECT_EQ(ch->stats().sent, 9u);
  EXPECT_EQ(ch->stats().received, 9u);
}

TEST(Channel, Full_Ring_Signals_QueueOverflow) {
  auto arena = make_arena();
  auto ch = Channel::create(arena, 4, 256);
  ASSERT_TRUE(ch);
  for (int i = 0; i < 4; ++i) {
    ASSERT_TRUE(ch->send(warden::ipc::build_request("p", "c", "x", {}, "")));
  }
  auto r = ch->send(warden::ipc::build_request("p", "c", "x", {}, ""));
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().code, ErrorCode::QueueOverflow);
  EXPECT_EQ(ch->size(), 4u);   // nothing dropped, nothing duplicated
  EXPECT_EQ(ch->stats().overflows, 1u);

  ASSERT_TRUE(ch->receive(10ms));
  EXPECT_TRUE(ch->send(warden::ipc::build_request("p", "c", "x", {}, "")));
}

TEST(Channel, Oversized_Message_Rejected) {
  auto arena = make_arena();
  auto ch = Channel::create(arena, 4, 64);
  ASSERT_TRUE(ch);
  auto r = ch->send(warden::ipc::build_request("p", "c", "x",
                                               Payload{{"blob", std::string(500, 'z')}}, ""));
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().code, ErrorCode::MessageTooLarge);
  EXPECT_TRUE(ch->empty());
}

TEST(Channel, Receive_Times_Out_Empty) {
  auto arena = make_arena();
  auto ch = Channel::create(arena, 4, 256);
  ASSERT_TRUE(ch);
  const auto t0 = std::chrono::steady_clock::now();
  auto m = ch->receive(80ms);
  const auto waited = std::chrono::steady_clock::now() - t0;
  EXPECT_FALSE(m);
  EXPECT_GE(waited, 75ms);
  EXPECT_LT(waited, 1000ms);
}

TEST(Channel, Malformed_Slot_Is_Skipped) {
  auto arena = make_arena();
  auto ch = Channel::create(arena, 4, 256);
  ASSERT_TRUE(ch);
  ASSERT_TRUE(ch->send_bytes(as_bytes(std::string("\xff\xff\xff\xff\xff\xff\xff\xff\xff\xff\xff", 11))));
  auto good = warden::ipc::build_request("p", "c", "x", {}, "");
  ASSERT_TRUE(ch->send(good));

  auto m = ch->receive(100ms);
  ASSERT_TRUE(m);
  EXPECT_EQ(m->correlation_id, good.correlation_id);
  EXPECT_EQ(ch->stats().malformed, 1u);
}

TEST(Channel, CrossProcess_Fifo_Per_Producer) {
  constexpr int kProducers = 4;
  constexpr int kPerProducer = 200;

  auto arena = make_arena(4u << 20);
  auto ch = Channel::create(arena, 16, 256);
  ASSERT_TRUE(ch);
  Channel channel = *ch;

  std::vector<std::shared_ptr<ProcessHandle>> producers;
  for (int p = 0; p < kProducers; ++p) {
    auto h = ProcessHandle::spawn([channel, p]() mutable {
      for (int i = 0; i < kPerProducer;) {
        auto m = warden::ipc::build_request("prod" + std::to_string(p), "sink", "seq",
                                            Payload{{"p", std::int64_t{p}}, {"i", std::int64_t{i}}}, "");
        auto r = channel.send(m);
        if (r) ++i;
        else if (r.error().code != ErrorCode::QueueOverflow) return 2;
      }
      return 0;
    }, "producer");
    ASSERT_TRUE(h);
    producers.push_back(*h);
  }

  std::map<std::int64_t, std::int64_t> next;   // producer -> expected sequence
  for (int n = 0; n < kProducers * kPerProducer; ++n) {
    auto m = channel.receive(5000ms);
    ASSERT_TRUE(m) << "stalled after " << n << " messages";
    const auto p = *warden::ipc::get_if<std::int64_t>(m->payload, "p");
    const auto i = *warden::ipc::get_if<std::int64_t>(m->payload, "i");
    EXPECT_EQ(i, next[p]) << "producer " << p;
    next[p] = i + 1;
  }
  for (auto& h : producers) {
    ASSERT_TRUE(h->wait_for_exit(5000ms));
    EXPECT_EQ(h->describe_exit(), "exited with status 0");
  }
  EXPECT_FALSE(channel.receive(20ms));   // no duplicates
}

// ---------- Directory ----------

TEST(Directory, Acquire_Find_Release) {
  auto arena = make_arena(Directory::footprint(8, 256) + 4096);
  auto dir = Directory::create(arena, 8, 256);
  ASSERT_TRUE(dir);

  auto a = dir->acquire("users", EndpointKind::Service);
  ASSERT_TRUE(a);
  auto c = dir->acquire("client:gw", EndpointKind::Client);
  ASSERT_TRUE(c);
  EXPECT_NE(*a, *c);
  EXPECT_EQ(dir->in_use(), 2u);

  EXPECT_EQ(dir->find("users", EndpointKind::Service), a.value());
  EXPECT_FALSE(dir->find("client:gw", EndpointKind::Service));
  EXPECT_EQ(dir->find_any("client:gw"), c.value());
  EXPECT_EQ(dir->name_of(*a), "users");

  auto dup = dir->acquire("users", EndpointKind::Service);
  ASSERT_FALSE(dup);
  EXPECT_EQ(dup.error().code, ErrorCode::DuplicateService);

  dir->release(*a);
  dir->release(*a);   // idempotent
  EXPECT_FALSE(dir->find_any("users"));
  EXPECT_EQ(dir->in_use(), 1u);
}

TEST(Directory, Release_Drops_Queued_Messages_And_Stop_Flag) {
  auto arena = make_arena(Directory::footprint(8, 256) + 4096);
  auto dir = Directory::create(arena, 8, 256);
  ASSERT_TRUE(dir);

  auto id = dir->acquire("svc", EndpointKind::Service);
  ASSERT_TRUE(id);
  ASSERT_TRUE(dir->inbox(*id).send(warden::ipc::build_request("a", "svc", "x", {}, "")));
  dir->request_stop(*id);
  EXPECT_TRUE(dir->stop_requested(*id));

  dir->release(*id);
  auto again = dir->acquire("svc", EndpointKind::Service);
  ASSERT_TRUE(again);
  EXPECT_TRUE(dir->inbox(*again).empty());
  EXPECT_FALSE(dir->stop_requested(*again));
}

TEST(Directory, Capacity_Exhausted) {
  auto arena = make_arena(Directory::footprint(2, 256) + 4096);
  auto dir = Directory::create(arena, 2, 256);
  ASSERT_TRUE(dir);
  for (std::size_t i = 0; i < warden::Limits::MaxEndpoints; ++i) {
    ASSERT_TRUE(dir->acquire("ep" + std::to_string(i), EndpointKind::Client));
  }
  auto r = dir->acquire("one-more", EndpointKind::Client);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().code, ErrorCode::Capacity);
}
