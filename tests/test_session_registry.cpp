/**
 * @file test_session_registry.cpp
 * @brief Tests for SessionRegistry RCU semantics and actor resolution.
 *
 * Validates:
 *  - add / replace / upsert / remove / clear behavior and error codes
 *  - Heterogeneous lookup with std::string_view keys
 *  - resolve(): registered + connected only
 *  - No torn reads under 1 writer / many readers
 */

#include <gtest/gtest.h>
#include <atomic>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "tap/session/session_registry.hpp"

using tap::session::ActorSnapshot;
using tap::session::RegistryErr;
using tap::session::Session;
using tap::session::SessionRegistry;

namespace {

std::shared_ptr<Session> make_session(std::string id, std::string ep = "192.0.2.1:1") {
  return std::make_shared<Session>(std::move(id), std::move(ep));
}

} // namespace

// --------------------------- Basic construction ----------------------------

TEST(SessionRegistry, Construct_Empty) {
  SessionRegistry reg;
  auto snap = reg.snapshot();
  ASSERT_TRUE(snap);
  EXPECT_TRUE(snap->empty());
  EXPECT_EQ(reg.version(), 0u);
}

// --------------------------- Add / Replace / Upsert ------------------------

TEST(SessionRegistry, Add_And_Find) {
  SessionRegistry reg;
  auto s = make_session("alice");
  EXPECT_EQ(reg.add(s), RegistryErr::Ok);

  EXPECT_EQ(reg.find(std::string_view{"alice"}), s);
  EXPECT_TRUE(reg.contains("alice"));
  EXPECT_EQ(reg.size(), 1u);
  EXPECT_EQ(reg.version(), 1u);
  EXPECT_EQ(reg.find("nobody"), nullptr);
}

TEST(SessionRegistry, ErrorNames) {
  EXPECT_EQ(tap::session::to_string(RegistryErr::Ok), "ok");
  EXPECT_EQ(tap::session::to_string(RegistryErr::Exists), "exists");
  EXPECT_EQ(tap::session::to_string(RegistryErr::NotFound), "not_found");
  EXPECT_EQ(tap::session::to_string(RegistryErr::Invalid), "invalid");
  EXPECT_EQ(tap::session::to_string(RegistryErr::Capacity), "capacity");
}

TEST(SessionRegistry, Add_Duplicate_Exists) {
  SessionRegistry reg;
  ASSERT_EQ(reg.add(make_session("alice")), RegistryErr::Ok);
  EXPECT_EQ(reg.add(make_session("alice")), RegistryErr::Exists);
  EXPECT_EQ(reg.size(), 1u);
  EXPECT_EQ(reg.stats().failures, 1u);
}

TEST(SessionRegistry, Replace_RequiresExisting) {
  SessionRegistry reg;
  EXPECT_EQ(reg.replace(make_session("bob")), RegistryErr::NotFound);

  auto first  = make_session("bob", "198.51.100.1:1");
  auto second = make_session("bob", "198.51.100.1:2");
  ASSERT_EQ(reg.add(first), RegistryErr::Ok);
  ASSERT_EQ(reg.replace(second), RegistryErr::Ok);
  EXPECT_EQ(reg.find("bob"), second);
}

TEST(SessionRegistry, Upsert_InsertsThenReplaces) {
  SessionRegistry reg;
  auto a = make_session("carol");
  auto b = make_session("carol");
  EXPECT_EQ(reg.upsert(a), RegistryErr::Ok);
  EXPECT_EQ(reg.upsert(b), RegistryErr::Ok);
  EXPECT_EQ(reg.find("carol"), b);
  EXPECT_EQ(reg.stats().upserts, 2u);
}

TEST(SessionRegistry, Invalid_Inputs_DoNotPublish) {
  SessionRegistry reg;
  EXPECT_EQ(reg.add(nullptr), RegistryErr::Invalid);
  EXPECT_EQ(reg.add(make_session("x")), RegistryErr::Invalid);            // too short
  EXPECT_EQ(reg.add(make_session("has space")), RegistryErr::Invalid);
  EXPECT_EQ(reg.add(make_session(std::string(65, 'a'))), RegistryErr::Invalid);
  EXPECT_EQ(reg.version(), 0u);
  EXPECT_TRUE(reg.snapshot()->empty());

  // Positive control
  EXPECT_EQ(reg.add(make_session("user@example.org")), RegistryErr::Ok);
}

// --------------------------- Remove / Clear --------------------------------

TEST(SessionRegistry, Remove_Existing_And_Missing) {
  SessionRegistry reg;
  ASSERT_EQ(reg.add(make_session("dave")), RegistryErr::Ok);

  auto before = reg.snapshot();
  EXPECT_FALSE(reg.remove("does_not_exist"));
  EXPECT_EQ(reg.snapshot(), before); // nothing published

  EXPECT_TRUE(reg.remove("dave"));
  EXPECT_FALSE(reg.contains("dave"));
  // Old snapshot is still intact for readers that hold it.
  EXPECT_EQ(before->size(), 1u);
}

TEST(SessionRegistry, Clear) {
  SessionRegistry reg;
  ASSERT_EQ(reg.add(make_session("aa")), RegistryErr::Ok);
  ASSERT_EQ(reg.add(make_session("bb")), RegistryErr::Ok);
  reg.clear();
  EXPECT_EQ(reg.size(), 0u);
  EXPECT_TRUE(reg.list_ids().empty());
}

// --------------------------- Resolution ------------------------------------

TEST(SessionRegistry, Resolve_ConnectedOnly) {
  SessionRegistry reg;
  auto s = make_session("erin");
  ASSERT_EQ(reg.add(s), RegistryErr::Ok);

  EXPECT_EQ(reg.resolve(ActorSnapshot{"erin"}), s);
  EXPECT_EQ(reg.resolve(ActorSnapshot{"frank"}), nullptr);

  s->disconnect();
  EXPECT_EQ(reg.resolve(ActorSnapshot{"erin"}), nullptr);

  const auto st = reg.stats();
  EXPECT_EQ(st.resolves, 3u);
  EXPECT_EQ(st.resolve_misses, 2u);
}

// --------------------------- Concurrency sanity ----------------------------

/**
 * @test Concurrency_1W_MR
 * @brief One writer swaps the session under one id; readers only ever see one
 *        of the two published sessions.
 */
TEST(SessionRegistry, Concurrency_1W_MR) {
  SessionRegistry reg;
  auto a = make_session("svc", "203.0.113.1:1");
  auto b = make_session("svc", "203.0.113.2:2");

  std::atomic<bool> running{true};
  std::atomic<int>  ok_reads{0};

  std::thread writer([&]{
    for (int i = 0; i < 4000; ++i) {
      (void)reg.upsert((i & 1) == 0 ? a : b);
      if ((i % 32) == 0) std::this_thread::yield();
    }
    running.store(false, std::memory_order_relaxed);
  });

  auto reader_fn = [&]{
    while (running.load(std::memory_order_relaxed)) {
      auto s = reg.find("svc");
      if (s) {
        if (s == a || s == b) {
          ok_reads.fetch_add(1, std::memory_order_relaxed);
        } else {
          ADD_FAILURE() << "Observed unknown session";
          break;
        }
      }
      std::this_thread::yield();
    }
  };

  std::thread r1(reader_fn), r2(reader_fn), r3(reader_fn);
  writer.join();
  r1.join(); r2.join(); r3.join();

  // Readers may all start after the writer finished; one final read still counts.
  auto last = reg.find("svc");
  ASSERT_TRUE(last == a || last == b);
  ok_reads.fetch_add(1, std::memory_order_relaxed);
  EXPECT_GT(ok_reads.load(), 0);
}

TEST(SessionRegistry, Concurrency_MW_NoLostUpdates) {
  constexpr int kWriters = 4;
  constexpr int kPerWriter = 50;

  for (int round = 0; round < 50; ++round) {
    SessionRegistry reg;
    std::vector<std::thread> writers;
    for (int w = 0; w < kWriters; ++w) {
      writers.emplace_back([&reg, w]{
        for (int i = 0; i < kPerWriter; ++i) {
          const auto id = "w" + std::to_string(w) + "-" + std::to_string(i);
          EXPECT_EQ(reg.add(make_session(id)), RegistryErr::Ok);
        }
      });
    }
    for (auto& t : writers) t.join();

    ASSERT_EQ(reg.size(), static_cast<std::size_t>(kWriters * kPerWriter)) << "round " << round;
    EXPECT_EQ(reg.stats().adds, static_cast<uint64_t>(kWriters * kPerWriter));
    EXPECT_EQ(reg.version(), static_cast<uint64_t>(kWriters * kPerWriter));

    // Interleave removes with adds on disjoint ids.
    std::thread remover([&reg]{
      for (int i = 0; i < kPerWriter; ++i) {
        EXPECT_TRUE(reg.remove("w0-" + std::to_string(i)));
      }
    });
    std::thread adder([&reg]{
      for (int i = 0; i < kPerWriter; ++i) {
        EXPECT_EQ(reg.add(make_session("late-" + std::to_string(i))), RegistryErr::Ok);
      }
    });
    remover.join();
    adder.join();
    EXPECT_EQ(reg.size(), static_cast<std::size_t>(kWriters * kPerWriter));
    EXPECT_FALSE(reg.contains("w0-0"));
    EXPECT_TRUE(reg.contains("late-0"));
  }
}
