// Copyright (c) 2024 liudegui. MIT License.
// Tests for request identity allocation.

#include <catch2/catch.hpp>
#include <algorithm>
#include <set>
#include <thread>
#include <vector>

#include "sqlreq/identity.hpp"
#include "sqlreq/request.hpp"

using namespace sqlreq;

TEST_CASE("Identity: allocator is strictly increasing", "[identity]") {
  AtomicIdentityAllocator ids(10);
  REQUIRE(ids.Peek() == 10);
  REQUIRE(ids.Next() == 10);
  REQUIRE(ids.Next() == 11);
  REQUIRE(ids.Peek() == 12);
}

TEST_CASE("Identity: injected allocator isolates requests", "[identity]") {
  AtomicIdentityAllocator ids(100);
  RequestOptions opts;
  opts.ids = &ids;
  auto a = Exec(UnitType(), "DELETE FROM a", opts);
  auto b = Exec(UnitType(), "DELETE FROM b", opts);
  REQUIRE(a.QueryId() == std::optional<uint64_t>(100));
  REQUIRE(b.QueryId() == std::optional<uint64_t>(101));
}

TEST_CASE("Identity: oneshot requests take no identity", "[identity]") {
  AtomicIdentityAllocator ids(1);
  RequestOptions opts;
  opts.ids = &ids;
  opts.oneshot = true;
  auto req = Find(Int(), String(), "SELECT name FROM t WHERE id = ?", opts);
  REQUIRE(req.Valid());
  REQUIRE(req.IsOneshot());
  REQUIRE_FALSE(req.QueryId().has_value());
  REQUIRE(ids.Peek() == 1);
}

TEST_CASE("Identity: rejected templates take no identity", "[identity]") {
  AtomicIdentityAllocator ids(1);
  RequestOptions opts;
  opts.ids = &ids;
  Error err;
  auto req = Find(Int(), String(), "SELECT name FROM t WHERE id = $$", opts,
                  &err);
  REQUIRE_FALSE(req.Valid());
  REQUIRE(err.code == ErrorCode::kParse);
  REQUIRE(ids.Peek() == 1);
}

TEST_CASE("Identity: concurrent creation yields distinct identities",
          "[identity]") {
  constexpr int kThreads = 8;
  constexpr int kPerThread = 500;
  AtomicIdentityAllocator ids;
  std::vector<std::vector<uint64_t>> seen(kThreads);
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&ids, &seen, t]() {
      RequestOptions opts;
      opts.ids = &ids;
      for (int i = 0; i < kPerThread; ++i) {
        auto req = Collect(Int(), Int(), "SELECT x FROM t WHERE y > ?", opts);
        seen[t].push_back(*req.QueryId());
      }
    });
  }
  for (auto& th : threads) { th.join(); }

  std::set<uint64_t> all;
  for (const auto& v : seen) {
    REQUIRE(std::is_sorted(v.begin(), v.end()));
    all.insert(v.begin(), v.end());
  }
  REQUIRE(all.size() == static_cast<size_t>(kThreads * kPerThread));
}

TEST_CASE("Identity: default allocator is shared", "[identity]") {
  auto a = Exec(UnitType(), "DELETE FROM a");
  auto b = Exec(UnitType(), "DELETE FROM a");
  REQUIRE(a.QueryId().has_value());
  REQUIRE(b.QueryId().has_value());
  REQUIRE(*a.QueryId() < *b.QueryId());
}

TEST_CASE("Identity: cache keys differ across allocators", "[identity]") {
  AtomicIdentityAllocator first(1);
  AtomicIdentityAllocator second(1);
  REQUIRE(first.Serial() != second.Serial());
  REQUIRE(first.Serial() != DefaultIdentityAllocator().Serial());

  RequestOptions opts;
  opts.ids = &first;
  auto a = Exec(UnitType(), "DELETE FROM a", opts);
  opts.ids = &second;
  auto b = Exec(UnitType(), "DELETE FROM a", opts);
  REQUIRE(a.QueryId() == b.QueryId());
  REQUIRE(a.CacheKey().has_value());
  REQUIRE(a.CacheKey() != b.CacheKey());
  REQUIRE(a.CacheKey()->allocator == first.Serial());
}
