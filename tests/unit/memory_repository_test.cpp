#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/cache_entry_record.hpp"
#include "internal/db/model/map_field_record.hpp"

namespace {

using relcache::db::memory::MemoryRepository;
using relcache::db::model::CacheEntryRecord;
using relcache::db::model::MapFieldRecord;
using namespace std::chrono_literals;

CacheEntryRecord Entry(const std::string& key, const std::string& value, std::int64_t expire_at_ms,
                       std::int64_t now_ms) {
  CacheEntryRecord r;
  r.key           = key;
  r.value         = value;
  r.expire_at_ms  = expire_at_ms;
  r.updated_at_ms = now_ms;
  return r;
}

void TestLikeMatch() {
  assert(MemoryRepository::LikeMatch("%", ""));
  assert(MemoryRepository::LikeMatch("%", "anything"));
  assert(MemoryRepository::LikeMatch("user:%", "user:42"));
  assert(!MemoryRepository::LikeMatch("user:%", "admin:42"));
  assert(MemoryRepository::LikeMatch("a_c", "abc"));
  assert(!MemoryRepository::LikeMatch("a_c", "abbc"));
  assert(MemoryRepository::LikeMatch("%b%d", "abcbd"));
  assert(!MemoryRepository::LikeMatch("%b%d", "abcbe"));
  assert(MemoryRepository::LikeMatch("50\\%", "50%"));
  assert(!MemoryRepository::LikeMatch("50\\%", "500"));
  assert(MemoryRepository::LikeMatch("a\\_b", "a_b"));
  assert(!MemoryRepository::LikeMatch("a\\_b", "axb"));
  assert(MemoryRepository::LikeMatch("x\\\\y", "x\\y"));
  assert(!MemoryRepository::LikeMatch("abc", "ABC"));
  assert(!MemoryRepository::LikeMatch("", "a"));
}

void TestRollbackDiscardsWrites() {
  MemoryRepository repo;

  {
    auto tx = repo.Begin();
    assert(repo.UpsertEntry(*tx, Entry("k", "v", 1000, 1), false));
    assert(repo.GetLiveEntry(*tx, "k", 1).has_value());
    tx->Rollback();
    assert(tx->IsCommitted());
  }

  {
    // destructor rolls back
    auto tx = repo.Begin();
    assert(repo.UpsertEntry(*tx, Entry("k", "v", 1000, 1), false));
  }

  auto tx = repo.Begin();
  assert(!repo.GetLiveEntry(*tx, "k", 1).has_value());
  tx->Commit();
}

void TestWriterLockSerializesTransactions() {
  MemoryRepository repo;

  auto first = repo.Begin();
  assert(repo.UpsertEntry(*first, Entry("shared", "from-first", 1'000'000, 1), false));

  std::atomic<bool> second_started{false};
  std::atomic<bool> second_saw_write{false};
  std::thread       second([&] {
    auto tx        = repo.Begin();
    second_started = true;
    auto row       = repo.GetLiveEntry(*tx, "shared", 2);
    second_saw_write = row.has_value() && row->value == "from-first";
    tx->Commit();
  });

  std::this_thread::sleep_for(50ms);
  assert(!second_started.load());

  first->Commit();
  second.join();

  assert(second_started.load());
  assert(second_saw_write.load());
}

void TestConditionalInsertClaimsExpiredRow() {
  MemoryRepository repo;
  auto             tx = repo.Begin();

  assert(repo.InsertEntryIfAbsent(*tx, Entry("nx", "a", 100, 10)).rows_affected == 1);
  assert(repo.InsertEntryIfAbsent(*tx, Entry("nx", "b", 200, 50)).rows_affected == 0);
  assert(repo.GetLiveEntry(*tx, "nx", 50)->value == "a");

  // at now == expire_at_ms the row is already expired
  assert(repo.InsertEntryIfAbsent(*tx, Entry("nx", "c", 500, 100)).rows_affected == 1);
  assert(repo.GetLiveEntry(*tx, "nx", 100)->value == "c");
  tx->Commit();
}

void TestKeepLiveExpiry() {
  MemoryRepository repo;
  auto             tx = repo.Begin();

  assert(repo.UpsertEntry(*tx, Entry("k", "1", 100, 10), false));
  assert(repo.UpsertEntry(*tx, Entry("k", "2", 999, 20), true));
  auto row = repo.GetLiveEntry(*tx, "k", 20);
  assert(row->value == "2");
  assert(row->expire_at_ms == 100);

  // holder expired: new expiry applies
  assert(repo.UpsertEntry(*tx, Entry("k", "3", 999, 150), true));
  assert(repo.GetLiveEntry(*tx, "k", 150)->expire_at_ms == 999);
  tx->Commit();
}

void TestScanMapFieldsOffsetAndPattern() {
  MemoryRepository repo;
  auto             tx = repo.Begin();

  for (const char* field : {"alpha", "beta", "gamma", "delta"}) {
    MapFieldRecord r;
    r.key   = "h";
    r.field = field;
    r.value = std::string(field) + "-v";
    assert(repo.UpsertMapField(*tx, r));
  }
  MapFieldRecord other;
  other.key   = "h2";
  other.field = "alpha";
  assert(repo.UpsertMapField(*tx, other));

  auto all = repo.ScanMapFields(*tx, "h", std::nullopt, 0, 10);
  assert(all.size() == 4);
  assert(all[0].field == "alpha");
  assert(all[3].field == "gamma");

  auto page = repo.ScanMapFields(*tx, "h", std::nullopt, 1, 2);
  assert(page.size() == 2);
  assert(page[0].field == "beta");
  assert(page[1].field == "delta");

  auto matched = repo.ScanMapFields(*tx, "h", std::string("%ta"), 0, 10);
  assert(matched.size() == 2);
  assert(matched[0].field == "beta");
  assert(matched[1].field == "delta");

  assert(repo.ListMapFields(*tx, "h2").size() == 1);
  tx->Commit();
}

} // namespace

int main() {
  TestLikeMatch();
  TestRollbackDiscardsWrites();
  TestWriterLockSerializesTransactions();
  TestConditionalInsertClaimsExpiredRow();
  TestKeepLiveExpiry();
  TestScanMapFieldsOffsetAndPattern();

  std::cout << "relcache_unit_memory_repository: pass\n";
  return 0;
}
