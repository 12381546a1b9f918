#include <cassert>
#include <iostream>
#include <memory>

#include "internal/cache/reaper.hpp"
#include "internal/cache/registry.hpp"
#include "internal/cache/store_client.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using relcache::cache::StoreClient;
using relcache::db::memory::MemoryRepository;

template <typename Fn>
bool ThrowsNotInitialized(Fn&& fn) {
  try {
    fn();
  } catch (const relcache::util::NotInitialized&) {
    return true;
  }
  return false;
}

void TestUnsetRegistryThrows() {
  assert(ThrowsNotInitialized([] { (void)relcache::cache::GetClient(); }));
  assert(ThrowsNotInitialized([] { relcache::cache::Close(); }));
}

void TestSetGetClose() {
  auto repo   = std::make_shared<MemoryRepository>();
  auto client = std::make_shared<StoreClient>(repo);
  auto reaper = std::make_shared<relcache::cache::ExpiryReaper>(repo);
  client->SetReaper(reaper);
  reaper->Start();

  relcache::cache::SetClient(client);
  assert(relcache::cache::GetClient() == client);

  relcache::cache::GetClient()->Set("k", std::string_view("v"), relcache::cache::kNoExpiry);
  assert(client->GetString("k") == "v");

  relcache::cache::Close();
  assert(!reaper->Running());

  // unregistered after close
  assert(ThrowsNotInitialized([] { (void)relcache::cache::GetClient(); }));
  assert(ThrowsNotInitialized([] { relcache::cache::Close(); }));
}

void TestReplaceClient() {
  auto first  = std::make_shared<StoreClient>(std::make_shared<MemoryRepository>());
  auto second = std::make_shared<StoreClient>(std::make_shared<MemoryRepository>());

  relcache::cache::SetClient(first);
  relcache::cache::SetClient(second);
  assert(relcache::cache::GetClient() == second);

  relcache::cache::Close();
}

} // namespace

int main() {
  TestUnsetRegistryThrows();
  TestSetGetClose();
  TestReplaceClient();

  std::cout << "relcache_unit_registry: pass\n";
  return 0;
}
