#include "registry.hpp"

#include <mutex>

#include "internal/util/errors.hpp"

namespace relcache::cache {

namespace {

std::mutex              g_mutex;
std::shared_ptr<Client> g_client;

} // namespace

void SetClient(std::shared_ptr<Client> client) {
  std::lock_guard lock(g_mutex);
  g_client = std::move(client);
}

std::shared_ptr<Client> GetClient() {
  std::lock_guard lock(g_mutex);
  if (!g_client) throw util::NotInitialized("cache backend not initialized");
  return g_client;
}

void Close() {
  std::shared_ptr<Client> client;
  {
    std::lock_guard lock(g_mutex);
    if (!g_client) throw util::NotInitialized("cache backend not initialized");
    client = std::move(g_client);
  }
  client->Close();
}

} // namespace relcache::cache
