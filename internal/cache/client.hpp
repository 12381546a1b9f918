#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace relcache::cache {

/*
  Capability contract of the cache backend.

  Every operation is atomic on its own. Transaction() groups several
  into one unit: the Client handed out by Context::Get() is bound to
  the open transaction, and anything thrown from fn rolls all of it
  back before being rethrown unchanged.

  Errors (util/errors.hpp):
    NotFound        - absent or expired key/field, empty map
    ValidationError - negative ttl and other malformed arguments
    StoreError      - anything the store reports
*/

// ttl == 0: never expires
inline constexpr std::chrono::milliseconds kNoExpiry{0};

// Set() only: a live entry keeps its expiry, a new one never expires
inline constexpr std::chrono::milliseconds kKeepTtl{-1};

// ScanMapStream page size when count <= 0
inline constexpr std::int64_t kDefaultScanCount = 10;

class Client;

class Context {
 public:
  virtual ~Context() = default;

  // Client bound to the enclosing transaction
  virtual Client& Get() = 0;

  // Exclusive lock on a key name until commit/rollback.
  virtual void LockKey(const std::string& key) = 0;
};

class Subscription {
 public:
  virtual ~Subscription() = default;

  // Next payload, or nullopt on timeout or once detached and drained.
  virtual std::optional<std::string> Receive(std::chrono::milliseconds timeout) = 0;

  // Stops delivery and removes the cursor. Idempotent.
  virtual void Detach() = 0;

  virtual const std::string& Channel() const = 0;
};

struct ScanPage {
  std::vector<std::string> items; // field, value, field, value, ...
  std::uint64_t            cursor = 0; // 0 when the scan is complete
};

class Client {
 public:
  virtual ~Client() = default;

  virtual void Set(const std::string& key, std::string_view value, std::chrono::milliseconds ttl) = 0;

  void Set(const std::string& key, const std::vector<std::uint8_t>& value, std::chrono::milliseconds ttl) {
    Set(key, std::string_view(reinterpret_cast<const char*>(value.data()), value.size()), ttl);
  }

  virtual std::vector<std::uint8_t> GetBytes(const std::string& key) = 0;
  virtual std::string               GetString(const std::string& key) = 0;

  // Rows removed (0 or 1).
  virtual std::int64_t Delete(const std::string& key) = 0;

  // Live entries among the distinct keys; all live entries when keys is empty.
  virtual std::int64_t Count(const std::vector<std::string>& keys) = 0;

  virtual void                               SetMapField(const std::string& key, const std::string& field,
                                                         const std::string& value) = 0;
  virtual std::string                        GetMapField(const std::string& key, const std::string& field) = 0;
  virtual void                               DeleteMapField(const std::string& key, const std::string& field) = 0;
  virtual std::map<std::string, std::string> GetMap(const std::string& key) = 0;

  // Offset cursor over fields in name order; match is a glob ('*', '?').
  virtual ScanPage ScanMapStream(const std::string& key, std::uint64_t cursor, const std::string& match,
                                 std::int64_t count) = 0;

  // true iff the entry was written; a live holder is left untouched.
  virtual bool SetNX(const std::string& key, std::string_view value, std::chrono::milliseconds ttl) = 0;

  // true iff a live entry was updated.
  virtual bool Expire(const std::string& key, std::chrono::milliseconds ttl) = 0;

  virtual void Transaction(const std::function<void(Context&)>& fn) = 0;

  virtual void                          Publish(const std::string& channel, const std::string& message) = 0;
  virtual std::unique_ptr<Subscription> Subscribe(const std::string& channel) = 0;

  virtual void Close() = 0;
};

} // namespace relcache::cache
