#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/cache/commands.hpp"

namespace relcache::cache {

/*
  Command-style surface of an in-memory cache server.

  Implementations never throw; failures are captured in the
  returned wrapper.
*/

class Pipeliner {
 public:
  virtual ~Pipeliner() = default;

  virtual StatusCmd Set(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) = 0;
  virtual StringCmd Get(const std::string& key) = 0;
  virtual IntCmd    IncrBy(const std::string& key, std::int64_t delta) = 0;
  virtual IntCmd    Del(const std::vector<std::string>& keys) = 0;
  virtual BoolCmd   Expire(const std::string& key, std::chrono::milliseconds ttl) = 0;

  // Number of queued commands.
  virtual std::size_t Len() const = 0;
  virtual void        Discard() = 0;

  virtual CmderSliceCmd Exec() = 0;
};

class Cmdable {
 public:
  virtual ~Cmdable() = default;

  // strings
  virtual StatusCmd Set(const std::string& key, const std::string& value, std::chrono::milliseconds ttl) = 0;
  virtual StringCmd Get(const std::string& key) = 0;
  virtual IntCmd    Incr(const std::string& key) = 0;
  virtual IntCmd    IncrBy(const std::string& key, std::int64_t delta) = 0;

  // hashes: values is field, value, field, value, ...
  virtual IntCmd             HSet(const std::string& key, const std::vector<std::string>& values) = 0;
  virtual MapStringStringCmd HGetAll(const std::string& key) = 0;

  // generic
  virtual IntCmd  Del(const std::vector<std::string>& keys) = 0;
  virtual IntCmd  Exists(const std::vector<std::string>& keys) = 0;
  virtual BoolCmd Expire(const std::string& key, std::chrono::milliseconds ttl) = 0;

  // lists
  virtual StringCmd      LIndex(const std::string& key, std::int64_t index) = 0;
  virtual IntCmd         LPush(const std::string& key, const std::vector<std::string>& values) = 0;
  virtual IntCmd         RPush(const std::string& key, const std::vector<std::string>& values) = 0;
  virtual StatusCmd      LSet(const std::string& key, std::int64_t index, const std::string& value) = 0;
  virtual StringCmd      LPop(const std::string& key) = 0;
  virtual StringSliceCmd LRange(const std::string& key, std::int64_t start, std::int64_t stop) = 0;

  virtual std::unique_ptr<Pipeliner> Pipeline() = 0;
};

} // namespace relcache::cache
