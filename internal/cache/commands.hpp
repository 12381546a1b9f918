#pragma once

#include <cstdint>
#include <exception>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace relcache::cache {

/*
  Command result wrappers returned by Cmdable.

  A wrapper carries the command name, a value and an optional
  captured error. Val() reads the value unchecked, Result() rethrows
  the captured error first.
*/
class Cmder {
 public:
  explicit Cmder(std::string name) : name_(std::move(name)) {
  }
  virtual ~Cmder() = default;

  const std::string& Name() const {
    return name_;
  }

  std::exception_ptr Err() const {
    return err_;
  }

  bool Failed() const {
    return err_ != nullptr;
  }

  // what() of the captured error, empty when none
  std::string ErrMessage() const;

  bool IsNotFound() const;

  void ThrowIfError() const {
    if (err_) std::rethrow_exception(err_);
  }

  void SetErr(std::exception_ptr err) {
    err_ = std::move(err);
  }

 private:
  std::string        name_;
  std::exception_ptr err_;
};

template <typename T>
class ValueCmd : public Cmder {
 public:
  using Cmder::Cmder;

  const T& Val() const {
    return val_;
  }

  const T& Result() const {
    ThrowIfError();
    return val_;
  }

  void SetVal(T val) {
    val_ = std::move(val);
  }

 private:
  T val_{};
};

class StatusCmd : public ValueCmd<std::string> {
 public:
  using ValueCmd::ValueCmd;
};

class StringCmd : public ValueCmd<std::string> {
 public:
  using ValueCmd::ValueCmd;

  // Throws the captured error, or util::ValidationError if not an integer.
  std::int64_t Int64() const;

  std::vector<std::uint8_t> Bytes() const;
};

using IntCmd             = ValueCmd<std::int64_t>;
using BoolCmd            = ValueCmd<bool>;
using MapStringStringCmd = ValueCmd<std::map<std::string, std::string>>;
using StringSliceCmd     = ValueCmd<std::vector<std::string>>;
using CmderSliceCmd      = ValueCmd<std::vector<std::shared_ptr<Cmder>>>;

} // namespace relcache::cache
