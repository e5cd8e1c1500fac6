#pragma once

#include <utility>

namespace tracksync::record {

/*
  Sets a variable for the lifetime of the guard and puts the previous
  value back afterwards. Nested guards on the same variable unwind in
  stack order, so an inner scope never clobbers an outer one.
*/
template <typename T>
class ScopedValue {
 public:
  ScopedValue(T& target, T value) : target_(&target), saved_(std::move(target)) {
    *target_ = std::move(value);
  }

  ~ScopedValue() {
    if (target_) {
      *target_ = std::move(saved_);
    }
  }

  ScopedValue(const ScopedValue&)            = delete;
  ScopedValue& operator=(const ScopedValue&) = delete;

  ScopedValue(ScopedValue&& other) noexcept : target_(other.target_), saved_(std::move(other.saved_)) {
    other.target_ = nullptr;
  }

  ScopedValue& operator=(ScopedValue&&) = delete;

 private:
  T* target_;
  T  saved_;
};

using DecoupleScope = ScopedValue<bool>;

} // namespace tracksync::record
