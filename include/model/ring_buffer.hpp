#pragma once

#include <array>
#include <cstddef>

namespace heat_agent::model {

// Fixed-capacity circular buffer. Pushing into a full buffer evicts the oldest entry.
// Index 0 is the oldest retained entry, size() - 1 the newest.
template <typename T, std::size_t N>
class RingBuffer {
 public:
  static_assert(N > 0, "RingBuffer capacity must be greater than 0");

  void push(const T& value) {
    data_[next_] = value;
    next_ = (next_ + 1) % N;
    if (count_ < N) {
      ++count_;
    }
  }

  void clear() noexcept {
    next_ = 0;
    count_ = 0;
  }

  [[nodiscard]] std::size_t size() const noexcept { return count_; }
  [[nodiscard]] bool empty() const noexcept { return count_ == 0; }
  [[nodiscard]] static constexpr std::size_t capacity() noexcept { return N; }

  const T& operator[](const std::size_t index) const { return data_[(first() + index) % N]; }
  const T& back() const { return (*this)[count_ - 1]; }

  bool operator==(const RingBuffer& other) const {
    if (count_ != other.count_) {
      return false;
    }
    for (std::size_t i = 0; i < count_; ++i) {
      if (!((*this)[i] == other[i])) {
        return false;
      }
    }
    return true;
  }

  bool operator!=(const RingBuffer& other) const { return !(*this == other); }

 private:
  std::size_t first() const noexcept { return count_ < N ? 0 : next_; }

  std::array<T, N> data_{};
  std::size_t next_{0};
  std::size_t count_{0};
};

}  // namespace heat_agent::model
