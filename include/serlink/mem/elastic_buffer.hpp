/**
 * @file elastic_buffer.hpp
 * @brief Bounded single-producer/single-consumer FIFO with reset-to-empty.
 *
 * Design goals:
 *  - Exception-free tick path (push/pop return bool).
 *  - One-time allocation during setup via factory; no allocations after.
 *  - Single clock domain: producer and consumer run in the same tick loop,
 *    so indices are plain integers.
 *  - reset() discards everything queued (link-down path).
 *
 * Construction:
 *  - Use ElasticBuffer<T>::with_depth(depth) to build.
 *  - All `depth` slots are usable (occupancy is tracked explicitly).
 *
 * @tparam T Element type. Must be trivially copyable or nothrow-movable.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <type_traits>
#include <utility>

#include "serlink/compat/expected.hpp"  // serlink_detail::expected / unexpected

namespace serlink::mem {

/**
 * @brief Error codes reported by the factory (setup time only).
 * These errors are never produced during tick operations.
 */
enum class BufferError : std::uint8_t {
  DepthZero = 1,             ///< Depth must not be zero
  ElementNotNothrowMovable   ///< T must be trivially copyable or nothrow-movable
};

/// @brief Trait to constrain element types for the tick path.
template <class T>
struct BufferTraits {
  static constexpr bool ok =
    std::is_trivially_copyable_v<T> ||
    std::is_nothrow_move_constructible_v<T>;
};

/**
 * @brief Bounded FIFO of flits between exactly one producer and one consumer.
 *
 * @tparam T Element type.
 */
template <class T>
class ElasticBuffer final {
public:
  using value_type = T;

  /// @brief Default-constructed empty shell (use with factory).
  ElasticBuffer() noexcept = default;

  /**
   * @brief Factory: validates input and allocates once (no exceptions).
   * @param depth Number of elements the buffer can hold.
   * @return expected<ElasticBuffer, BufferError> constructed buffer or error.
   */
  static serlink_detail::expected<ElasticBuffer, BufferError>
  with_depth(std::size_t depth) {
    if (depth == 0) {
      return serlink_detail::unexpected<BufferError>(BufferError::DepthZero);
    }
    if (!BufferTraits<T>::ok) {
      return serlink_detail::unexpected<BufferError>(BufferError::ElementNotNothrowMovable);
    }
    ElasticBuffer b;
    b.storage_ = std::make_unique<T[]>(depth);
    b.depth_   = depth;
    return b;
  }

  ElasticBuffer(const ElasticBuffer&)            = delete; ///< Non-copyable
  ElasticBuffer& operator=(const ElasticBuffer&) = delete; ///< Non-assignable

  ElasticBuffer(ElasticBuffer&& other) noexcept { move_from(std::move(other)); }

  ElasticBuffer& operator=(ElasticBuffer&& other) noexcept {
    if (this != &other) move_from(std::move(other));
    return *this;
  }

  /**
   * @brief Push by const reference.
   * @return false if the buffer is full.
   */
  bool push(const T& v) noexcept(std::is_nothrow_copy_assignable_v<T>) {
    if (full()) return false;
    storage_[tail_] = v;
    tail_ = next(tail_);
    ++count_;
    return true;
  }

  /**
   * @brief Push by rvalue reference.
   * @return false if the buffer is full.
   */
  bool push(T&& v) noexcept(std::is_nothrow_move_assignable_v<T>) {
    if (full()) return false;
    storage_[tail_] = std::move(v);
    tail_ = next(tail_);
    ++count_;
    return true;
  }

  /**
   * @brief Pop one element into output.
   * @return false if the buffer is empty.
   */
  bool pop(T& out) noexcept(std::is_nothrow_move_assignable_v<T>) {
    if (empty()) return false;
    out = std::move(storage_[head_]);
    head_ = next(head_);
    --count_;
    return true;
  }

  /// @brief Drop the head element. No-op when empty.
  void drop() noexcept {
    if (empty()) return;
    head_ = next(head_);
    --count_;
  }

  /// @brief Head element, or nullptr when empty. Valid until the next pop/reset.
  const T* front() const noexcept { return empty() ? nullptr : &storage_[head_]; }

  /// @brief Discard all queued elements and return to the initial state.
  void reset() noexcept { head_ = 0; tail_ = 0; count_ = 0; }

  bool empty() const noexcept { return count_ == 0; }
  bool full() const noexcept { return count_ == depth_; }
  std::size_t size() const noexcept { return count_; }
  std::size_t depth() const noexcept { return depth_; }

private:
  std::size_t next(std::size_t i) const noexcept { return (i + 1 == depth_) ? 0 : i + 1; }

  void move_from(ElasticBuffer&& other) noexcept {
    storage_ = std::move(other.storage_);
    depth_   = other.depth_;
    head_    = other.head_;
    tail_    = other.tail_;
    count_   = other.count_;
    other.depth_ = other.head_ = other.tail_ = other.count_ = 0;
  }

  std::unique_ptr<T[]> storage_{};   ///< Owning storage, allocated once
  std::size_t          depth_ = 0;
  std::size_t          head_  = 0;   ///< Consumer index
  std::size_t          tail_  = 0;   ///< Producer index
  std::size_t          count_ = 0;   ///< Occupancy
};

} // namespace serlink::mem
