/**
 * @file vocabulary.hpp
 * @brief Vocabulary types shared by every ppx module.
 *
 * expected<V,E> for error-as-value returns, optional<T>, FixedString<N>
 * for bounded inline text, NewType<T,Tag> for strong identifiers and
 * ScopeGuard / PPX_SCOPE_EXIT for scope-bound cleanup.
 */

#ifndef PPX_VOCABULARY_HPP_
#define PPX_VOCABULARY_HPP_

#include "ppx/platform.hpp"

#include <cstdint>
#include <cstring>
#include <new>
#include <type_traits>
#include <utility>

namespace ppx {

// ============================================================================
// ConfigError
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
  kInvalidValue,
  kAlreadyExists,
  kWriteFailed
};

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Holds either a value of type V or an error of type E.
 *
 * Construct through the static success() / error() factories. Accessing
 * value() on an error asserts in debug builds.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& v) {
    expected r;
    ::new (r.Ptr()) V(v);
    r.has_value_ = true;
    return r;
  }

  static expected success(V&& v) {
    expected r;
    ::new (r.Ptr()) V(std::move(v));
    r.has_value_ = true;
    return r;
  }

  static expected error(E e) noexcept {
    expected r;
    r.error_ = e;
    return r;
  }

  expected(const expected& other) : error_(other.error_) {
    if (other.has_value_) {
      ::new (Ptr()) V(*other.Ptr());
      has_value_ = true;
    }
  }

  expected(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value)
      : error_(other.error_) {
    if (other.has_value_) {
      ::new (Ptr()) V(std::move(*other.Ptr()));
      has_value_ = true;
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      error_ = other.error_;
      if (other.has_value_) {
        ::new (Ptr()) V(*other.Ptr());
        has_value_ = true;
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      error_ = other.error_;
      if (other.has_value_) {
        ::new (Ptr()) V(std::move(*other.Ptr()));
        has_value_ = true;
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & {
    PPX_ASSERT(has_value_);
    return *Ptr();
  }

  const V& value() const& {
    PPX_ASSERT(has_value_);
    return *Ptr();
  }

  V&& value() && {
    PPX_ASSERT(has_value_);
    return std::move(*Ptr());
  }

  E get_error() const noexcept { return error_; }

  V value_or(const V& fallback) const {
    return has_value_ ? *Ptr() : fallback;
  }

 private:
  expected() noexcept = default;

  V* Ptr() noexcept { return reinterpret_cast<V*>(storage_); }
  const V* Ptr() const noexcept {
    return reinterpret_cast<const V*>(storage_);
  }

  void Destroy() noexcept {
    if (has_value_) {
      Ptr()->~V();
      has_value_ = false;
    }
  }

  alignas(V) unsigned char storage_[sizeof(V)];
  bool has_value_ = false;
  E error_{};
};

/// @brief expected<void, E>: success carries no payload.
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept {
    expected r;
    r.has_value_ = true;
    return r;
  }

  static expected error(E e) noexcept {
    expected r;
    r.error_ = e;
    return r;
  }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }
  E get_error() const noexcept { return error_; }

 private:
  expected() noexcept = default;

  bool has_value_ = false;
  E error_{};
};

// ============================================================================
// optional<T>
// ============================================================================

template <typename T>
class optional final {
 public:
  optional() noexcept = default;

  optional(const T& v) {  // NOLINT(google-explicit-constructor)
    ::new (Ptr()) T(v);
    has_value_ = true;
  }

  optional(T&& v) {  // NOLINT(google-explicit-constructor)
    ::new (Ptr()) T(std::move(v));
    has_value_ = true;
  }

  optional(const optional& other) {
    if (other.has_value_) {
      ::new (Ptr()) T(*other.Ptr());
      has_value_ = true;
    }
  }

  optional(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value) {
    if (other.has_value_) {
      ::new (Ptr()) T(std::move(*other.Ptr()));
      has_value_ = true;
    }
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (Ptr()) T(*other.Ptr());
        has_value_ = true;
      }
    }
    return *this;
  }

  optional& operator=(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        ::new (Ptr()) T(std::move(*other.Ptr()));
        has_value_ = true;
      }
    }
    return *this;
  }

  ~optional() { reset(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() & {
    PPX_ASSERT(has_value_);
    return *Ptr();
  }

  const T& value() const& {
    PPX_ASSERT(has_value_);
    return *Ptr();
  }

  T value_or(const T& fallback) const {
    return has_value_ ? *Ptr() : fallback;
  }

  T* operator->() noexcept { return Ptr(); }
  const T* operator->() const noexcept { return Ptr(); }

  void reset() noexcept {
    if (has_value_) {
      Ptr()->~T();
      has_value_ = false;
    }
  }

 private:
  T* Ptr() noexcept { return reinterpret_cast<T*>(storage_); }
  const T* Ptr() const noexcept {
    return reinterpret_cast<const T*>(storage_);
  }

  alignas(T) unsigned char storage_[sizeof(T)];
  bool has_value_ = false;
};

// ============================================================================
// FixedString<N>
// ============================================================================

/// @brief Tag selecting the truncating FixedString constructors.
struct TruncateToCapacity_t {};
static constexpr TruncateToCapacity_t TruncateToCapacity{};

/**
 * @brief Null-terminated string with inline storage of Capacity characters.
 *
 * Literal construction is checked at compile time; runtime input must go
 * through the TruncateToCapacity overloads.
 */
template <uint32_t Capacity>
class FixedString final {
 public:
  FixedString() noexcept { buf_[0] = '\0'; }

  template <uint32_t N>
  FixedString(const char (&literal)[N]) noexcept {  // NOLINT
    static_assert(N - 1U <= Capacity, "literal exceeds FixedString capacity");
    std::memcpy(buf_, literal, N);
    size_ = N - 1U;
  }

  FixedString(TruncateToCapacity_t, const char* s) noexcept {
    assign(TruncateToCapacity, s);
  }

  FixedString(TruncateToCapacity_t, const char* s, uint32_t len) noexcept {
    assign(TruncateToCapacity, s, len);
  }

  void assign(TruncateToCapacity_t, const char* s) noexcept {
    assign(TruncateToCapacity, s,
           (s != nullptr) ? static_cast<uint32_t>(std::strlen(s)) : 0U);
  }

  void assign(TruncateToCapacity_t, const char* s, uint32_t len) noexcept {
    if (s == nullptr) {
      clear();
      return;
    }
    size_ = (len < Capacity) ? len : Capacity;
    std::memcpy(buf_, s, size_);
    buf_[size_] = '\0';
  }

  const char* c_str() const noexcept { return buf_; }
  uint32_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0U; }
  static constexpr uint32_t capacity() noexcept { return Capacity; }

  void clear() noexcept {
    buf_[0] = '\0';
    size_ = 0U;
  }

  template <uint32_t M>
  bool operator==(const FixedString<M>& rhs) const noexcept {
    return size_ == rhs.size() && std::memcmp(buf_, rhs.c_str(), size_) == 0;
  }

  template <uint32_t M>
  bool operator!=(const FixedString<M>& rhs) const noexcept {
    return !(*this == rhs);
  }

  bool operator==(const char* rhs) const noexcept {
    return rhs != nullptr && std::strcmp(buf_, rhs) == 0;
  }

 private:
  char buf_[Capacity + 1U];
  uint32_t size_ = 0U;
};

// ============================================================================
// NewType<T, Tag>
// ============================================================================

/**
 * @brief Strong typedef: values of different tags do not mix.
 */
template <typename T, typename Tag>
class NewType final {
 public:
  constexpr NewType() noexcept : value_() {}
  constexpr explicit NewType(T v) noexcept : value_(v) {}

  constexpr T value() const noexcept { return value_; }

  constexpr bool operator==(NewType rhs) const noexcept {
    return value_ == rhs.value_;
  }
  constexpr bool operator!=(NewType rhs) const noexcept {
    return value_ != rhs.value_;
  }
  constexpr bool operator<(NewType rhs) const noexcept {
    return value_ < rhs.value_;
  }

 private:
  T value_;
};

// ============================================================================
// ScopeGuard
// ============================================================================

/**
 * @brief Runs a callable when leaving scope unless release() was called.
 */
template <typename F>
class ScopeGuard final {
 public:
  explicit ScopeGuard(F fn) noexcept(std::is_nothrow_move_constructible<F>::value)
      : fn_(std::move(fn)) {}

  ScopeGuard(ScopeGuard&& other) noexcept(
      std::is_nothrow_move_constructible<F>::value)
      : fn_(std::move(other.fn_)), active_(other.active_) {
    other.active_ = false;
  }

  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;
  ScopeGuard& operator=(ScopeGuard&&) = delete;

  ~ScopeGuard() {
    if (active_) {
      fn_();
    }
  }

  void release() noexcept { active_ = false; }

 private:
  F fn_;
  bool active_ = true;
};

template <typename F>
ScopeGuard<F> MakeScopeGuard(F fn) {
  return ScopeGuard<F>(std::move(fn));
}

#define PPX_SCOPE_EXIT(...)                                \
  auto PPX_CONCAT(ppx_scope_exit_, __LINE__) =             \
      ::ppx::MakeScopeGuard([&]() { __VA_ARGS__; })

}  // namespace ppx

#endif  // PPX_VOCABULARY_HPP_
