// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <cstddef>
#include <type_traits>
#include <utility>

namespace dagrad {
namespace core {

// Intrusive refcounted base (thread-safe). Objects start with refcount=0 and
// are destroyed when the last intrusive_ptr lets go.
struct IntrusiveRefcounted {
  void retain() const noexcept { refcount_.fetch_add(1, std::memory_order_relaxed); }
  void release() const noexcept {
    if (refcount_.fetch_sub(1, std::memory_order_acq_rel) == 1) {
      delete this;
    }
  }
  std::size_t refcount() const noexcept { return refcount_.load(std::memory_order_acquire); }

 protected:
  IntrusiveRefcounted() = default;
  IntrusiveRefcounted(const IntrusiveRefcounted&) = delete;
  IntrusiveRefcounted& operator=(const IntrusiveRefcounted&) = delete;
  virtual ~IntrusiveRefcounted() = default;

 private:
  mutable std::atomic<std::size_t> refcount_{0};
};

// Shared handle over an IntrusiveRefcounted object. Converts implicitly from a
// handle to a derived type, so kind-specific nodes can be passed wherever a
// base handle is expected.
template <class T>
class intrusive_ptr {
 public:
  using element_type = T;
  constexpr intrusive_ptr() noexcept : ptr_(nullptr) {}
  constexpr intrusive_ptr(std::nullptr_t) noexcept : ptr_(nullptr) {}

  explicit intrusive_ptr(T* p, bool add_ref = true) noexcept : ptr_(p) {
    if (ptr_ && add_ref) ptr_->retain();
  }

  intrusive_ptr(const intrusive_ptr& other) noexcept : ptr_(other.ptr_) {
    if (ptr_) ptr_->retain();
  }
  intrusive_ptr(intrusive_ptr&& other) noexcept : ptr_(other.ptr_) { other.ptr_ = nullptr; }

  template <class U, class = std::enable_if_t<std::is_convertible_v<U*, T*>>>
  intrusive_ptr(const intrusive_ptr<U>& other) noexcept : ptr_(other.get()) {
    if (ptr_) ptr_->retain();
  }

  intrusive_ptr& operator=(const intrusive_ptr& other) noexcept {
    if (this != &other) {
      if (other.ptr_) other.ptr_->retain();
      if (ptr_) ptr_->release();
      ptr_ = other.ptr_;
    }
    return *this;
  }
  intrusive_ptr& operator=(intrusive_ptr&& other) noexcept {
    if (this != &other) {
      if (ptr_) ptr_->release();
      ptr_ = other.ptr_;
      other.ptr_ = nullptr;
    }
    return *this;
  }

  ~intrusive_ptr() { if (ptr_) ptr_->release(); }

  void reset() noexcept {
    if (ptr_) ptr_->release();
    ptr_ = nullptr;
  }

  T* get() const noexcept { return ptr_; }
  T& operator*() const noexcept { return *ptr_; }
  T* operator->() const noexcept { return ptr_; }
  explicit operator bool() const noexcept { return ptr_ != nullptr; }

  std::size_t use_count() const noexcept { return ptr_ ? ptr_->refcount() : 0; }

  template <class U>
  bool operator==(const intrusive_ptr<U>& other) const noexcept { return ptr_ == other.get(); }
  bool operator==(std::nullptr_t) const noexcept { return ptr_ == nullptr; }

 private:
  T* ptr_;
};

template <class T, class... Args>
inline intrusive_ptr<T> make_intrusive(Args&&... args) {
  static_assert(std::is_base_of<IntrusiveRefcounted, T>::value, "T must be IntrusiveRefcounted");
  return intrusive_ptr<T>(new T(std::forward<Args>(args)...), /*add_ref=*/true);
}

// Downcast helper for kind-specific handles; the caller guarantees the dynamic type.
template <class T, class U>
inline intrusive_ptr<T> static_pointer_cast(const intrusive_ptr<U>& p) noexcept {
  return intrusive_ptr<T>(static_cast<T*>(p.get()));
}

template <class T, class U>
inline intrusive_ptr<T> dynamic_pointer_cast(const intrusive_ptr<U>& p) noexcept {
  return intrusive_ptr<T>(dynamic_cast<T*>(p.get()));
}

template <class T>
struct is_intrusive_ptr : std::false_type {};
template <class T>
struct is_intrusive_ptr<intrusive_ptr<T>> : std::true_type {};

} // namespace core
} // namespace dagrad

