#pragma once
#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <fmt/core.h>
#include <fmt/format.h>
#include <memory>
#include <utility>
#include <variant>

namespace util {

// A (very) poor man's sum type with matching:
// `std::variant`, augmented with a few convenience methods.

template<typename... Args>
struct Variant: std::variant<Args...> {
  using Base = std::variant<Args...>;
  using Base::Base;

  template<typename T>
  bool is() const {
    return std::holds_alternative<T>(*this);
  }

  template<typename T>
  T& as() {
    assert(is<T>());
    return std::get<T>(*this);
  }

  template<typename T>
  const T& as() const {
    assert(is<T>());
    return std::get<T>(*this);
  }

  template<typename T>
  T* maybe_as() {
    return is<T>() ? &as<T>() : nullptr;
  }

  template<typename T>
  const T* maybe_as() const {
    return is<T>() ? &as<T>() : nullptr;
  }

  template<typename... Fs>
  decltype(auto) match(Fs&&... fs) {
    struct Visitor: Fs... { using Fs::operator()...; };
    return std::visit(Visitor{ std::forward<Fs>(fs)... }, static_cast<Base&>(*this));
  }

  template<typename... Fs>
  decltype(auto) match(Fs&&... fs) const {
    struct Visitor: Fs... { using Fs::operator()...; };
    return std::visit(Visitor{ std::forward<Fs>(fs)... }, static_cast<const Base&>(*this));
  }
};


// A heap-allocated `T` with value semantics: copying a `Box` copies the pointee.
// Lets a variant alternative hold another node of the same variant.

template<typename T>
class Box {
  std::unique_ptr<T> ptr;
public:
  Box(T value): ptr(std::make_unique<T>(std::move(value))) {}
  Box(const Box& other): ptr(std::make_unique<T>(*other)) {}
  Box(Box&&) noexcept = default;
  ~Box() = default;

  Box& operator=(const Box& other) {
    ptr = std::make_unique<T>(*other);
    return *this;
  }
  Box& operator=(Box&&) noexcept = default;

  T& operator*() { return *ptr; }
  const T& operator*() const { return *ptr; }
  T* operator->() { return ptr.get(); }
  const T* operator->() const { return ptr.get(); }
};


template<typename... Args>
void println(const fmt::format_string<Args...>& fmt, Args&&... args) {
  fmt::print(stderr, fmt, std::forward<Args>(args)...);
  std::fputc('\n', stderr);
  std::fflush(stderr);
}

#define LOG(F, ...) (::util::println(FMT_STRING(F) __VA_OPT__(,) __VA_ARGS__))

#define FATAL(F, ...) \
  do { \
    ::util::println(FMT_STRING(F) __VA_OPT__(,) __VA_ARGS__); \
    ::std::exit(1); \
  } while (false)


// Polyfill C++23 std::unreachable()

[[noreturn]] inline void unreachable() {
#if NDEBUG
  __builtin_unreachable();
#else
  assert(false);
  std::abort();
#endif
}

} // namespace util
