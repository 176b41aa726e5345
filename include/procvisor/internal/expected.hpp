#pragma once

#include <type_traits>
#include <utility>
#include <variant>

namespace procvisor {

/// @brief Error wrapper mirroring std::unexpected.
template <typename E>
class unexpected {
 public:
  explicit unexpected(E error) : error_(std::move(error)) {}

  [[nodiscard]] const E& error() const& noexcept { return error_; }
  [[nodiscard]] E& error() & noexcept { return error_; }
  [[nodiscard]] E&& error() && noexcept { return std::move(error_); }

 private:
  E error_;
};

template <typename E>
unexpected(E) -> unexpected<E>;

/// @brief Value-or-error holder with the subset of std::expected procvisor uses.
///
/// Unlike std::expected, an E converts implicitly so that functions can
/// `return Error{...};` directly.
template <typename T, typename E>
class expected {
  static_assert(!std::is_same_v<T, E>, "value and error types must differ");

 public:
  using value_type = T;
  using error_type = E;

  expected(const T& value) : storage_(std::in_place_index<0>, value) {}
  expected(T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}
  expected(const E& error) : storage_(std::in_place_index<1>, error) {}
  expected(E&& error) : storage_(std::in_place_index<1>, std::move(error)) {}
  expected(unexpected<E> error) : storage_(std::in_place_index<1>, std::move(error).error()) {}

  [[nodiscard]] bool has_value() const noexcept { return storage_.index() == 0; }
  explicit operator bool() const noexcept { return has_value(); }

  [[nodiscard]] T& value() & { return std::get<0>(storage_); }
  [[nodiscard]] const T& value() const& { return std::get<0>(storage_); }
  [[nodiscard]] T&& value() && { return std::get<0>(std::move(storage_)); }

  [[nodiscard]] T* operator->() noexcept { return std::get_if<0>(&storage_); }
  [[nodiscard]] const T* operator->() const noexcept { return std::get_if<0>(&storage_); }
  [[nodiscard]] T& operator*() & noexcept { return *std::get_if<0>(&storage_); }
  [[nodiscard]] const T& operator*() const& noexcept { return *std::get_if<0>(&storage_); }

  [[nodiscard]] E& error() & { return std::get<1>(storage_); }
  [[nodiscard]] const E& error() const& { return std::get<1>(storage_); }
  [[nodiscard]] E&& error() && { return std::get<1>(std::move(storage_)); }

  template <typename U>
  [[nodiscard]] T value_or(U&& fallback) const& {
    return has_value() ? value() : static_cast<T>(std::forward<U>(fallback));
  }

 private:
  std::variant<T, E> storage_;
};

template <typename E>
class expected<void, E> {
 public:
  using value_type = void;
  using error_type = E;

  expected() = default;
  expected(const E& error) : error_(error), has_value_(false) {}
  expected(E&& error) : error_(std::move(error)), has_value_(false) {}
  expected(unexpected<E> error) : error_(std::move(error).error()), has_value_(false) {}

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }
  void value() const noexcept {}

  [[nodiscard]] E& error() & { return error_; }
  [[nodiscard]] const E& error() const& { return error_; }
  [[nodiscard]] E&& error() && { return std::move(error_); }

 private:
  E error_{};
  bool has_value_{true};
};

}  // namespace procvisor
