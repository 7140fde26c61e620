/**
 * @file vocabulary.hpp
 * @brief Result and optional vocabulary types shared by all mwb components.
 *
 * expected<V, E> carries either a value or an error code. Components return
 * it instead of throwing, so the whole library stays usable with
 * -fno-exceptions builds.
 *
 * Usage:
 * @code
 *   expected<uint32_t, MyError> r = Parse(buf);
 *   if (!r.has_value()) { Handle(r.get_error()); }
 *   uint32_t n = r.value();
 * @endcode
 */

#ifndef MWB_VOCABULARY_HPP_
#define MWB_VOCABULARY_HPP_

#include "mwb/platform.hpp"

#include <optional>
#include <utility>
#include <variant>

namespace mwb {

using std::nullopt;
using std::optional;

// ============================================================================
// expected<V, E>
// ============================================================================

template <typename V, typename E>
class expected {
 public:
  static expected success(V value) {
    return expected(std::in_place_index<0>, std::move(value));
  }

  static expected error(E err) {
    return expected(std::in_place_index<1>, std::move(err));
  }

  bool has_value() const noexcept { return storage_.index() == 0; }
  explicit operator bool() const noexcept { return has_value(); }

  V& value() & {
    MWB_ASSERT(has_value());
    return *std::get_if<0>(&storage_);
  }

  const V& value() const& {
    MWB_ASSERT(has_value());
    return *std::get_if<0>(&storage_);
  }

  V&& value() && {
    MWB_ASSERT(has_value());
    return std::move(*std::get_if<0>(&storage_));
  }

  const E& get_error() const {
    MWB_ASSERT(!has_value());
    return *std::get_if<1>(&storage_);
  }

  V value_or(V fallback) const {
    return has_value() ? *std::get_if<0>(&storage_) : std::move(fallback);
  }

 private:
  template <std::size_t I, typename T>
  expected(std::in_place_index_t<I> tag, T&& v)
      : storage_(tag, std::forward<T>(v)) {}

  std::variant<V, E> storage_;
};

// ============================================================================
// expected<void, E>
// ============================================================================

template <typename E>
class expected<void, E> {
 public:
  static expected success() { return expected(); }

  static expected error(E err) {
    expected r;
    r.error_ = std::move(err);
    return r;
  }

  bool has_value() const noexcept { return !error_.has_value(); }
  explicit operator bool() const noexcept { return has_value(); }

  const E& get_error() const {
    MWB_ASSERT(!has_value());
    return *error_;
  }

 private:
  expected() = default;

  std::optional<E> error_;
};

}  // namespace mwb

#endif  // MWB_VOCABULARY_HPP_
