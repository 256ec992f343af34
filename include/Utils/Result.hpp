#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

// Value-or-error return used by the libvirt adapter. Errors carry a
// human readable message; callers at the interface boundary convert them to
// exceptions with expect(). Built through Ok()/Err() so T and E may coincide.
template <typename T, typename E = std::string>
class Result {
  std::variant<T, E> storage;

  template <std::size_t I, typename V>
  Result(std::in_place_index_t<I> tag, V&& v) : storage(tag, std::forward<V>(v)) {}

public:
  [[nodiscard]] static Result Ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  [[nodiscard]] static Result Err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool isOk() const noexcept { return storage.index() == 0; }
  [[nodiscard]] bool isErr() const noexcept { return storage.index() == 1; }

  [[nodiscard]] const E& error() const {
    if (isOk()) throw std::logic_error("Result holds a value, not an error");
    return std::get<1>(storage);
  }

  template <typename Ex = std::runtime_error>
  T expect(const std::string& msg) {
    if (isErr()) throw Ex(msg + ": " + std::get<1>(storage));
    return std::move(std::get<0>(storage));
  }

  T unwrap() { return expect("Called unwrap on error Result"); }
  E unwrapErr() {
    if (isOk()) throw std::logic_error("Called unwrapErr on ok Result");
    return std::move(std::get<1>(storage));
  }

  T unwrapOr(T defaultValue) { return isOk() ? std::move(std::get<0>(storage)) : std::move(defaultValue); }
};

template <typename E>
class Result<void, E> {
  bool ok{true};
  E err{};

public:
  [[nodiscard]] static Result Ok() { return Result(); }
  [[nodiscard]] static Result Err(E error) {
    Result r;
    r.ok = false;
    r.err = std::move(error);
    return r;
  }

  [[nodiscard]] bool isOk() const noexcept { return ok; }
  [[nodiscard]] bool isErr() const noexcept { return !ok; }

  [[nodiscard]] const E& error() const {
    if (ok) throw std::logic_error("Result holds a value, not an error");
    return err;
  }

  template <typename Ex = std::runtime_error>
  void expect(const std::string& msg) const {
    if (!ok) throw Ex(msg + ": " + err);
  }
};
