#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace fuzzcache {

// Replay() rethrows the captured exception object.
template <typename T>
class Outcome {
 public:
  static Outcome Success(T value) { return Outcome(std::in_place_index<0>, std::move(value)); }

  static Outcome Failure(std::exception_ptr error) {
    if (error == nullptr) {
      throw std::invalid_argument("Outcome::Failure requires a non-null exception");
    }
    return Outcome(std::in_place_index<1>, std::move(error));
  }

  template <typename Fn, typename... Args>
  static Outcome Capture(Fn&& fn, Args&&... args) {
    try {
      return Success(std::invoke(std::forward<Fn>(fn), std::forward<Args>(args)...));
    } catch (...) {
      return Failure(std::current_exception());
    }
  }

  [[nodiscard]] bool ok() const { return state_.index() == 0; }

  const T& value() const {
    if (!ok()) {
      std::rethrow_exception(std::get<1>(state_));
    }
    return std::get<0>(state_);
  }

  [[nodiscard]] std::exception_ptr error() const {
    return ok() ? std::exception_ptr{} : std::get<1>(state_);
  }

  T Replay() const { return value(); }

 private:
  template <std::size_t I, typename U>
  Outcome(std::in_place_index_t<I> tag, U&& payload) : state_(tag, std::forward<U>(payload)) {}

  std::variant<T, std::exception_ptr> state_;
};

}  // namespace fuzzcache
