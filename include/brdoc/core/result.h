#pragma once

#include <cstddef>
#include <utility>
#include <variant>

namespace brdoc::core {

// Result<T, E> is the non-throwing return type of the library (C++ Core Guidelines E.27).
// It holds either the produced value or the reason it could not be produced:
//
//   auto r = Cpf::validate(input);
//   if (!r.has_value()) { log(describe(DocumentKind::kCpf, r.error())); }
//
// T and E must be distinct types.
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool has_value() const { return data_.index() == 0; }

  // Precondition for value()/take_value(): has_value(). error(): !has_value().
  // Violations throw std::bad_variant_access.
  [[nodiscard]] const T& value() const { return std::get<0>(data_); }
  [[nodiscard]] T take_value() && { return std::get<0>(std::move(data_)); }
  [[nodiscard]] const E& error() const { return std::get<1>(data_); }

 private:
  template <std::size_t I, typename V>
  Result(std::in_place_index_t<I> index, V&& v) : data_(index, std::forward<V>(v)) {}

  std::variant<T, E> data_;
};

}  // namespace brdoc::core
