#pragma once

// Utilities for working with std::variant

#include <variant> // IWYU pragma: export

template <class... Ts> struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

// True when `V` is a std::variant that can hold a `T`.
template <typename T, typename V> struct is_variant_member;

template <typename T, typename... Ts>
struct is_variant_member<T, std::variant<Ts...>>
    : std::disjunction<std::is_same<T, Ts>...> {};
