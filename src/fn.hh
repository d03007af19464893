#pragma once

#include <functional>

// Shortcut for std::function
namespace portal {

template <typename T> using Fn = std::function<T>;

} // namespace portal
