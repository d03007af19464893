#pragma once

#include <optional>

namespace portal {

template <typename T> using Optional = std::optional<T>;

} // namespace portal
