#pragma once

#include <memory>

namespace portal {

template <typename T> using UniquePtr = std::unique_ptr<T>;

} // namespace portal
