#pragma once

#include <vector>

namespace portal {

template <typename T = char>
struct Vec : std::vector<T> {
  using std::vector<T>::vector;

  // Returns a pointer to the first element matching `pred` or nullptr.
  template <typename Pred>
  const T* FindIf(Pred pred) const {
    for (const auto& v : *this) {
      if (pred(v)) {
        return &v;
      }
    }
    return nullptr;
  }
};

}  // namespace portal
