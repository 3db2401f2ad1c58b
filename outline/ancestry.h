#pragma once

#include <cstddef>
#include <vector>

#include "cursor.h"

namespace outline {

// Values of the focus's ancestors: immediate parent first, root last.
// Empty if the focus is a root.

template <typename V, typename A>
std::vector<V> ancestors_of(const cursor<V, A>& c) {
    const auto& path = c.path();

    std::vector<V> out;
    out.reserve(path.size());
    for (auto i = path.rbegin(); i!=path.rend(); ++i) out.push_back(i->value);
    return out;
}

template <typename V, typename A>
std::size_t depth_of(const cursor<V, A>& c) {
    return c.depth();
}

} // namespace outline
