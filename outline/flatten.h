#pragma once

// Conversion between a cursor and the plain forest it belongs to, and the
// flattening of a forest into the indented rows an outline view draws.

#include <cstddef>
#include <utility>
#include <vector>

#include "cursor.h"
#include "ordered_forest.h"

namespace outline {

template <typename V, typename A>
ordered_forest<V, A> to_flat_forest(const cursor<V, A>& c) {
    return c.to_forest();
}

// Cursor on the first tree, or the absent cursor if f is empty.

template <typename V, typename A>
cursor<V, A> from_flat_forest(ordered_forest<V, A> f) {
    if (f.empty()) return {};
    return cursor<V, A>(std::move(f));
}

template <typename V>
struct row {
    std::size_t depth;
    V value;

    bool operator==(const row& other) const { return depth==other.depth && value==other.value; }
    bool operator!=(const row& other) const { return !(*this==other); }
};

// Rows in pre-order; roots have depth zero.

template <typename V, typename A>
std::vector<row<V>> flatten_rows(const ordered_forest<V, A>& f) {
    std::vector<row<V>> rows;

    auto visit = [&rows](auto& self, auto n, std::size_t depth) -> void {
        for (; n; n = n.next()) {
            rows.push_back(row<V>{depth, *n});
            self(self, n.child(), depth+1);
        }
    };
    visit(visit, f.root_begin(), 0);
    return rows;
}

} // namespace outline
