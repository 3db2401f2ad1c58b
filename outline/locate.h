#pragma once

// Pre-order search over an ordered forest, and conversion between nodes and
// their positions (sibling index at each level, outermost first).

#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>

#include "cursor.h"
#include "error.h"
#include "ordered_forest.h"

namespace outline {

// First node in pre-order whose value satisfies pred, or an end iterator.

template <typename Pred, typename Forest>
auto find_in_forest(Pred&& pred, Forest& f) -> decltype(f.begin()) {
    auto i = f.begin();
    while (i && !pred(*i)) ++i;
    return i;
}

// Throws if i is not a node of f; the walk ends at i's root, which must be
// one of the roots of f.

template <typename V, typename A>
std::vector<std::size_t> position_of(const ordered_forest<V, A>& f, typename ordered_forest<V, A>::template iterator_mc<true> i) {
    using iter = typename ordered_forest<V, A>::template iterator_mc<true>;

    std::vector<std::size_t> pos;
    for (; i; i = i.parent()) {
        iter s = i.parent()? i.parent().child(): iter(f.root_begin());

        std::size_t k = 0;
        for (; s && s!=i; s = s.next()) ++k;
        if (!s) throw invalid_operation("iterator does not belong to forest");

        pos.push_back(k);
    }
    std::reverse(pos.begin(), pos.end());
    return pos;
}

template <typename V, typename A>
typename ordered_forest<V, A>::sibling_iterator node_at(ordered_forest<V, A>& f, const std::vector<std::size_t>& pos) {
    typename ordered_forest<V, A>::sibling_iterator i = f.root_begin();
    for (std::size_t level = 0; level<pos.size(); ++level) {
        if (level>0) i = i.child();
        for (std::size_t k = 0; i && k<pos[level]; ++k) ++i;
        if (!i) throw invalid_operation("bad position");
    }
    return i;
}

// Cursor on the node that find_in_forest would return, or the absent cursor.

template <typename Pred, typename V, typename A>
cursor<V, A> find_cursor_in_forest(Pred&& pred, ordered_forest<V, A> f) {
    auto i = find_in_forest(std::forward<Pred>(pred), f);
    if (!i) return {};

    auto pos = position_of(f, i);
    return cursor<V, A>::at(std::move(f), pos);
}

} // namespace outline
