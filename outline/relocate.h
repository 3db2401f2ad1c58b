#pragma once

// Relocation of the focused subtree. Each operation detaches the focus
// together with all its descendants and reattaches it relative to a target
// node, identified by key: the first node in pre-order whose key_of(value)
// compares equal to the target key. The returned cursor is focused on the
// moved node.
//
// Throws invalid_operation if the cursor is absent, if the target key
// does not resolve, or if the target lies in the focused subtree (the
// focus itself included).

#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>

#include "cursor.h"
#include "error.h"
#include "locate.h"
#include "ordered_forest.h"

namespace outline {

namespace impl {

inline bool is_prefix(const std::vector<std::size_t>& prefix, const std::vector<std::size_t>& pos) {
    return prefix.size()<=pos.size() && std::equal(prefix.begin(), prefix.end(), pos.begin());
}

// Graft is called with the forest without the moved subtree, an iterator
// to the target, and the moved subtree; it returns an iterator to the
// grafted node.

template <typename V, typename A, typename K, typename KeyOf, typename Graft>
cursor<V, A> relocate(const K& target, KeyOf&& key_of, const cursor<V, A>& c, Graft graft) {
    if (!c) throw invalid_operation("relocation of absent cursor");

    auto moving = c.position();
    auto f = c.to_forest();

    auto t = find_in_forest([&](const V& v) { return key_of(v)==target; }, f);
    if (!t) throw invalid_operation("relocation target not found");
    if (is_prefix(moving, position_of(f, t))) {
        throw invalid_operation("relocation target lies within the moved subtree");
    }

    auto subtree = f.prune(node_at(f, moving));
    auto moved = graft(f, t, std::move(subtree));

    auto pos = position_of(f, moved);
    return cursor<V, A>::at(std::move(f), pos);
}

} // namespace impl

// Insert as next sibling of the target, at the target's level.

template <typename K, typename KeyOf, typename V, typename A>
cursor<V, A> move_to_after(const K& target, KeyOf&& key_of, const cursor<V, A>& c) {
    using forest = ordered_forest<V, A>;
    using sibling_iterator = typename forest::sibling_iterator;

    return impl::relocate(target, key_of, c,
        [](forest& f, sibling_iterator t, forest sub) -> sibling_iterator {
            return f.graft_after(t, std::move(sub));
        });
}

// Insert as first child of the target.

template <typename K, typename KeyOf, typename V, typename A>
cursor<V, A> move_to_first_child_of(const K& target, KeyOf&& key_of, const cursor<V, A>& c) {
    using forest = ordered_forest<V, A>;
    using sibling_iterator = typename forest::sibling_iterator;

    return impl::relocate(target, key_of, c,
        [](forest& f, sibling_iterator t, forest sub) -> sibling_iterator {
            return f.graft_child(t, std::move(sub));
        });
}

// Insert as last child of the target.

template <typename K, typename KeyOf, typename V, typename A>
cursor<V, A> move_to_last_child_of(const K& target, KeyOf&& key_of, const cursor<V, A>& c) {
    using forest = ordered_forest<V, A>;
    using sibling_iterator = typename forest::sibling_iterator;

    return impl::relocate(target, key_of, c,
        [](forest& f, sibling_iterator t, forest sub) -> sibling_iterator {
            sibling_iterator last = t.child();
            if (!last) return f.graft_child(t, std::move(sub));

            while (last.next()) ++last;
            return f.graft_after(last, std::move(sub));
        });
}

// Make the focus the first tree of the forest. Always succeeds for a
// focused cursor.

template <typename V, typename A>
cursor<V, A> move_to_first_root_position(const cursor<V, A>& c) {
    if (!c) throw invalid_operation("relocation of absent cursor");

    auto f = c.to_forest();
    auto subtree = f.prune(node_at(f, c.position()));
    f.graft_front(std::move(subtree));
    return cursor<V, A>(std::move(f));
}

} // namespace outline
