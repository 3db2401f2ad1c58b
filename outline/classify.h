#pragma once

// Classification of single-row moves in the pre-order rendering of a
// forest. go_up and go_down only inspect the cursor; they report which
// relocation, relative to which anchor node, moves the focus up or down
// past its neighbouring row, and do not perform it. apply_placement,
// move_up and move_down carry out the relocation.

#include "cursor.h"
#include "error.h"
#include "relocate.h"

namespace outline {

enum class placement_kind {
    none,
    first_root,
    first_child_of,
    after
};

// The anchor points to a value held by the cursor that the placement was
// computed from, and is valid while that cursor is alive and unmodified.
// It is null for the none and first_root placements.

template <typename V>
struct placement {
    placement_kind kind = placement_kind::none;
    const V* anchor = nullptr;

    explicit operator bool() const { return kind!=placement_kind::none; }
};

// Row above the focus N:
//
// * N has a previous sibling S: N becomes the first child of the last
//   visible descendant of S (S itself if S is a leaf).
// * N is the first child of P, and P has a parent G: N becomes the first
//   child of G, ahead of P.
// * N is the first child of the root P, and a root R precedes P: N becomes
//   a root placed after R.
// * N is the first child of the first root: N becomes the first root.
// * N is the first root: none.

template <typename V, typename A>
placement<V> go_up(const cursor<V, A>& c) {
    if (!c) return {};

    if (auto d = c.left_siblings().root_begin()) {
        while (d.child()) {
            d = d.child();
            while (d.next()) ++d;
        }
        return {placement_kind::first_child_of, &*d};
    }

    const auto& path = c.path();
    if (path.empty()) return {};

    if (path.size()>1) {
        return {placement_kind::first_child_of, &path[path.size()-2].value};
    }
    if (auto r = path.back().left.root_begin()) {
        return {placement_kind::after, &*r};
    }
    return {placement_kind::first_root, nullptr};
}

// Row below the focus N, the mirror image of go_up:
//
// * N has a next sibling M: N becomes the first child of M.
// * N is the last child of P: N is placed after P.
// * N is the last root: none.

template <typename V, typename A>
placement<V> go_down(const cursor<V, A>& c) {
    if (!c) return {};

    if (auto m = c.right_siblings().root_begin()) {
        return {placement_kind::first_child_of, &*m};
    }

    const auto& path = c.path();
    if (path.empty()) return {};

    return {placement_kind::after, &path.back().value};
}

// Perform the relocation described by p, computed from c. Anchors are
// resolved through key_of. Throws invalid_operation for the none placement.

template <typename V, typename A, typename KeyOf>
cursor<V, A> apply_placement(const placement<V>& p, KeyOf&& key_of, const cursor<V, A>& c) {
    switch (p.kind) {
    case placement_kind::first_root:
        return move_to_first_root_position(c);
    case placement_kind::first_child_of: {
        auto k = key_of(*p.anchor);
        return move_to_first_child_of(k, key_of, c);
    }
    case placement_kind::after: {
        auto k = key_of(*p.anchor);
        return move_to_after(k, key_of, c);
    }
    case placement_kind::none:
        break;
    }
    throw invalid_operation("no placement to apply");
}

// Move the focus one row up or down; the absent cursor if it is already in
// the first (last) row.

template <typename V, typename A, typename KeyOf>
cursor<V, A> move_up(KeyOf&& key_of, const cursor<V, A>& c) {
    auto p = go_up(c);
    if (!p) return {};
    return apply_placement(p, key_of, c);
}

template <typename V, typename A, typename KeyOf>
cursor<V, A> move_down(KeyOf&& key_of, const cursor<V, A>& c) {
    auto p = go_down(c);
    if (!p) return {};
    return apply_placement(p, key_of, c);
}

} // namespace outline
