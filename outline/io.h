#pragma once

// Stream output: forests print one node per line, indented two spaces per
// level; cursors print their forest with the focus marked by '*'.

#include <ostream>
#include <string>

#include "classify.h"
#include "cursor.h"
#include "flatten.h"
#include "ordered_forest.h"

namespace outline {

template <typename V, typename A>
std::ostream& operator<<(std::ostream& out, const ordered_forest<V, A>& f) {
    auto print_children = [&out](auto& self, auto n, std::string prefix) -> void {
        while (n) {
            out << prefix << *n << '\n';
            if (n.child()) self(self, n.child(), prefix+"  ");
            n = n.next();
        }
    };
    print_children(print_children, f.root_begin(), "");
    return out;
}

template <typename V, typename A>
std::ostream& operator<<(std::ostream& out, const cursor<V, A>& c) {
    if (!c) return out << "(absent)\n";

    // The focus is the row at its pre-order index: the number of nodes in
    // the trees and subtrees that precede it, plus one per ancestor.
    std::size_t focus_row = c.depth();
    for (const auto& f: c.path()) focus_row += f.left.size();
    focus_row += c.left_siblings().size();

    std::size_t i = 0;
    for (const auto& r: flatten_rows(c.to_forest())) {
        out << (i++==focus_row? '*': ' ') << std::string(2*r.depth, ' ') << r.value << '\n';
    }
    return out;
}

template <typename V>
std::ostream& operator<<(std::ostream& out, const row<V>& r) {
    return out << '(' << r.depth << ", " << r.value << ')';
}

inline std::ostream& operator<<(std::ostream& out, placement_kind k) {
    switch (k) {
    case placement_kind::none: return out << "none";
    case placement_kind::first_root: return out << "first_root";
    case placement_kind::first_child_of: return out << "first_child_of";
    case placement_kind::after: return out << "after";
    }
    return out;
}

template <typename V>
std::ostream& operator<<(std::ostream& out, const placement<V>& p) {
    out << p.kind;
    if (p.anchor) out << '(' << *p.anchor << ')';
    return out;
}

} // namespace outline
