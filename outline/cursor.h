#pragma once

// A cursor (zipper) is a position within an ordered forest together with
// enough context to rebuild the whole forest and to move the position.
//
// The context is held by value:
//
//     focus tree: the focused node and all its descendants;
//     left, right: the siblings of the focus at its own level, each stored
//         with the sibling closest to the focus first;
//     path: one frame per ancestor, outermost first; a frame holds the
//         ancestor's value and the ancestor's own left and right siblings.
//
// The path is empty when the focus is a root. Steps move nodes between
// these forests without copying payloads; the public step methods return a
// new cursor, or the absent (default-constructed, falsy) cursor when the
// step runs off the forest.

#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

#include "error.h"
#include "ordered_forest.h"

namespace outline {

template <typename V, typename Allocator = std::allocator<V>>
class cursor {
public:
    using value_type = V;
    using allocator_type = Allocator;
    using forest_type = ordered_forest<V, Allocator>;
    using position_type = std::vector<std::size_t>;

    struct frame {
        V value;
        forest_type left;
        forest_type right;

        bool operator==(const frame& other) const {
            return value==other.value && left==other.left && right==other.right;
        }
        bool operator!=(const frame& other) const { return !(*this==other); }
    };

    // The absent cursor.
    cursor() = default;

    // Focus on the first tree of f.
    explicit cursor(forest_type f):
        focus_(f.get_allocator()),
        left_(f.get_allocator()),
        right_(f.get_allocator())
    {
        if (f.empty()) throw invalid_operation("empty forest");
        focus_ = f.prune_front();
        right_ = std::move(f);
    }

    // Focus on the node at position pos of f: pos holds the sibling index
    // at each level, starting with the index of the tree among the roots.
    static cursor at(forest_type f, const position_type& pos) {
        cursor c(std::move(f));
        for (std::size_t level = 0; level<pos.size(); ++level) {
            if (level>0 && !c.descend()) throw invalid_operation("bad position");
            for (std::size_t k = 0; k<pos[level]; ++k) {
                if (!c.forward()) throw invalid_operation("bad position");
            }
        }
        return c;
    }

    explicit operator bool() const { return !focus_.empty(); }

    const V& label() const {
        if (focus_.empty()) throw invalid_operation("absent cursor");
        return *focus_.root_begin();
    }

    // The focused subtree, as a forest with a single tree.
    const forest_type& focus_tree() const { return focus_; }

    const forest_type& left_siblings() const { return left_; }
    const forest_type& right_siblings() const { return right_; }
    const std::vector<frame>& path() const { return path_; }

    std::size_t depth() const { return path_.size(); }

    position_type position() const {
        position_type pos;
        for (const auto& f: path_) pos.push_back(f.left.tree_count());
        pos.push_back(left_.tree_count());
        return pos;
    }

    forest_type to_forest() const& {
        return cursor(*this).to_forest();
    }

    forest_type to_forest() && {
        if (focus_.empty()) return forest_type(right_.get_allocator());
        while (ascend()) ;
        return rejoin();
    }

    cursor first_child() const { return stepped(&cursor::descend); }
    cursor last_child() const { return stepped(&cursor::descend_last); }
    cursor parent() const { return stepped(&cursor::ascend); }
    cursor next_sibling() const { return stepped(&cursor::forward); }
    cursor previous_sibling() const { return stepped(&cursor::backward); }
    cursor next_in_preorder() const { return stepped(&cursor::advance); }
    cursor previous_in_preorder() const { return stepped(&cursor::retreat); }

    bool operator==(const cursor& other) const {
        return focus_==other.focus_ && left_==other.left_ && right_==other.right_ && path_==other.path_;
    }

    bool operator!=(const cursor& other) const { return !(*this==other); }

private:
    forest_type focus_;
    forest_type left_;
    forest_type right_;
    std::vector<frame> path_;

    cursor stepped(bool (cursor::*step)()) const {
        if (focus_.empty()) return {};
        cursor c(*this);
        if (!(c.*step)()) return {};
        return c;
    }

    // Steps below modify the cursor in place and report whether the step
    // was possible.

    bool descend() {
        auto r = focus_.root_begin();
        if (!r.child()) return false;

        forest_type children = focus_.prune_children(r);
        forest_type first = children.prune_front();

        path_.push_back(frame{std::move(*r), std::move(left_), std::move(right_)});
        focus_ = std::move(first);
        left_ = forest_type(focus_.get_allocator());
        right_ = std::move(children);
        return true;
    }

    bool descend_last() {
        if (!descend()) return false;
        while (forward()) ;
        return true;
    }

    bool ascend() {
        if (path_.empty()) return false;

        frame f = std::move(path_.back());
        path_.pop_back();

        forest_type children = rejoin();
        forest_type t(children.get_allocator());
        t.graft_child(t.emplace_front(std::move(f.value)), std::move(children));

        focus_ = std::move(t);
        left_ = std::move(f.left);
        right_ = std::move(f.right);
        return true;
    }

    bool forward() {
        if (right_.empty()) return false;
        left_.graft_front(std::move(focus_));
        focus_ = right_.prune_front();
        return true;
    }

    bool backward() {
        if (left_.empty()) return false;
        right_.graft_front(std::move(focus_));
        focus_ = left_.prune_front();
        return true;
    }

    // Pre-order successor: first child, else the next sibling of the
    // nearest node on the path (including the focus) that has one. On
    // failure the cursor is left on the last root.
    bool advance() {
        if (descend()) return true;

        do {
            if (forward()) return true;
        } while (ascend());
        return false;
    }

    // Pre-order predecessor: the last visible descendant of the previous
    // sibling, else the parent.
    bool retreat() {
        if (backward()) {
            while (descend_last()) ;
            return true;
        }
        return ascend();
    }

    // Siblings at the focus level in order, with the focus among them.
    // Leaves focus, left and right empty.
    forest_type rejoin() {
        forest_type out = std::move(right_);
        out.graft_front(std::move(focus_));
        while (!left_.empty()) out.graft_front(left_.prune_front());
        return out;
    }
};

} // namespace outline
