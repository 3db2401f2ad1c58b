#pragma once

#include <algorithm>
#include <vector>

#include "outline/cursor.h"
#include "outline/locate.h"
#include "outline/ordered_forest.h"

// Pre-order values of a forest.
template <typename V, typename A>
std::vector<V> ivector_of(const outline::ordered_forest<V, A>& f) {
    return std::vector<V>(f.begin(), f.end());
}

// Values of a forest in ascending order, for comparing contents
// irrespective of shape.
template <typename V, typename A>
std::vector<V> sorted_values(const outline::ordered_forest<V, A>& f) {
    auto v = ivector_of(f);
    std::sort(v.begin(), v.end());
    return v;
}

// Two trees, three levels each:
//
//     0              100
//       -1             -100
//         -10            -110
//         -20            -120
//       1              101
//         10             110
//         20             120

inline outline::ordered_forest<int> example_forest() {
    return {
        {0, {{-1, {-10, -20}}, {1, {10, 20}}}},
        {100, {{-100, {-110, -120}}, {101, {110, 120}}}}
    };
}

inline int identity_key(int v) { return v; }

template <typename V, typename A>
outline::cursor<V, A> cursor_on(const V& value, const outline::ordered_forest<V, A>& f) {
    return outline::find_cursor_in_forest([&](const V& v) { return v==value; }, f);
}
