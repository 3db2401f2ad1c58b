#include <iostream>

#include "outline/outline.h"

int main() {
    using of = outline::ordered_forest<int>;
    using outline::cursor;

    of f{{0, {{-1, {-10, -20}}, {1, {10, 20}}}}, {100, {{-100, {-110, -120}}, {101, {110, 120}}}}};
    std::cout << f << '\n';

    auto key = [](int v) { return v; };

    // Walk 110 upward until it reaches the first row.
    auto c = outline::find_cursor_in_forest([](int v) { return v==110; }, f);
    while (c) {
        std::cout << outline::go_up(c) << '\n' << c << '\n';
        c = outline::move_up(key, c);
    }

    auto d = outline::find_cursor_in_forest([](int v) { return v==-1; }, f);
    d = outline::move_to_last_child_of(101, key, d);
    std::cout << d;
    for (auto a: outline::ancestors_of(d)) std::cout << a << ' ';
    std::cout << '\n';
}
