#include <algorithm>
#include <cstddef>
#include <memory>
#include <type_traits>
#include <vector>

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include "outline/io.h"
#include "outline/ordered_forest.h"
#include "common.h"
#include "simple_allocator.h"

using outline::ordered_forest;

TEST_CASE("empty") {
    ordered_forest<int> f1;
    CHECK(f1.size() == 0);
    CHECK(f1.tree_count() == 0);
    CHECK(f1.begin() == f1.end());

    simple_allocator<int> alloc;
    REQUIRE(alloc.n_alloc() == 0u);
    REQUIRE(alloc.n_dealloc() == 0u);

    ordered_forest<int, simple_allocator<int>> f2(alloc);
    CHECK(alloc.n_alloc() == 0u);
    CHECK(alloc.n_dealloc() == 0u);

    CHECK_THROWS_AS(f1.prune_front(), outline::invalid_operation);
    CHECK_THROWS_AS(f1.front(), outline::invalid_operation);
}

TEST_CASE("push") {
    simple_allocator<int> alloc;
    REQUIRE(alloc.n_alloc() == 0u);
    REQUIRE(alloc.n_dealloc() == 0u);

    {
        ordered_forest<int, simple_allocator<int>> f(alloc);

        f.push_front(3);
        auto i2 = f.push_front(2);
        f.push_child(i2, 5);
        f.push_child(i2, 4);
        f.push_front(1);

        REQUIRE(f.size() == 5);
        CHECK(f.tree_count() == 3);
        CHECK(alloc.n_alloc() == 10); // five nodes, five items.

        auto i = f.begin();
        REQUIRE((bool)i);
        CHECK(*i == 1);
        CHECK(!(bool)i.child());

        i = i.next();
        REQUIRE((bool)i);
        auto j = i.child();
        REQUIRE((bool)j);
        CHECK(*j == 4);
        j = j.next();
        REQUIRE((bool)j);
        CHECK(*j == 5);
        CHECK(!(bool)j.next());
        CHECK(j.parent() == i);

        i = i.next();
        REQUIRE((bool)i);
        CHECK(*i == 3);
        CHECK(!(bool)i.child());
        CHECK(!(bool)i.next());
    }

    CHECK(alloc.n_alloc() == alloc.n_dealloc());
}

TEST_CASE("insert") {
    simple_allocator<int> alloc;

    {
        ordered_forest<int, simple_allocator<int>> f(alloc);

        auto r = f.push_front(1);
        f.insert_after(r, 3);
        r = f.insert_after(r, 2);
        auto c = f.push_child(r, 4);
        f.insert_after(c, 6);
        f.insert_after(c, 5);

        REQUIRE(f.size() == 6);
        CHECK(alloc.n_alloc() == 12); // six nodes, six items.
        CHECK(f == ordered_forest<int, simple_allocator<int>>({1, {2, {4, 5, 6}}, 3}, alloc));

        CHECK_THROWS_AS(f.insert_after(ordered_forest<int, simple_allocator<int>>::iterator{}, 7), outline::invalid_operation);
    }

    CHECK(alloc.n_alloc() == alloc.n_dealloc());
}

TEST_CASE("initializer_list") {
    ordered_forest<int> f = {1, {2, {4, 5, 6}}, 3};
    CHECK(f.size() == 6);
    CHECK(f.tree_count() == 3);

    auto i = f.begin();
    REQUIRE((bool)i);
    CHECK(*i == 1);
    CHECK(!(bool)i.child());

    i = i.next();
    REQUIRE((bool)i);
    auto j = i.child();
    REQUIRE((bool)j);
    CHECK(*j == 4);
    j = j.next();
    REQUIRE((bool)j);
    CHECK(*j == 5);
    j = j.next();
    REQUIRE((bool)j);
    CHECK(*j == 6);
    CHECK(!(bool)j.next());

    i = i.next();
    REQUIRE((bool)i);
    CHECK(*i == 3);
    CHECK(!(bool)i.child());
    CHECK(!(bool)i.next());
}

TEST_CASE("iteration") {
    using ivector = std::vector<int>;

    ordered_forest<int> f = {{1, {2, 3}}, {4, {5, {6, {7}}, 8}}, 9};

    ivector pre{f.preorder_begin(), f.preorder_end()};
    CHECK(pre == ivector{1, 2, 3, 4, 5, 6, 7, 8, 9});

    ivector pre_default{f.begin(), f.end()};
    CHECK(pre_default == ivector{1, 2, 3, 4, 5, 6, 7, 8, 9});

    ivector pre_cdefault{f.cbegin(), f.cend()};
    CHECK(pre_cdefault == ivector{1, 2, 3, 4, 5, 6, 7, 8, 9});

    ivector root{f.root_begin(), f.root_end()};
    CHECK(root == ivector{1, 4, 9});

    auto four = std::find(f.begin(), f.end(), 4);
    ivector child_four{f.child_begin(four), f.child_end(four)};
    CHECK(child_four == ivector{5, 6, 8});

    using preorder_iterator = ordered_forest<int>::preorder_iterator;

    ivector pre_four{preorder_iterator(four), preorder_iterator(four.next())};
    CHECK(pre_four == ivector{4, 5, 6, 7, 8});
}

TEST_CASE("equality") {
    using of = ordered_forest<int>;

    of f = {{1, {2, 3}}, {4, {5}}};
    CHECK(f == of{{1, {2, 3}}, {4, {5}}});

    // Same pre-order sequence, different shape.
    CHECK(f != of{{1, {{2, {3}}}}, {4, {5}}});
    CHECK(f != of{{1, {2, 3}}, 4, 5});
    CHECK(f != of{{1, {2, 3}}, {4, {6}}});
    CHECK(f != of{});
    CHECK(of{} == of{});
}

TEST_CASE("prune") {
    using of = ordered_forest<int>;
    simple_allocator<int> alloc;

    {
        ordered_forest<int, simple_allocator<int>> f({{1, {2, 3}}, {4, {5, {6, {7}}, 8}}, 9}, alloc);

        auto six = std::find(f.begin(), f.end(), 6);
        auto cut = f.prune(six);
        CHECK(ivector_of(cut) == std::vector<int>{6, 7});
        CHECK(cut.tree_count() == 1);
        CHECK(ivector_of(f) == std::vector<int>{1, 2, 3, 4, 5, 8, 9});

        auto one = f.root_begin();
        auto children = f.prune_children(one);
        CHECK(ivector_of(children) == std::vector<int>{2, 3});
        CHECK(children.tree_count() == 2);
        CHECK(!(bool)one.child());

        auto front = f.prune_front();
        CHECK(ivector_of(front) == std::vector<int>{1});
        CHECK(f.tree_count() == 2);

        auto nine = std::find(f.begin(), f.end(), 9);
        f.prune(nine);
        CHECK(ivector_of(f) == std::vector<int>{4, 5, 8});
        CHECK(!(bool)f.root_begin().next());

        CHECK_THROWS_AS(f.prune(ordered_forest<int, simple_allocator<int>>::iterator{}), outline::invalid_operation);
    }
    CHECK(alloc.n_alloc() == alloc.n_dealloc());

    of g = {1, 2};
    auto two = g.root_begin().next();
    g.prune(two);
    CHECK(g == of{1});
}

TEST_CASE("graft") {
    using of = ordered_forest<int>;

    of f = {{1, {2}}, 3};
    auto one = f.root_begin();

    f.graft_child(one, of{{10, {11}}, 12});
    CHECK(f == of{{1, {{10, {11}}, 12, 2}}, 3});

    auto two = std::find(f.begin(), f.end(), 2);
    auto last = f.graft_after(two, of{20, 21});
    CHECK(*last == 21);
    CHECK(f == of{{1, {{10, {11}}, 12, 2, 20, 21}}, 3});

    auto front = f.graft_front(of{0});
    CHECK(*front == 0);
    CHECK(f == of{0, {1, {{10, {11}}, 12, 2, 20, 21}}, 3});

    // Grafting an empty forest is a no-op returning the given iterator.
    CHECK(f.graft_after(two, of{}) == two);
    CHECK(f.size() == 9);
}

TEST_CASE("copy/move") {
    simple_allocator<int> alloc;
    REQUIRE(alloc.n_alloc() == 0u);
    REQUIRE(alloc.n_dealloc() == 0u);

    using ivector = std::vector<int>;
    using of = ordered_forest<int, simple_allocator<int>>;

    of f1(alloc);
    {
        of f({{1, {2, 3}}, {4, {5, {6, {7}}, 8}}, 9}, alloc);
        CHECK(alloc.n_alloc() == 18u);

        f1 = f;
        CHECK(alloc.n_alloc() == 36u);
        CHECK(!f.empty());
        CHECK(f1 == f);

        of f2 = std::move(f);
        CHECK(alloc.n_alloc() == 36u);
        CHECK(f.empty());

        ivector elems2{f2.begin(), f2.end()};
        CHECK(elems2 == ivector{1, 2, 3, 4, 5, 6, 7, 8, 9});
    }

    CHECK(alloc.n_alloc() == 36u);
    CHECK(alloc.n_dealloc() == 18u);

    ivector elems1{f1.begin(), f1.end()};
    CHECK(elems1 == ivector{1, 2, 3, 4, 5, 6, 7, 8, 9});

    // With a different != allocator object, require move assignment
    // to perform copy.

    simple_allocator<int> other_alloc;
    REQUIRE(alloc!=other_alloc);
    REQUIRE(std::allocator_traits<simple_allocator<int>>::propagate_on_container_move_assignment::value==false);

    of f3(other_alloc);

    f3 = std::move(f1);
    CHECK(!f1.empty());

    CHECK(alloc.n_alloc() == 36u);
    CHECK(alloc.n_dealloc() == 18u);
    CHECK(other_alloc.n_alloc() == 18u);
    CHECK(other_alloc.n_dealloc() == 0u);
}
