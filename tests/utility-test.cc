#include <ring-core/utility.hh>

#include <nexus/test.hh>

#include <string>

namespace
{
struct Box
{
    int v;
    bool operator<(Box const& rhs) const { return v < rhs.v; }
};
} // namespace

// Type with ADL swap for testing ADL-awareness
namespace test_ns
{
struct AdlSwappable
{
    int value;
    inline static int adl_swap_count = 0;
};

void swap(AdlSwappable& a, AdlSwappable& b) noexcept
{
    ++AdlSwappable::adl_swap_count;
    int const tmp = a.value;
    a.value = b.value;
    b.value = tmp;
}
} // namespace test_ns

TEST("utility - exchange replaces value and returns old")
{
    int* p = new int(3);
    int* old = rc::exchange(p, nullptr);
    CHECK(p == nullptr);
    CHECK(*old == 3);
    delete old;

    std::string s = "abc";
    auto const prev = rc::exchange(s, "xyz");
    CHECK(prev == "abc");
    CHECK(s == "xyz");
}

TEST("utility - max/min return references and handle equality")
{
    auto const a = Box{1};
    auto const b = Box{2};
    CHECK(&rc::max(a, b) == &b);
    CHECK(&rc::min(a, b) == &a);

    auto const c = Box{1};
    CHECK(&rc::max(a, c) == &c); // equal: max returns b
    CHECK(&rc::min(a, c) == &a); // equal: min returns a

    CHECK(rc::max<rc::isize>(3, 7) == 7);
    CHECK(rc::min<rc::isize>(3, 7) == 3);
}

TEST("utility - wrapped_increment wraps correctly")
{
    SECTION("max=1 wraps immediately")
    {
        CHECK(rc::wrapped_increment(0, 1) == 0);
    }

    SECTION("max=3 ring behavior")
    {
        CHECK(rc::wrapped_increment(0, 3) == 1);
        CHECK(rc::wrapped_increment(1, 3) == 2);
        CHECK(rc::wrapped_increment(2, 3) == 0);
    }

    SECTION("signed size type")
    {
        CHECK(rc::wrapped_increment<rc::isize>(15, 16) == 0);
    }
}

TEST("utility - wrapped_decrement wraps correctly")
{
    CHECK(rc::wrapped_decrement(0, 1) == 0);
    CHECK(rc::wrapped_decrement(2, 3) == 1);
    CHECK(rc::wrapped_decrement(1, 3) == 0);
    CHECK(rc::wrapped_decrement(0, 3) == 2);

    for (int i = 0; i < 10; ++i)
    {
        int result = rc::wrapped_decrement(i, 10);
        CHECK(result >= 0);
        CHECK(result < 10);
    }
}

TEST("utility - wrapped_add maps logical to physical index")
{
    CHECK(rc::wrapped_add(2, 1, 4) == 3);
    CHECK(rc::wrapped_add(2, 2, 4) == 0);
    CHECK(rc::wrapped_add(2, 3, 4) == 1);
    CHECK(rc::wrapped_add(0, 0, 4) == 0);
    CHECK(rc::wrapped_add(3, 4, 4) == 3); // full turn

    SECTION("agrees with modulo")
    {
        for (int pos = 0; pos < 7; ++pos)
            for (int n = 0; n <= 7; ++n)
                CHECK(rc::wrapped_add(pos, n, 7) == (pos + n) % 7);
    }
}

TEST("utility - swap respects custom ADL swap")
{
    test_ns::AdlSwappable::adl_swap_count = 0;
    test_ns::AdlSwappable a{1};
    test_ns::AdlSwappable b{2};

    rc::swap(a, b);
    CHECK(a.value == 2);
    CHECK(b.value == 1);
    CHECK(test_ns::AdlSwappable::adl_swap_count == 1);
}

TEST("utility - swap by move")
{
    std::string a = "left";
    std::string b = "right";
    rc::swap(a, b);
    CHECK(a == "right");
    CHECK(b == "left");

    int x = 1;
    int y = 2;
    rc::swap(x, y);
    CHECK(x == 2);
    CHECK(y == 1);
}

TEST("utility - is_power_of_two truth table")
{
    CHECK(rc::is_power_of_two(1));
    CHECK(rc::is_power_of_two(2));
    CHECK(!rc::is_power_of_two(3));
    CHECK(rc::is_power_of_two(64));
    CHECK(!rc::is_power_of_two(96));
    CHECK(rc::is_power_of_two(rc::isize(1) << 40));
}

TEST("utility - sentinel as end-of-range marker")
{
    struct counting_iterator
    {
        int count;
        int max;

        int operator*() const { return count; }
        counting_iterator& operator++()
        {
            ++count;
            return *this;
        }
        bool operator!=(rc::sentinel) const { return count < max; }
    };

    struct counting_range
    {
        int max;
        counting_iterator begin() const { return {0, max}; }
        rc::sentinel end() const { return {}; }
    };

    int sum = 0;
    for (int val : counting_range{5})
        sum += val;
    CHECK(sum == 0 + 1 + 2 + 3 + 4);
}
