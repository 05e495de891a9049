#include <ring-core/optional.hh>

#include <nexus/test.hh>

#include <memory>
#include <string>

// optional stays trivial
static_assert(std::is_constructible_v<rc::optional<int>>);
static_assert(std::is_constructible_v<rc::optional<int>, int>);
static_assert(std::is_constructible_v<rc::optional<int>, rc::nullopt_t>);
static_assert(std::is_trivially_copyable_v<rc::optional<int>>);
static_assert(std::is_trivially_destructible_v<rc::optional<int>>);

// optional<int> == true does not compile
static_assert(!requires(rc::optional<int> o) { o == true; });

namespace
{
struct non_trivial
{
    int value = 0;
    bool* destroyed = nullptr;

    explicit non_trivial(int v) : value(v) {}
    non_trivial(int v, bool* d) : value(v), destroyed(d) {}

    ~non_trivial()
    {
        if (destroyed)
            *destroyed = true;
    }

    non_trivial(non_trivial const&) = default;
    non_trivial(non_trivial&&) = default;
    non_trivial& operator=(non_trivial const&) = default;
    non_trivial& operator=(non_trivial&&) = default;

    friend bool operator==(non_trivial const& a, non_trivial const& b) { return a.value == b.value; }
};
} // namespace

TEST("optional - trivial types")
{
    rc::optional<int> empty;
    CHECK(!empty.has_value());

    rc::optional<int> none = rc::nullopt;
    CHECK(!none.has_value());

    rc::optional<int> five = 5;
    REQUIRE(five.has_value());
    CHECK(five.value() == 5);

    auto copy = five;
    CHECK(copy.value() == 5);

    five.value() = 7;
    CHECK(five.value() == 7);
    CHECK(copy.value() == 5);
}

TEST("optional - non-trivial types")
{
    SECTION("destroys the held value")
    {
        bool destroyed = false;
        {
            rc::optional<non_trivial> o(non_trivial(1, nullptr));
            o.value().destroyed = &destroyed;
        }
        CHECK(destroyed);
    }

    SECTION("copying an lvalue optional copies the value")
    {
        rc::optional<std::string> a = std::string("hello");
        rc::optional<std::string> b = a;
        REQUIRE(b.has_value());
        CHECK(b.value() == "hello");
        CHECK(a.value() == "hello");
    }

    SECTION("move empties the source")
    {
        rc::optional<std::string> a = std::string("hello");
        auto b = rc::move(a);
        CHECK(!a.has_value());
        CHECK(b.value() == "hello");
    }

    SECTION("assignment scenarios")
    {
        rc::optional<std::string> a;
        rc::optional<std::string> b = std::string("x");

        a = b;
        CHECK(a.value() == "x");

        b = rc::optional<std::string>();
        CHECK(!b.has_value());

        a = rc::move(b);
        CHECK(!a.has_value());
    }
}

TEST("optional - move-only types")
{
    rc::optional<std::unique_ptr<int>> o = std::make_unique<int>(4);
    REQUIRE(o.has_value());

    auto p = rc::move(o).value();
    REQUIRE(p != nullptr);
    CHECK(*p == 4);
}

TEST("optional - equality operator")
{
    rc::optional<int> empty;
    rc::optional<int> one = 1;
    rc::optional<int> other_one = 1;
    rc::optional<int> two = 2;

    CHECK(empty == rc::optional<int>());
    CHECK(one == other_one);
    CHECK(one != two);
    CHECK(one != empty);

    CHECK(one == 1);
    CHECK(one != 2);
    CHECK(empty != 0);

    rc::optional<non_trivial> a = non_trivial(3);
    CHECK(a == non_trivial(3));
}
