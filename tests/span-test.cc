#include <ring-core/span.hh>

#include <nexus/test.hh>

#include <array>
#include <vector>

static_assert(std::is_trivially_copyable_v<rc::span<int>>, "span should be trivially copyable");
static_assert(std::is_convertible_v<rc::span<int>, rc::span<int const>>);
static_assert(!std::is_convertible_v<rc::span<int const>, rc::span<int>>);

namespace
{
int sum(rc::span<int const> values)
{
    int s = 0;
    for (auto v : values)
        s += v;
    return s;
}
} // namespace

TEST("span - construction")
{
    SECTION("default construction")
    {
        auto const s = rc::span<int>{};
        CHECK(s.data() == nullptr);
        CHECK(s.size() == 0);
        CHECK(s.empty());
    }

    SECTION("pointer + size construction")
    {
        int data[] = {1, 2, 3, 4, 5};
        auto const s = rc::span<int>{data, 5};
        CHECK(s.data() == data);
        CHECK(s.size() == 5);
        CHECK(!s.empty());
    }

    SECTION("two pointer construction")
    {
        int data[] = {1, 2, 3, 4, 5};
        auto const s = rc::span<int>{data + 1, data + 4};
        CHECK(s.data() == data + 1);
        CHECK(s.size() == 3);
    }

    SECTION("C array and containers")
    {
        int data[] = {1, 2, 3};
        auto const a = rc::span<int>(data);
        CHECK(a.size() == 3);

        std::vector<int> v = {4, 5};
        auto const b = rc::span<int>(v);
        CHECK(b.data() == v.data());
        CHECK(b.size() == 2);

        std::array<int, 4> arr = {1, 1, 1, 1};
        auto const c = rc::span<int const>(arr);
        CHECK(c.size() == 4);
    }
}

TEST("span - element access and iteration")
{
    int data[] = {10, 20, 30};
    auto const s = rc::span<int>(data);

    CHECK(s[0] == 10);
    CHECK(s[2] == 30);

    s[1] = 25;
    CHECK(data[1] == 25);

    int count = 0;
    for (auto& v : s)
    {
        v += 1;
        ++count;
    }
    CHECK(count == 3);
    CHECK(data[0] == 11);
    CHECK(s.end() - s.begin() == 3);
}

TEST("span - function arguments")
{
    std::vector<int> v = {1, 2, 3};
    CHECK(sum(rc::span<int const>(v)) == 6);

    auto const mutable_view = rc::span<int>(v);
    CHECK(sum(mutable_view) == 6);

    CHECK(sum({4, 5, 6}) == 15);
    CHECK(sum({}) == 0);
}
