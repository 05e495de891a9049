#include <ring-core/ring_deque.hh>
#include <ring-core/to_debug_string.hh>

#include <nexus/test.hh>

#include <cstdint>
#include <list>
#include <string>
#include <tuple>
#include <vector>

// =========================================================================================================
// Helper types for testing dispatch priorities
// =========================================================================================================

// Type with both ADL to_string AND iterability
struct HasAdlAndIterable
{
    std::vector<int> data = {10, 20, 30};

    auto begin() const { return data.begin(); }
    auto end() const { return data.end(); }
};

std::string to_string(HasAdlAndIterable const&)
{
    return "ADL_to_string";
}

// Type with member to_string() AND iterability
struct HasMemberAndIterable
{
    std::vector<int> data = {40, 50};

    std::string to_string() const { return "member_to_string"; }
    auto begin() const { return data.begin(); }
    auto end() const { return data.end(); }
};

// Opaque struct for memory dump fallback
struct OpaqueType
{
    uint32_t a;
    uint16_t b;
    uint8_t c;
};

TEST("to_debug_string - dispatch priorities")
{
    CHECK(rc::to_debug_string(HasAdlAndIterable{}) == "ADL_to_string");
    CHECK(rc::to_debug_string(HasMemberAndIterable{}) == "member_to_string");
}

TEST("to_debug_string - primitives")
{
    CHECK(rc::to_debug_string(42) == "42");
    CHECK(rc::to_debug_string(-7) == "-7");
    CHECK(rc::to_debug_string(true) == "true");
    CHECK(rc::to_debug_string(2.5) == "2.5");
    CHECK(rc::to_debug_string(rc::isize(1) << 40) == "1099511627776");
    CHECK(rc::to_debug_string(rc::byte(0xAB)) == "0xAB");
}

TEST("to_debug_string - strings and chars")
{
    CHECK(rc::to_debug_string(std::string("hi")) == "\"hi\"");
    CHECK(rc::to_debug_string("lit") == "\"lit\"");
    CHECK(rc::to_debug_string(std::string()) == "\"\"");

    CHECK(rc::to_debug_string('a') == "'a'");
    CHECK(rc::to_debug_string('\n') == "'\\n'");
    CHECK(rc::to_debug_string('\0') == "'\\0'");
    CHECK(rc::to_debug_string('\x01') == "'\\x01'");
}

TEST("to_debug_string - collections")
{
    CHECK(rc::to_debug_string(std::vector<int>{}) == "[]");
    CHECK(rc::to_debug_string(std::vector<int>{1, 2, 3}) == "[1, 2, 3]");
    CHECK(rc::to_debug_string(std::list<std::string>{"a", "b"}) == "[\"a\", \"b\"]");
    CHECK(rc::to_debug_string(std::vector<std::vector<int>>{{1}, {}, {2, 3}}) == "[[1], [], [2, 3]]");
    CHECK(rc::to_debug_string(std::list<char>{'x', 'y'}) == "['x', 'y']");
}

TEST("to_debug_string - tuples")
{
    CHECK(rc::to_debug_string(std::tuple<>{}) == "()");
    CHECK(rc::to_debug_string(std::pair<int, std::string>{1, "one"}) == "(1, \"one\")");
    CHECK(rc::to_debug_string(std::tuple<int, char, bool>{3, 'c', false}) == "(3, 'c', false)");
}

TEST("to_debug_string - ring_deque renders through its to_string member")
{
    auto d = rc::ring_deque<char>::create_of('a', 'b');
    CHECK(rc::to_debug_string(d) == "ring_deque{ size: 2, capacity: 2, items: ['a', 'b']}");

    std::vector<rc::ring_deque<int>> nested;
    nested.push_back(rc::ring_deque<int>::create_of(1, 2));
    CHECK(rc::to_debug_string(nested) == "[ring_deque{ size: 2, capacity: 2, items: [1, 2]}]");
}

TEST("to_debug_string - opaque struct produces hex dump")
{
    OpaqueType obj{0x12345678, 0xABCD, 0xEF};
    auto result = rc::to_debug_string(obj);

    CHECK(result.starts_with("0x"));
    CHECK(result.find('_') != std::string::npos); // alignment separators
    for (size_t i = 2; i < result.size(); ++i)
    {
        char c = result[i];
        CHECK((c == '_' || (c >= '0' && c <= '9') || (c >= 'A' && c <= 'F')));
    }
}

TEST("to_debug_string - large collections truncate")
{
    std::vector<int> large;
    for (int i = 0; i < 1000; ++i)
        large.push_back(i);

    auto result = rc::to_debug_string(large, rc::debug_string_config{100});
    CHECK(result.ends_with(", ...]"));
    CHECK(result.size() < 200);

    auto short_result = rc::to_debug_string(large, rc::debug_string_config{20});
    CHECK(short_result.size() < result.size());
}
