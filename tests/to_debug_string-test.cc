#include <outcome-core/to_debug_string.hh>

#include <nexus/test.hh>

#include "test-errors.hh"

#include <array>
#include <list>
#include <optional>
#include <string>
#include <tuple>
#include <variant>
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

// Tag-like error without any state
struct EmptyError
{
};

// =========================================================================================================
// Scalars
// =========================================================================================================

TEST("to_debug_string - scalars")
{
    CHECK(oc::to_debug_string(42) == "42");
    CHECK(oc::to_debug_string(-7) == "-7");
    CHECK(oc::to_debug_string(true) == "true");
    CHECK(oc::to_debug_string(false) == "false");
    CHECK(oc::to_debug_string('a') == "'a'");
    CHECK(oc::to_debug_string('\n') == "'\\n'");
    CHECK(oc::to_debug_string(char(1)) == "'\\x01'");
    CHECK(oc::to_debug_string(char(127)) == "'\\x7F'");
    CHECK(oc::to_debug_string(char(0xE9)) == "'\\xE9'"); // never a raw non-ASCII byte
    CHECK(oc::to_debug_string(char(0x80)) == "'\\x80'");
}

TEST("to_debug_string - strings are quoted")
{
    CHECK(oc::to_debug_string(std::string("hello")) == "\"hello\"");
    CHECK(oc::to_debug_string(std::string()) == "\"\"");
    CHECK(oc::to_debug_string("literal") == "\"literal\"");
}

// =========================================================================================================
// ADL and member dispatch priority tests
// =========================================================================================================

TEST("to_debug_string - ADL to_string takes precedence over iteration")
{
    HasAdlAndIterable obj;
    CHECK(oc::to_debug_string(obj) == "ADL_to_string");
}

TEST("to_debug_string - member to_string() is second priority over iteration")
{
    HasMemberAndIterable obj;
    CHECK(oc::to_debug_string(obj) == "member_to_string");
}

TEST("to_debug_string - error types")
{
    SECTION("hidden friend to_string")
    {
        CHECK(oc::to_debug_string(test::failure1{"boom"}) == "failure1(boom)");
    }

    SECTION("member to_string")
    {
        CHECK(oc::to_debug_string(test::unspecified_failure{"late"}) == "unspecified_failure(late)");
    }

#ifdef OC_HAS_RTTI
    SECTION("stateless errors render as their type name")
    {
        CHECK(oc::to_debug_string(EmptyError{}) == "EmptyError");
        CHECK(oc::to_debug_string(test::unauthorized{}) == "test::unauthorized");
    }
#endif
}

// =========================================================================================================
// Variants and optionals
// =========================================================================================================

TEST("to_debug_string - variant renders the active alternative")
{
    using error_variant = std::variant<test::failure1, int>;

    CHECK(oc::to_debug_string(error_variant(test::failure1{"x"})) == "failure1(x)");
    CHECK(oc::to_debug_string(error_variant(std::in_place_index<1>, 5)) == "5");
}

TEST("to_debug_string - optional")
{
    CHECK(oc::to_debug_string(std::optional<int>(3)) == "3");
    CHECK(oc::to_debug_string(std::optional<int>()) == "nullopt");
}

// =========================================================================================================
// Collections
// =========================================================================================================

TEST("to_debug_string - containers")
{
    SECTION("empty")
    {
        CHECK(oc::to_debug_string(std::vector<int>{}) == "[]");
    }

    SECTION("std::vector")
    {
        std::vector<int> multi = {1, 2, 3};
        CHECK(oc::to_debug_string(multi) == "[1, 2, 3]");
    }

    SECTION("std::list")
    {
        std::list<int> lst = {10, 20, 30};
        CHECK(oc::to_debug_string(lst) == "[10, 20, 30]");
    }

    SECTION("std::array")
    {
        std::array<int, 3> arr = {5, 10, 15};
        CHECK(oc::to_debug_string(arr) == "[5, 10, 15]");
    }

    SECTION("strings")
    {
        std::vector<std::string> strings = {"hello", "world"};
        CHECK(oc::to_debug_string(strings) == "[\"hello\", \"world\"]");
    }

    SECTION("nested")
    {
        std::vector<std::vector<int>> nested = {{}, {1, 2}, {3}};
        CHECK(oc::to_debug_string(nested) == "[[], [1, 2], [3]]");
    }

    SECTION("error variants")
    {
        using error_variant = std::variant<test::failure1, test::unspecified_failure>;
        std::vector<error_variant> errs = {test::failure1{"a"}, test::unspecified_failure{"b"}};
        CHECK(oc::to_debug_string(errs) == "[failure1(a), unspecified_failure(b)]");
    }
}

TEST("to_debug_string - tuples")
{
    std::pair<int, int> p{10, 20};
    CHECK(oc::to_debug_string(p) == "(10, 20)");

    std::tuple<> empty;
    CHECK(oc::to_debug_string(empty) == "()");

    std::tuple<int, std::string, std::vector<int>> mixed{42, "hello", {1, 2, 3}};
    CHECK(oc::to_debug_string(mixed) == "(42, \"hello\", [1, 2, 3])");
}

// =========================================================================================================
// max_length truncation tests
// =========================================================================================================

TEST("to_debug_string - large iterable truncates with ellipsis")
{
    std::vector<int> large;
    for (int i = 0; i < 1000; ++i)
        large.push_back(i);

    oc::debug_string_config cfg{100};
    auto result = oc::to_debug_string(large, cfg);

    CHECK(result.ends_with(", ...]"));
    CHECK(result.size() < 200); // soft limit, some overshoot is fine
}

TEST("to_debug_string - large tuple truncates")
{
    auto large = std::make_tuple(1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15, 16, 17, 18, 19, 20, 21, 22, 23, 24,
                                 25, 26, 27, 28, 29, 30);

    oc::debug_string_config cfg{50};
    auto result = oc::to_debug_string(large, cfg);

    CHECK(result.ends_with(", ...)"));
    CHECK(result.size() < 100);
}

TEST("to_debug_string - unbounded config lists everything")
{
    std::vector<int> large(500, 7);

    oc::debug_string_config cfg{1 << 20};
    auto result = oc::to_debug_string(large, cfg);

    CHECK(result.find("...") == std::string::npos);
    CHECK(result.ends_with("7]"));
}
