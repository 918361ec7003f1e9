#include <doctest/doctest.h>
#include "../include/verity/verity.hpp"
    using namespace verity;
    namespace json = tao::json;

#include <cmath>
#include <limits>
#include <string>
#include <thread>
#include <vector>

    namespace
{
        auto
    passes (const value_t& value, const rule_t& rule)
    {
        return !check (value, rule).has_value ();
    }
}

TEST_CASE("check.hpp: range")
{
    SUBCASE("maximum")
    {
            auto
        v = check (value_t (150), range (0, 100));
        REQUIRE (v);
            auto
        r = v->get_if <range_violation_t> ();
        REQUIRE (r);
        CHECK (r->bound == bound_t::maximum);
        CHECK (r->limit == value_t (100));
        CHECK (r->actual == value_t (150));
        CHECK (render (*v) == "the number must be `<= 100`.");
    }
    SUBCASE("inclusive bounds")
    {
        CHECK (passes (value_t (0), range (0, 10)));
        CHECK (passes (value_t (10), range (0, 10)));
        CHECK (!passes (value_t (-1), range (0, 10)));
        CHECK (!passes (value_t (11), range (0, 10)));
    }
    SUBCASE("exclusive bounds")
    {
        CHECK (!passes (value_t (0), exclusive_minimum (0)));
        CHECK (passes (value_t (0.5), exclusive_minimum (0)));
        CHECK (!passes (value_t (10.0), exclusive_maximum (10)));
        CHECK (passes (value_t (9), exclusive_maximum (10)));
    }
    SUBCASE("mixed representations")
    {
        CHECK (passes (value_t (std::numeric_limits <std::uint64_t>::max ()), minimum (-1)));
        CHECK (!passes (value_t (-1), minimum (std::uint64_t { 0 })));
        CHECK (passes (value_t (2.5), range (2, 3)));
    }
    SUBCASE("not a number")
    {
        CHECK (passes (value_t ("150"), maximum (100)));
        CHECK (passes (value_t (json::null), maximum (100)));
    }
    SUBCASE("not finite")
    {
            auto
        v = check (value_t (std::numeric_limits <double>::infinity ()), maximum (100));
        REQUIRE (v);
        CHECK (v->get_if <not_finite_violation_t> ());
        CHECK (!passes (value_t (std::nan ("")), minimum (0)));
    }
    SUBCASE("misconfigured")
    {
        CHECK_THROWS_AS (check (value_t (1), range (10, 0)), configuration_error);
        CHECK_THROWS_AS (check (value_t (1), maximum ("ten")), configuration_error);
            rule_t
        both { range_rule_t { {}, {}, value_t (5), value_t (5) }, {} };
        CHECK_THROWS_AS (check (value_t (1), both), configuration_error);
        // Reported whatever the value.
        CHECK_THROWS_AS (check (value_t ("text"), range (10, 0)), configuration_error);
    }
} // TEST_CASE("check.hpp: range")

TEST_CASE("check.hpp: multiple_of")
{
    CHECK (passes (value_t (10), multiple_of (5)));
    CHECK (!passes (value_t (11), multiple_of (5)));
    CHECK (passes (value_t (-10), multiple_of (5)));
    CHECK (passes (value_t (std::numeric_limits <std::int64_t>::min ()), multiple_of (2)));
    CHECK (passes (value_t (0.3), multiple_of (0.1)));
    CHECK (passes (value_t (4.5), multiple_of (1.5)));
    CHECK (!passes (value_t (4.6), multiple_of (1.5)));
    CHECK (passes (value_t ("x"), multiple_of (3)));
    CHECK_THROWS_AS (check (value_t (1), multiple_of (0)), configuration_error);
    CHECK_THROWS_AS (check (value_t (1), multiple_of (-2)), configuration_error);
    CHECK_THROWS_AS (check (value_t (1), multiple_of ("2")), configuration_error);
} // TEST_CASE("check.hpp: multiple_of")

TEST_CASE("check.hpp: length")
{
    SUBCASE("graphemes")
    {
        // "e" followed by a combining acute accent is one character.
        CHECK (passes (value_t ("e\xCC\x81"), max_length (1)));
        CHECK (passes (value_t ("abc\xCC\x81"), max_length (3)));
        CHECK (!passes (value_t ("abc\xCC\x81"), max_length (2)));
        // Family emoji joined with ZWJ.
        CHECK (passes (
              value_t ("\xF0\x9F\x91\xA8\xE2\x80\x8D\xF0\x9F\x91\xA9\xE2\x80\x8D\xF0\x9F\x91\xA7")
            , length (1, 1)
        ));
    }
    SUBCASE("bounds")
    {
            auto
        v = check (value_t ("ab"), min_length (3));
        REQUIRE (v);
            auto
        l = v->get_if <length_violation_t> ();
        REQUIRE (l);
        CHECK (l->bound == bound_t::minimum);
        CHECK (l->limit == 3);
        CHECK (l->actual == 2);
        CHECK (passes (value_t (""), max_length (0)));
        CHECK (passes (value_t (42), max_length (0)));
    }
    SUBCASE("misconfigured")
    {
        CHECK_THROWS_AS (check (value_t ("abc"), length (5, 2)), configuration_error);
    }
} // TEST_CASE("check.hpp: length")

TEST_CASE("check.hpp: pattern")
{
    CHECK (passes (value_t ("2024-01-31"), pattern ("^[0-9]{4}-[0-9]{2}-[0-9]{2}$")));
    CHECK (!passes (value_t ("31/01/2024"), pattern ("^[0-9]{4}-[0-9]{2}-[0-9]{2}$")));
    // Unanchored patterns match anywhere.
    CHECK (passes (value_t ("xxabcxx"), pattern ("abc")));
    CHECK (passes (value_t (12), pattern ("abc")));
    CHECK_THROWS_AS (check (value_t ("abc"), pattern ("([a-z")), configuration_error);
    CHECK_THROWS_AS (check (value_t (1), pattern ("([a-z")), configuration_error);
} // TEST_CASE("check.hpp: pattern")

TEST_CASE("check.hpp: pattern cache")
{
        auto&
    cache = detail::pattern_cache ();
        auto
    first = cache.get ("^cache-[0-9]+$");
        auto
    size = cache.size ();
        auto
    second = cache.get ("^cache-[0-9]+$");
    CHECK (first.get () == second.get ());
    CHECK (cache.size () == size);
} // TEST_CASE("check.hpp: pattern cache")

TEST_CASE("check.hpp: concurrent validation")
{
        const std::string
    fresh = "^concurrent-[a-z]+-[0-9]{2}$";
        node_t
    node;
    node.field ("code", node_t {}.rule (pattern (fresh)))
        .field ("count", node_t {}.rule (range (0, 10)));
        const auto
    value = json::from_string (R"({"code": "concurrent-x-1", "count": 11})");
        constexpr std::size_t
    thread_count = 8;
        std::vector <const std::regex*>
    published (thread_count);
        std::vector <errors_t>
    results (thread_count);
        std::vector <std::thread>
    threads;
    for (std::size_t i = 0; i < thread_count; ++i)
    {
        threads.emplace_back ([&, i]
        {
            results[i] = validate (node, value);
            published[i] = detail::pattern_cache ().get (fresh).get ();
        });
    }
    for (auto&& t: threads) t.join ();
    // Assertions run on this thread only.
    for (std::size_t i = 0; i < thread_count; ++i)
    {
        CHECK (published[i] == published.front ());
        CHECK (results[i] == results.front ());
        CHECK (results[i].size () == 2);
    }
} // TEST_CASE("check.hpp: concurrent validation")

TEST_CASE("check.hpp: enumerate")
{
        const auto
    allowed = enumerate ({ value_t ("red"), value_t ("green"), value_t (3) });
    CHECK (passes (value_t ("red"), allowed));
    CHECK (passes (value_t (3.0), allowed));
    CHECK (!passes (value_t ("blue"), allowed));
        auto
    v = check (value_t ("blue"), allowed);
    REQUIRE (v);
    CHECK (render (*v) == R"(the value must be in ["red", "green", 3].)");
    CHECK_THROWS_AS (check (value_t ("red"), enumerate ({})), configuration_error);
} // TEST_CASE("check.hpp: enumerate")

TEST_CASE("check.hpp: items")
{
        const auto
    array = json::from_string ("[1, 2, 3]");
    CHECK (passes (array, max_items (3)));
    CHECK (!passes (array, max_items (2)));
    CHECK (!passes (array, min_items (4)));
    CHECK (passes (value_t ("abc"), max_items (1)));
} // TEST_CASE("check.hpp: items")

TEST_CASE("check.hpp: unique_items")
{
    CHECK (passes (json::from_string ("[1, 2, 3]"), unique_items ()));
    CHECK (passes (json::from_string ("[]"), unique_items ()));
        auto
    v = check (json::from_string (R"([1, "a", {"k": [1]}, 2, 1.0, {"k": [1]}])"), unique_items ());
    REQUIRE (v);
        auto
    u = v->get_if <unique_items_violation_t> ();
    REQUIRE (u);
    // 1.0 at index 4 repeats 1 before the object at 5 repeats index 2.
    CHECK (u->first == 0);
    CHECK (u->second == 4);
} // TEST_CASE("check.hpp: unique_items")

TEST_CASE("check.hpp: properties")
{
        const auto
    object = json::from_string (R"({"a": 1, "b": 2})");
    CHECK (passes (object, max_properties (2)));
    CHECK (!passes (object, max_properties (1)));
    CHECK (!passes (object, min_properties (3)));
} // TEST_CASE("check.hpp: properties")

TEST_CASE("check.hpp: type")
{
    CHECK (passes (value_t (1), type (type_t::integer)));
    CHECK (passes (value_t (1), type (type_t::number)));
    CHECK (passes (value_t (1.0), type (type_t::integer)));
    CHECK (!passes (value_t (1.5), type (type_t::integer)));
    CHECK (passes (value_t (json::null), type ({ type_t::string, type_t::null })));
        auto
    v = check (value_t (true), type ({ type_t::string, type_t::null }));
    REQUIRE (v);
    CHECK (render (*v) == "the value must be of type string, null, got boolean.");
        rule_t
    none { type_rule_t {}, {} };
    CHECK_THROWS_AS (check (value_t (1), none), configuration_error);
} // TEST_CASE("check.hpp: type")

TEST_CASE("check.hpp: custom")
{
        const auto
    even = custom ("even", [](const value_t& v) -> std::optional <custom_violation_t>
    {
        if (!v.is_integer () || v.as <std::int64_t> () % 2 == 0) return std::nullopt;
        return custom_violation_t { "", "{actual} is odd.", { { "actual", v } } };
    });
    CHECK (passes (value_t (4), even));
        auto
    v = check (value_t (5), even);
    REQUIRE (v);
    CHECK (context (*v).id == "even");
    CHECK (render (*v) == "5 is odd.");
    CHECK_THROWS_AS (check (value_t (5), custom ("missing", nullptr)), configuration_error);
    SUBCASE("empty message renders the id")
    {
            const auto
        odd = custom ("odd", [](const value_t&) -> std::optional <custom_violation_t>
        {
            return custom_violation_t { "", "", {} };
        });
            auto
        w = check (value_t (1), odd);
        REQUIRE (w);
        CHECK (render (*w) == "odd");
    }
} // TEST_CASE("check.hpp: custom")

TEST_CASE("check.hpp: with_message")
{
        auto
    v = check (value_t (150), with_message (maximum (100), "at most {maximum}, not {actual}"));
    REQUIRE (v);
    CHECK (render (*v) == "at most 100, not 150");
} // TEST_CASE("check.hpp: with_message")
