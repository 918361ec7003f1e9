#include <doctest/doctest.h>
#include "../include/verity/verity.hpp"
    using namespace verity;

#include <tuple>

    namespace
{
        auto
    required (const char* name)
        -> violation_t
    {
        return violation_t { required_violation_t { name } };
    }

    // a: required at /x, b: type at /list/1, c: required at the root.
        auto
    sample ()
        -> std::tuple <errors_t, errors_t, errors_t>
    {
            errors_t
        a;
        a.field ("x").push (required ("y"));
            errors_t
        b;
        b.field ("list").item (1).push (violation_t { type_violation_t { { type_t::string }, type_t::integer } });
            errors_t
        c;
        c.push (required ("z"));
        c.field ("x").push (required ("w"));
        return { a, b, c };
    }
}

TEST_CASE("errors.hpp: tree")
{
        errors_t
    errors;
    CHECK (errors.empty ());
    CHECK (errors.size () == 0);
    errors.item (3).push (required ("a"));
    errors.item (1).push (required ("b"));
    errors.field ("name").push (required ("c"));
    CHECK (!errors.empty ());
    CHECK (errors.size () == 3);
    REQUIRE (errors.items ().size () == 2);
    CHECK (errors.items ()[0].first == 1);
    CHECK (errors.items ()[1].first == 3);
    CHECK (errors.find_field ("name"));
    CHECK (!errors.find_field ("other"));
    CHECK (errors.find_item (3));
    CHECK (!errors.find_item (2));
} // TEST_CASE("errors.hpp: tree")

TEST_CASE("errors.hpp: merge")
{
    auto [a, b, c] = sample ();

    SUBCASE("empty children are not created")
    {
            errors_t
        errors;
        errors.merge_field ("x", errors_t {});
        errors.merge_item (0, errors_t {});
        CHECK (errors.fields ().empty ());
        CHECK (errors.items ().empty ());
        CHECK (errors.empty ());
    }
    SUBCASE("commutative")
    {
            auto
        ab = a;
        ab.merge (b);
            auto
        ba = b;
        ba.merge (a);
        CHECK (ab == ba);
        CHECK (ab.size () == 2);
    }
    SUBCASE("associative")
    {
            auto
        left = a;
        left.merge (b);
        left.merge (c);
            auto
        bc = b;
        bc.merge (c);
            auto
        right = a;
        right.merge (bc);
        CHECK (left == right);
        CHECK (left.size () == 4);
        REQUIRE (left.find_field ("x"));
        CHECK (left.find_field ("x")->violations ().size () == 2);
    }
    SUBCASE("identity")
    {
            auto
        merged = a;
        merged.merge (errors_t {});
        CHECK (merged == a);
    }
} // TEST_CASE("errors.hpp: merge")

TEST_CASE("errors.hpp: to_value")
{
        errors_t
    errors;
    errors.field ("age").push (violation_t { range_violation_t { bound_t::maximum, 100, 150 } });
        const auto
    expected = tao::json::from_string (R"({
        "properties": {
            "age": {
                "errors": [ { "id": "maximum", "params": { "maximum": 100, "actual": 150 } } ]
            }
        }
    })");
    CHECK (errors.to_value () == expected);
} // TEST_CASE("errors.hpp: to_value")
