#include <doctest/doctest.h>
#include "../include/verity/verity.hpp"
    using namespace verity;
    namespace json = tao::json;

    namespace
{
    // { name: string 1..=32, age: integer <= 150, tags: [string]*, nickname?: string|null }
        auto
    person ()
        -> node_t
    {
            node_t
        node;
        node.rule (type (type_t::object))
            .field ("name", node_t {}.rule (type (type_t::string)).rule (length (1, 32)))
            .field ("age", node_t {}.rule (type (type_t::integer)).rule (maximum (150)))
            .field ("tags"
                , node_t {}
                    .rule (type (type_t::array))
                    .rule (unique_items ())
                    .items (node_t {}.rule (type (type_t::string)).rule (min_length (1)))
                , presence_t::optional
            )
            .field ("nickname", node_t {}.rule (type (type_t::string)), presence_t::nullable)
            .deny_additional ()
        ;
        return node;
    }
}

TEST_CASE("walker.hpp: record")
{
        const auto
    node = person ();

    SUBCASE("valid")
    {
        CHECK (validate (node, json::from_string (R"({"name": "Ada", "age": 36})")).empty ());
        CHECK (validate (node, json::from_string (R"({"name": "Ada", "age": 36, "nickname": null})")).empty ());
        CHECK (validate (node, json::from_string (R"({"name": "Ada", "age": 36, "tags": ["x", "y"]})")).empty ());
    }
    SUBCASE("every violation is reported")
    {
            auto
        errors = validate (node, json::from_string (R"({
            "name": "",
            "age": 200,
            "tags": ["a", "", "a"],
            "email": "ada@example.com"
        })"));
        CHECK (errors.size () == 5);
        CHECK (errors.violations ().size () == 1);
        CHECK (errors.violations ().front ().get_if <additional_property_violation_t> ());
        REQUIRE (errors.find_field ("name"));
        CHECK (errors.find_field ("name")->violations ().front ().get_if <length_violation_t> ());
        REQUIRE (errors.find_field ("age"));
        CHECK (errors.find_field ("age")->violations ().front ().get_if <range_violation_t> ());
            auto
        tags = errors.find_field ("tags");
        REQUIRE (tags);
        CHECK (tags->violations ().front ().get_if <unique_items_violation_t> ());
        REQUIRE (tags->find_item (1));
        CHECK (!tags->find_item (0));
        CHECK (!tags->find_item (2));
    }
    SUBCASE("missing required field")
    {
            auto
        errors = validate (node, json::from_string (R"({"age": 1})"));
        REQUIRE (errors.violations ().size () == 1);
            auto
        r = errors.violations ().front ().get_if <required_violation_t> ();
        REQUIRE (r);
        CHECK (r->property == "name");
        CHECK (!errors.find_field ("name"));
    }
    SUBCASE("null is not absent")
    {
            auto
        errors = validate (node, json::from_string (R"({"name": "Ada", "age": 1, "tags": null})"));
        REQUIRE (errors.find_field ("tags"));
        CHECK (errors.find_field ("tags")->violations ().front ().get_if <type_violation_t> ());
    }
    SUBCASE("not a record")
    {
            auto
        errors = validate (node, value_t ("Ada"));
        CHECK (errors.size () == 1);
        CHECK (errors.violations ().front ().get_if <type_violation_t> ());
    }
} // TEST_CASE("walker.hpp: record")

TEST_CASE("walker.hpp: mapping")
{
        node_t
    node;
    node.values (node_t {}.rule (minimum (0)));
    CHECK (validate (node, json::from_string (R"({"a": 1, "b": 2})")).empty ());
        auto
    errors = validate (node, json::from_string (R"({"a": 1, "b": -2, "c": -3})"));
    CHECK (errors.size () == 2);
    CHECK (errors.find_field ("b"));
    CHECK (errors.find_field ("c"));
    CHECK (!errors.find_field ("a"));
} // TEST_CASE("walker.hpp: mapping")

TEST_CASE("walker.hpp: sequence of records")
{
        node_t
    node;
    node.items (node_t {}.field ("id", node_t {}.rule (type (type_t::integer))));
        auto
    errors = validate (node, json::from_string (R"([{"id": 1}, {"id": "2"}, {}])"));
    CHECK (errors.size () == 2);
    CHECK (!errors.find_item (0));
    REQUIRE (errors.find_item (1));
    CHECK (errors.find_item (1)->find_field ("id"));
    REQUIRE (errors.find_item (2));
    CHECK (errors.find_item (2)->violations ().front ().get_if <required_violation_t> ());
} // TEST_CASE("walker.hpp: sequence of records")

TEST_CASE("walker.hpp: contains")
{
        node_t
    node;
    node.rule (contains (node_t {}.rule (type (type_t::string))));
    CHECK (validate (node, json::from_string (R"([1, "a"])")).empty ());
        auto
    errors = validate (node, json::from_string ("[1, 2]"));
    REQUIRE (errors.size () == 1);
    CHECK (context (errors.violations ().front ()).id == "contains");

        node_t
    bounded;
    bounded.rule (contains (node_t {}.rule (type (type_t::string)), 1, 2));
    CHECK (validate (bounded, json::from_string (R"(["a", "b"])")).empty ());
        auto
    too_many = validate (bounded, json::from_string (R"(["a", "b", "c"])"));
    REQUIRE (too_many.size () == 1);
    CHECK (context (too_many.violations ().front ()).id == "max_contains");
    CHECK_THROWS_AS (
          validate (node_t {}.rule (contains (node_t {}, 3, 1)), json::from_string ("[]"))
        , configuration_error
    );
} // TEST_CASE("walker.hpp: contains")

TEST_CASE("walker.hpp: compositions")
{
    SUBCASE("any_of")
    {
            node_t
        node;
        node.any_of ({ node_t {}.rule (type (type_t::string)), node_t {}.rule (minimum (10)) });
        CHECK (validate (node, value_t ("x")).empty ());
        CHECK (validate (node, value_t (12)).empty ());
            auto
        errors = validate (node, value_t (3));
        REQUIRE (errors.violations ().size () == 1);
        CHECK (errors.violations ().front ().get_if <any_of_violation_t> ()->branches.size () == 2);
    }
    SUBCASE("one_of")
    {
            node_t
        node;
        node.one_of ({ node_t {}.rule (multiple_of (3)), node_t {}.rule (multiple_of (5)) });
        CHECK (validate (node, value_t (9)).empty ());
        CHECK (validate (node, value_t (10)).empty ());
        CHECK (validate (node, value_t (15)).violations ().front ().get_if <one_of_many_violation_t> ());
        CHECK (validate (node, value_t (7)).violations ().front ().get_if <one_of_none_violation_t> ());
    }
    SUBCASE("all_of merges at the current path")
    {
            node_t
        node;
        node.all_of ({
              node_t {}.field ("a", node_t {}.rule (type (type_t::string)))
            , node_t {}.field ("a", node_t {}.rule (min_length (3)))
        });
            auto
        errors = validate (node, json::from_string (R"({"a": 1})"));
        REQUIRE (errors.find_field ("a"));
        CHECK (errors.find_field ("a")->violations ().size () == 1);
        errors = validate (node, json::from_string (R"({"a": "x"})"));
        REQUIRE (errors.find_field ("a"));
        CHECK (errors.find_field ("a")->violations ().front ().get_if <length_violation_t> ());
    }
    SUBCASE("negation")
    {
            node_t
        node;
        node.negate (node_t {}.rule (type (type_t::null)));
        CHECK (validate (node, value_t (1)).empty ());
        CHECK (validate (node, value_t (json::null)).violations ().front ().get_if <not_violation_t> ());
    }
} // TEST_CASE("walker.hpp: compositions")

TEST_CASE("walker.hpp: shared node")
{
        const auto
    node = person ();
        const auto
    document = json::from_string (R"({"name": "Ada", "age": 151})");
    CHECK (validate (node, document) == validate (node, document));
    CHECK (validate (node, document).size () == 1);
} // TEST_CASE("walker.hpp: shared node")
