#pragma once
#include "../error.hpp"
#include "../node.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

// Conversion between nodes and JSON Schema (draft-07) documents. Only the
// representation changes: a node and the node read back from its document
// accept and reject the same values.

    namespace
verity
{
    namespace
detail // {{{
{
    // Adds a keyword, pushing it into "allOf" when the node already has it.
        inline void
    put (json_t& schema, const std::string& keyword, json_t value)
    {
        if (!schema.find (keyword))
        {
            schema[keyword] = std::move (value);
            return;
        }
        if (!schema.find ("allOf"))
        {
            schema["allOf"] = tao::json::empty_array;
        }
        schema["allOf"].get_array ().push_back (json_t { { keyword, std::move (value) } });
    }

        inline void
    put_size (
          json_t& schema
        , const std::string& min_keyword
        , const std::string& max_keyword
        , const std::optional <std::size_t>& min
        , const std::optional <std::size_t>& max
    ){
        if (min) put (schema, min_keyword, *min);
        if (max) put (schema, max_keyword, *max);
    }

        inline auto
    type_from_string (const std::string& name)
        -> type_t
    {
        if (name == "null")    return type_t::null;
        if (name == "boolean") return type_t::boolean;
        if (name == "object")  return type_t::object;
        if (name == "array")   return type_t::array;
        if (name == "number")  return type_t::number;
        if (name == "string")  return type_t::string;
        if (name == "integer") return type_t::integer;
        throw conversion_error { fmt::format ("Unknown type \"{}\" in schema document.", name) };
    }

        inline auto
    get_size (const json_t& value, const std::string& keyword)
        -> std::size_t
    {
        if (!value.is_integer () || (value.is_signed () && value.get_signed () < 0))
        {
            throw conversion_error { fmt::format (
                  "Keyword \"{}\" must be a non-negative integer, got {}."
                , keyword
                , value
            )};
        }
        return value.as <std::size_t> ();
    }

        inline auto
    get_number (const json_t& value, const std::string& keyword)
        -> json_t
    {
        if (!value.is_number ())
        {
            throw conversion_error { fmt::format (
                  "Keyword \"{}\" must be a number, got {}."
                , keyword
                , value
            )};
        }
        return value;
    }

        inline auto
    get_object (const json_t& value, const std::string& keyword)
        -> const json_t::object_t&
    {
        if (!value.is_object ())
        {
            throw conversion_error { fmt::format ("Keyword \"{}\" must be an object.", keyword) };
        }
        return value.get_object ();
    }

        inline auto
    get_array (const json_t& value, const std::string& keyword)
        -> const json_t::array_t&
    {
        if (!value.is_array ())
        {
            throw conversion_error { fmt::format ("Keyword \"{}\" must be an array.", keyword) };
        }
        return value.get_array ();
    }
} // }}} namespace detail

    inline auto
to_schema_document (const node_t& node)
    -> json_t;

    namespace
detail // {{{
{
        inline void
    put_rule (json_t& schema, const rule_t& rule)
    {
        if (auto r = std::get_if <range_rule_t> (&rule.kind))
        {
            if (r->minimum)           put (schema, "minimum",          *r->minimum);
            if (r->maximum)           put (schema, "maximum",          *r->maximum);
            if (r->exclusive_minimum) put (schema, "exclusiveMinimum", *r->exclusive_minimum);
            if (r->exclusive_maximum) put (schema, "exclusiveMaximum", *r->exclusive_maximum);
        }
        else if (auto r = std::get_if <multiple_of_rule_t> (&rule.kind))
        {
            put (schema, "multipleOf", r->multiple_of);
        }
        else if (auto r = std::get_if <length_rule_t> (&rule.kind))
        {
            put_size (schema, "minLength", "maxLength", r->min_length, r->max_length);
        }
        else if (auto r = std::get_if <pattern_rule_t> (&rule.kind))
        {
            put (schema, "pattern", r->pattern);
        }
        else if (auto r = std::get_if <enumeration_rule_t> (&rule.kind))
        {
            put (schema, "enum", r->values);
        }
        else if (auto r = std::get_if <items_rule_t> (&rule.kind))
        {
            put_size (schema, "minItems", "maxItems", r->min_items, r->max_items);
        }
        else if (std::holds_alternative <unique_items_rule_t> (rule.kind))
        {
            put (schema, "uniqueItems", true);
        }
        else if (auto r = std::get_if <contains_rule_t> (&rule.kind))
        {
            // minContains and maxContains only mean something beside their own contains.
                json_t
            contains = { { "contains", r->node ? to_schema_document (*r->node) : json_t (true) } };
            if (r->min_contains) contains["minContains"] = *r->min_contains;
            if (r->max_contains) contains["maxContains"] = *r->max_contains;
            if (!schema.find ("contains") && !schema.find ("minContains") && !schema.find ("maxContains"))
            {
                for (auto&& [keyword, value]: contains.get_object ())
                {
                    schema[keyword] = value;
                }
            }
            else
            {
                if (!schema.find ("allOf")) schema["allOf"] = tao::json::empty_array;
                schema["allOf"].get_array ().push_back (std::move (contains));
            }
        }
        else if (auto r = std::get_if <properties_rule_t> (&rule.kind))
        {
            put_size (schema, "minProperties", "maxProperties", r->min_properties, r->max_properties);
        }
        else if (auto r = std::get_if <type_rule_t> (&rule.kind))
        {
                json_t::array_t
            types;
            for (auto&& t: r->types)
            {
                types.emplace_back (std::string { to_string (t) });
            }
            if (types.size () == 1)
            {
                put (schema, "type", std::move (types.front ()));
            }
            else
            {
                put (schema, "type", std::move (types));
            }
        }
        // Custom rules are code, they have no schema counterpart.
    }
} // }}} namespace detail

    inline auto
to_schema_document (const node_t& node)
    -> json_t
{
        json_t
    schema = tao::json::empty_object;
    for (auto&& rule: node.rules ())
    {
        detail::put_rule (schema, rule);
    }
    if (!node.fields ().empty ())
    {
            json_t
        properties = tao::json::empty_object;
            json_t::array_t
        required;
        for (auto&& field: node.fields ())
        {
                auto
            sub_schema = to_schema_document (*field.node);
            if (field.presence == presence_t::nullable)
            {
                sub_schema = {
                    { "anyOf", json_t::array_t { json_t { { "type", "null" } }, std::move (sub_schema) } }
                };
            }
            properties[field.name] = std::move (sub_schema);
            if (field.presence == presence_t::required)
            {
                required.emplace_back (field.name);
            }
        }
        schema["properties"] = std::move (properties);
        if (!required.empty ())
        {
            schema["required"] = std::move (required);
        }
    }
    // A closed record rejects every undeclared field whatever its value node
    // says about it.
    if (node.denies_additional ())
    {
        schema["additionalProperties"] = false;
    }
    else if (node.values ())
    {
        schema["additionalProperties"] = to_schema_document (*node.values ());
    }
    if (node.items ())
    {
        schema["items"] = to_schema_document (*node.items ());
    }
    for (auto&& composition: node.compositions ())
    {
            json_t::array_t
        branches;
        for (auto&& branch: composition.branches)
        {
            branches.push_back (to_schema_document (*branch));
        }
        switch (composition.kind)
        {
            case composition_kind_t::all_of:
                for (auto&& b: branches)
                {
                    if (!schema.find ("allOf")) schema["allOf"] = tao::json::empty_array;
                    schema["allOf"].get_array ().push_back (std::move (b));
                }
                break;
            case composition_kind_t::any_of:
                detail::put (schema, "anyOf", std::move (branches));
                break;
            case composition_kind_t::one_of:
                detail::put (schema, "oneOf", std::move (branches));
                break;
            case composition_kind_t::negation:
                for (auto&& b: branches)
                {
                    detail::put (schema, "not", std::move (b));
                }
                break;
        }
    }
    return schema;
}

// Reads the subset of draft-07 that has a node counterpart. Annotation
// keywords are skipped; any other unknown keyword is a conversion_error
// rather than a constraint silently dropped.
    inline auto
from_schema_document (const json_t& schema)
    -> node_t
{
        node_t
    node;
    if (schema.is_boolean ())
    {
        if (!schema.get_boolean ())
        {
            node.negate (node_t {});
        }
        return node;
    }
    if (!schema.is_object ())
    {
        throw conversion_error { fmt::format (
              "{}:{}: Schema \"{}\" is not an object."
            , __FILE__
            , __LINE__
            , tao::json::to_string (schema)
        )};
    }
        const std::unordered_set <std::string>
    annotations
    {
          "$schema"
        , "$id"
        , "$comment"
        , "title"
        , "description"
        , "default"
        , "examples"
        , "readOnly"
        , "writeOnly"
        , "definitions"
        , "format"
    };
        const std::unordered_set <std::string>
    handled
    {
          "type", "enum", "const"
        , "minimum", "maximum", "exclusiveMinimum", "exclusiveMaximum", "multipleOf"
        , "minLength", "maxLength", "pattern"
        , "minItems", "maxItems", "uniqueItems", "items", "contains", "minContains", "maxContains"
        , "minProperties", "maxProperties", "properties", "required", "additionalProperties"
        , "allOf", "anyOf", "oneOf", "not"
    };
        auto&
    schema_object = schema.get_object ();
    for (auto&& [keyword, value]: schema_object)
    {
        if (annotations.count (keyword) > 0 || handled.count (keyword) > 0) continue;
        throw conversion_error { fmt::format (
              "Unsupported keyword \"{}\" in schema document."
            , keyword
        )};
    }
        auto
    find = [&](const std::string& keyword) -> const json_t*
    {
            auto
        it = schema_object.find (keyword);
        return it == schema_object.end () ? nullptr : &it->second;
    };
    if (auto v = find ("type"))
    {
        if (v->is_string_type ())
        {
            node.rule (type (detail::type_from_string (std::string { v->get_string_type () })));
        }
        else
        {
                type_rule_t
            rule;
            for (auto&& t: detail::get_array (*v, "type"))
            {
                if (!t.is_string_type ())
                {
                    throw conversion_error { "Keyword \"type\" must hold strings." };
                }
                rule.types.push_back (detail::type_from_string (std::string { t.get_string_type () }));
            }
            node.rule ({ std::move (rule), {} });
        }
    }
    if (auto v = find ("enum"))
    {
        node.rule (enumerate (detail::get_array (*v, "enum")));
    }
    if (auto v = find ("const"))
    {
        node.rule (enumerate ({ *v }));
    }
        range_rule_t
    range_rule;
    if (auto v = find ("minimum"))          range_rule.minimum           = detail::get_number (*v, "minimum");
    if (auto v = find ("maximum"))          range_rule.maximum           = detail::get_number (*v, "maximum");
    if (auto v = find ("exclusiveMinimum")) range_rule.exclusive_minimum = detail::get_number (*v, "exclusiveMinimum");
    if (auto v = find ("exclusiveMaximum")) range_rule.exclusive_maximum = detail::get_number (*v, "exclusiveMaximum");
    if (
           range_rule.minimum
        || range_rule.maximum
        || range_rule.exclusive_minimum
        || range_rule.exclusive_maximum
    ){
        node.rule ({ std::move (range_rule), {} });
    }
    if (auto v = find ("multipleOf"))
    {
        node.rule (multiple_of (detail::get_number (*v, "multipleOf")));
    }
        length_rule_t
    length_rule;
    if (auto v = find ("minLength")) length_rule.min_length = detail::get_size (*v, "minLength");
    if (auto v = find ("maxLength")) length_rule.max_length = detail::get_size (*v, "maxLength");
    if (length_rule.min_length || length_rule.max_length)
    {
        node.rule ({ length_rule, {} });
    }
    if (auto v = find ("pattern"))
    {
        if (!v->is_string_type ())
        {
            throw conversion_error { "Keyword \"pattern\" must be a string." };
        }
        node.rule (pattern (std::string { v->get_string_type () }));
    }
        items_rule_t
    items_rule;
    if (auto v = find ("minItems")) items_rule.min_items = detail::get_size (*v, "minItems");
    if (auto v = find ("maxItems")) items_rule.max_items = detail::get_size (*v, "maxItems");
    if (items_rule.min_items || items_rule.max_items)
    {
        node.rule ({ items_rule, {} });
    }
    if (auto v = find ("uniqueItems"))
    {
        if (!v->is_boolean ())
        {
            throw conversion_error { "Keyword \"uniqueItems\" must be a boolean." };
        }
        if (v->get_boolean ())
        {
            node.rule (unique_items ());
        }
    }
    if (auto v = find ("contains"))
    {
            std::optional <std::size_t>
        min;
            std::optional <std::size_t>
        max;
        if (auto m = find ("minContains")) min = detail::get_size (*m, "minContains");
        if (auto m = find ("maxContains")) max = detail::get_size (*m, "maxContains");
        node.rule (contains (from_schema_document (*v), min, max));
    }
    if (auto v = find ("items"))
    {
        if (v->is_array ())
        {
            throw conversion_error { "Positional \"items\" arrays are not supported." };
        }
        node.items (from_schema_document (*v));
    }
        properties_rule_t
    properties_rule;
    if (auto v = find ("minProperties")) properties_rule.min_properties = detail::get_size (*v, "minProperties");
    if (auto v = find ("maxProperties")) properties_rule.max_properties = detail::get_size (*v, "maxProperties");
    if (properties_rule.min_properties || properties_rule.max_properties)
    {
        node.rule ({ properties_rule, {} });
    }
    // Document order, for the fields only "required" declares.
        std::vector <std::string>
    required_order;
        std::unordered_set <std::string>
    required;
    if (auto v = find ("required"))
    {
        for (auto&& name: detail::get_array (*v, "required"))
        {
            if (!name.is_string_type ())
            {
                throw conversion_error { "Keyword \"required\" must hold strings." };
            }
            if (required.emplace (name.get_string_type ()).second)
            {
                required_order.push_back (name.get_string_type ());
            }
        }
    }
    if (auto v = find ("properties"))
    {
        for (auto&& [name, sub_schema]: detail::get_object (*v, "properties"))
        {
            node.field (
                  name
                , from_schema_document (sub_schema)
                , required.count (name) > 0 ? presence_t::required : presence_t::optional
            );
        }
    }
    for (auto&& name: required_order)
    {
        if (!node.find_field (name))
        {
            node.field (name, node_t {}, presence_t::required);
        }
    }
    if (auto v = find ("additionalProperties"))
    {
        if (v->is_boolean ())
        {
            node.deny_additional (!v->get_boolean ());
        }
        else
        {
            node.values (from_schema_document (*v));
        }
    }
        auto
    branches = [&](const json_t& value, const std::string& keyword)
    {
            std::vector <node_t>
        nodes;
        for (auto&& sub_schema: detail::get_array (value, keyword))
        {
            nodes.push_back (from_schema_document (sub_schema));
        }
        return nodes;
    };
    if (auto v = find ("allOf")) node.all_of (branches (*v, "allOf"));
    if (auto v = find ("anyOf")) node.any_of (branches (*v, "anyOf"));
    if (auto v = find ("oneOf")) node.one_of (branches (*v, "oneOf"));
    if (auto v = find ("not"))   node.negate (from_schema_document (*v));
    return node;
}

} // namespace verity
