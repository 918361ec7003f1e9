#pragma once
#include "rule.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

    namespace
verity
{
    class
errors_t;

    enum class
bound_t
{
      minimum
    , maximum
    , exclusive_minimum
    , exclusive_maximum
};

    struct
range_violation_t
{
        bound_t
    bound;
        json_t
    limit;
        json_t
    actual;
};

// NaN and infinities never take part in a range comparison.
    struct
not_finite_violation_t
{
        double
    actual;
};

    struct
multiple_of_violation_t
{
        json_t
    multiple_of;
        json_t
    actual;
};

    struct
length_violation_t
{
        bound_t
    bound;
        std::size_t
    limit;
        std::size_t
    actual;
};

    struct
pattern_violation_t
{
        std::string
    pattern;
        std::string
    actual;
};

    struct
enumeration_violation_t
{
        json_t::array_t
    values;
        json_t
    actual;
};

    struct
items_violation_t
{
        bound_t
    bound;
        std::size_t
    limit;
        std::size_t
    actual;
};

// Indices of the first duplicate pair, first < second.
    struct
unique_items_violation_t
{
        std::size_t
    first;
        std::size_t
    second;
};

    struct
contains_violation_t
{
        bound_t
    bound;
        std::size_t
    limit;
        std::size_t
    actual;
    // True when the rule gave no bounds and "at least one" was implied.
        bool
    implicit = false;
};

    struct
properties_violation_t
{
        bound_t
    bound;
        std::size_t
    limit;
        std::size_t
    actual;
};

    struct
required_violation_t
{
        std::string
    property;
};

    struct
additional_property_violation_t
{
        std::string
    property;
};

    struct
type_violation_t
{
        std::vector <type_t>
    expected;
        type_t
    actual;
};

    struct
any_of_violation_t
{
        std::vector <errors_t>
    branches;
};

    struct
one_of_none_violation_t
{
        std::vector <errors_t>
    branches;
};

    struct
one_of_many_violation_t
{
        std::vector <std::size_t>
    matched;
};

    struct
not_violation_t
{
};

    using
violation_kind_t = std::variant <
      range_violation_t
    , not_finite_violation_t
    , multiple_of_violation_t
    , length_violation_t
    , pattern_violation_t
    , enumeration_violation_t
    , items_violation_t
    , unique_items_violation_t
    , contains_violation_t
    , properties_violation_t
    , required_violation_t
    , additional_property_violation_t
    , type_violation_t
    , custom_violation_t
    , any_of_violation_t
    , one_of_none_violation_t
    , one_of_many_violation_t
    , not_violation_t
>;

    class
violation_t
{
        violation_kind_t
    kind_m;
        std::optional <std::string>
    message_m;

public:
    violation_t (violation_kind_t kind, std::optional <std::string> message = {})
        : kind_m    { std::move (kind) }
        , message_m { std::move (message) }
    {}

        auto
    kind () const
        -> const violation_kind_t&
    {
        return kind_m;
    }

    // The rule's own message template, if it had one.
        auto
    message () const
        -> const std::optional <std::string>&
    {
        return message_m;
    }

        template <typename Kind>
        auto
    get_if () const
        -> const Kind*
    {
        return std::get_if <Kind> (&kind_m);
    }
};

// Message id plus named parameters, built on demand for rendering.
    struct
message_context_t
{
        using
    params_t = std::vector <std::pair <std::string, json_t>>;

        std::string
    id;
        params_t
    params;
    // Name of the parameter plural forms are selected on.
        std::optional <std::string>
    count;

        auto
    find (std::string_view name) const
        -> const json_t*
    {
        for (auto&& [key, value]: params)
        {
            if (key == name) return &value;
        }
        return nullptr;
    }
};

    namespace
detail // {{{
{
        inline auto
    bound_name (bound_t bound)
        -> std::string
    {
        switch (bound)
        {
            case bound_t::minimum:           return "minimum";
            case bound_t::maximum:           return "maximum";
            case bound_t::exclusive_minimum: return "exclusive_minimum";
            case bound_t::exclusive_maximum: return "exclusive_maximum";
        }
        return "bound";
    }

    // "min_length", "max_items", ...
        inline auto
    size_name (bound_t bound, std::string_view subject)
        -> std::string
    {
        return fmt::format (
              "{}_{}"
            , bound == bound_t::minimum ? "min" : "max"
            , subject
        );
    }

        inline auto
    size_context (bound_t bound, std::string_view subject, std::size_t limit, std::size_t actual)
        -> message_context_t
    {
            auto
        name = size_name (bound, subject);
        return {
              name
            , { { name, limit }, { "actual", actual } }
            , name
        };
    }

        inline auto
    context_of (const range_violation_t& v)
        -> message_context_t
    {
            auto
        name = bound_name (v.bound);
        return { name, { { name, v.limit }, { "actual", v.actual } }, {} };
    }

        inline auto
    context_of (const not_finite_violation_t& v)
        -> message_context_t
    {
        return { "not_finite", { { "actual", fmt::format ("{}", v.actual) } }, {} };
    }

        inline auto
    context_of (const multiple_of_violation_t& v)
        -> message_context_t
    {
        return {
              "multiple_of"
            , { { "multiple_of", v.multiple_of }, { "actual", v.actual } }
            , {}
        };
    }

        inline auto
    context_of (const length_violation_t& v)
        -> message_context_t
    {
        return size_context (v.bound, "length", v.limit, v.actual);
    }

        inline auto
    context_of (const pattern_violation_t& v)
        -> message_context_t
    {
        return {
              "pattern"
            , { { "pattern", v.pattern }, { "actual", v.actual } }
            , {}
        };
    }

        inline auto
    context_of (const enumeration_violation_t& v)
        -> message_context_t
    {
        return {
              "enumerate"
            , { { "enumerate", json_t (v.values) }, { "actual", v.actual } }
            , {}
        };
    }

        inline auto
    context_of (const items_violation_t& v)
        -> message_context_t
    {
        return size_context (v.bound, "items", v.limit, v.actual);
    }

        inline auto
    context_of (const unique_items_violation_t& v)
        -> message_context_t
    {
        return {
              "unique_items"
            , { { "first", v.first }, { "second", v.second } }
            , {}
        };
    }

        inline auto
    context_of (const contains_violation_t& v)
        -> message_context_t
    {
        if (v.implicit)
        {
            return { "contains", { { "actual", v.actual } }, {} };
        }
        return size_context (v.bound, "contains", v.limit, v.actual);
    }

        inline auto
    context_of (const properties_violation_t& v)
        -> message_context_t
    {
        return size_context (v.bound, "properties", v.limit, v.actual);
    }

        inline auto
    context_of (const required_violation_t& v)
        -> message_context_t
    {
        return { "required", { { "property", v.property } }, {} };
    }

        inline auto
    context_of (const additional_property_violation_t& v)
        -> message_context_t
    {
        return { "additional_properties", { { "property", v.property } }, {} };
    }

        inline auto
    context_of (const type_violation_t& v)
        -> message_context_t
    {
            std::string
        expected;
        for (auto&& t: v.expected)
        {
            if (!expected.empty ()) expected += ", ";
            expected += to_string (t);
        }
        return {
              "type"
            , {
                  { "expected", expected }
                , { "actual", std::string { to_string (v.actual) } }
              }
            , {}
        };
    }

        inline auto
    context_of (const custom_violation_t& v)
        -> message_context_t
    {
        return { v.id, v.params, {} };
    }

        inline auto
    context_of (const any_of_violation_t&)
        -> message_context_t
    {
        return { "any_of", {}, {} };
    }

        inline auto
    context_of (const one_of_none_violation_t&)
        -> message_context_t
    {
        return { "one_of_none", {}, {} };
    }

        inline auto
    context_of (const one_of_many_violation_t& v)
        -> message_context_t
    {
            json_t::array_t
        matched;
        for (auto&& i: v.matched)
        {
            matched.emplace_back (i);
        }
        return {
              "one_of_many"
            , { { "count", v.matched.size () }, { "matched", json_t (std::move (matched)) } }
            , "count"
        };
    }

        inline auto
    context_of (const not_violation_t&)
        -> message_context_t
    {
        return { "not", {}, {} };
    }
} // }}} namespace detail

    inline auto
context (const violation_t& violation)
    -> message_context_t
{
    return std::visit (
          [](auto const& kind) { return detail::context_of (kind); }
        , violation.kind ()
    );
}

} // namespace verity
