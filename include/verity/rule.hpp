#pragma once
#include "value.hpp"

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

    namespace
verity
{
    class
node_t;

    struct
range_rule_t
{
        std::optional <json_t>
    minimum;
        std::optional <json_t>
    maximum;
        std::optional <json_t>
    exclusive_minimum;
        std::optional <json_t>
    exclusive_maximum;
};

    struct
multiple_of_rule_t
{
        json_t
    multiple_of;
};

// Lengths are counted in extended grapheme clusters.
    struct
length_rule_t
{
        std::optional <std::size_t>
    min_length;
        std::optional <std::size_t>
    max_length;
};

// Matches anywhere in the string unless the pattern is anchored.
    struct
pattern_rule_t
{
        std::string
    pattern;
};

    struct
enumeration_rule_t
{
        json_t::array_t
    values;
};

    struct
items_rule_t
{
        std::optional <std::size_t>
    min_items;
        std::optional <std::size_t>
    max_items;
};

    struct
unique_items_rule_t
{
};

// Without explicit bounds at least one item must match.
    struct
contains_rule_t
{
        std::shared_ptr <const node_t>
    node;
        std::optional <std::size_t>
    min_contains;
        std::optional <std::size_t>
    max_contains;
};

    struct
properties_rule_t
{
        std::optional <std::size_t>
    min_properties;
        std::optional <std::size_t>
    max_properties;
};

    struct
type_rule_t
{
        std::vector <type_t>
    types;
};

// What an externally supplied predicate reports; `message` is a template over `params`.
    struct
custom_violation_t
{
        std::string
    id;
        std::string
    message;
        std::vector <std::pair <std::string, json_t>>
    params;
};

    struct
custom_rule_t
{
        using
    predicate_t = std::function <std::optional <custom_violation_t> (const value_t&)>;

        std::string
    name;
        predicate_t
    predicate;
};

    using
rule_kind_t = std::variant <
      range_rule_t
    , multiple_of_rule_t
    , length_rule_t
    , pattern_rule_t
    , enumeration_rule_t
    , items_rule_t
    , unique_items_rule_t
    , contains_rule_t
    , properties_rule_t
    , type_rule_t
    , custom_rule_t
>;

    struct
rule_t
{
        rule_kind_t
    kind;
    // Replaces the default message template of the violations it produces.
        std::optional <std::string>
    message;
};

// Factories {{{
    inline auto
range (json_t minimum, json_t maximum)
    -> rule_t
{
    return { range_rule_t { std::move (minimum), std::move (maximum), {}, {} }, {} };
}

    inline auto
minimum (json_t limit)
    -> rule_t
{
    return { range_rule_t { std::move (limit), {}, {}, {} }, {} };
}

    inline auto
maximum (json_t limit)
    -> rule_t
{
    return { range_rule_t { {}, std::move (limit), {}, {} }, {} };
}

    inline auto
exclusive_minimum (json_t limit)
    -> rule_t
{
    return { range_rule_t { {}, {}, std::move (limit), {} }, {} };
}

    inline auto
exclusive_maximum (json_t limit)
    -> rule_t
{
    return { range_rule_t { {}, {}, {}, std::move (limit) }, {} };
}

    inline auto
multiple_of (json_t divisor)
    -> rule_t
{
    return { multiple_of_rule_t { std::move (divisor) }, {} };
}

    inline auto
length (std::size_t min, std::size_t max)
    -> rule_t
{
    return { length_rule_t { min, max }, {} };
}

    inline auto
min_length (std::size_t limit)
    -> rule_t
{
    return { length_rule_t { limit, {} }, {} };
}

    inline auto
max_length (std::size_t limit)
    -> rule_t
{
    return { length_rule_t { {}, limit }, {} };
}

    inline auto
pattern (std::string regex)
    -> rule_t
{
    return { pattern_rule_t { std::move (regex) }, {} };
}

    inline auto
enumerate (json_t::array_t values)
    -> rule_t
{
    return { enumeration_rule_t { std::move (values) }, {} };
}

    inline auto
min_items (std::size_t limit)
    -> rule_t
{
    return { items_rule_t { limit, {} }, {} };
}

    inline auto
max_items (std::size_t limit)
    -> rule_t
{
    return { items_rule_t { {}, limit }, {} };
}

    inline auto
unique_items ()
    -> rule_t
{
    return { unique_items_rule_t {}, {} };
}

    inline auto
min_properties (std::size_t limit)
    -> rule_t
{
    return { properties_rule_t { limit, {} }, {} };
}

    inline auto
max_properties (std::size_t limit)
    -> rule_t
{
    return { properties_rule_t { {}, limit }, {} };
}

    inline auto
type (std::initializer_list <type_t> types)
    -> rule_t
{
    return { type_rule_t { types }, {} };
}

    inline auto
type (type_t t)
    -> rule_t
{
    return type ({ t });
}

    inline auto
custom (std::string name, custom_rule_t::predicate_t predicate)
    -> rule_t
{
    return { custom_rule_t { std::move (name), std::move (predicate) }, {} };
}

    inline auto
with_message (rule_t rule, std::string message)
    -> rule_t
{
    rule.message = std::move (message);
    return rule;
}
// }}} Factories

} // namespace verity
