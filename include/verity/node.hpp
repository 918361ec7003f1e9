#pragma once
#include "rule.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

    namespace
verity
{
    enum class
presence_t
{
    // Absence is reported on the parent as a "required" violation.
      required
    // May be absent; validated whenever present, null included.
    , optional
    // May be absent or null; validated otherwise.
    , nullable
};

    enum class
composition_kind_t
{
      all_of
    , any_of
    , one_of
    , negation
};

// Description of what a value must satisfy, built once and shared by any
// number of validations. Children are immutable once attached.
    class
node_t
{
public:
        struct
    field_t
    {
            std::string
        name;
            std::shared_ptr <const node_t>
        node;
            presence_t
        presence;
    };

        struct
    composition_t
    {
            composition_kind_t
        kind;
            std::vector <std::shared_ptr <const node_t>>
        branches;
    };

private:
        std::vector <rule_t>
    rules_m;
        std::vector <field_t>
    fields_m;
        bool
    deny_additional_m = false;
        std::shared_ptr <const node_t>
    items_m;
        std::shared_ptr <const node_t>
    values_m;
        std::vector <composition_t>
    compositions_m;

        auto
    compose (composition_kind_t kind, std::vector <node_t> branches)
        -> node_t&
    {
            composition_t
        composition { kind, {} };
        for (auto&& branch: branches)
        {
            composition.branches.push_back (std::make_shared <const node_t> (std::move (branch)));
        }
        compositions_m.push_back (std::move (composition));
        return *this;
    }

public:
        auto
    rule (rule_t r)
        -> node_t&
    {
        rules_m.push_back (std::move (r));
        return *this;
    }

    // Fields are walked in the order they are declared here.
        auto
    field (std::string name, node_t node, presence_t presence = presence_t::required)
        -> node_t&
    {
        fields_m.push_back ({
              std::move (name)
            , std::make_shared <const node_t> (std::move (node))
            , presence
        });
        return *this;
    }

    // Undeclared fields become violations.
        auto
    deny_additional (bool deny = true)
        -> node_t&
    {
        deny_additional_m = deny;
        return *this;
    }

    // Applies to every item of a sequence.
        auto
    items (node_t node)
        -> node_t&
    {
        items_m = std::make_shared <const node_t> (std::move (node));
        return *this;
    }

    // Applies to every value of a mapping not declared as a field.
        auto
    values (node_t node)
        -> node_t&
    {
        values_m = std::make_shared <const node_t> (std::move (node));
        return *this;
    }

        auto
    all_of (std::vector <node_t> branches)
        -> node_t&
    {
        return compose (composition_kind_t::all_of, std::move (branches));
    }

        auto
    any_of (std::vector <node_t> branches)
        -> node_t&
    {
        return compose (composition_kind_t::any_of, std::move (branches));
    }

        auto
    one_of (std::vector <node_t> branches)
        -> node_t&
    {
        return compose (composition_kind_t::one_of, std::move (branches));
    }

        auto
    negate (node_t inner)
        -> node_t&
    {
            std::vector <node_t>
        branches;
        branches.push_back (std::move (inner));
        return compose (composition_kind_t::negation, std::move (branches));
    }

        auto
    rules () const
        -> const std::vector <rule_t>&
    {
        return rules_m;
    }

        auto
    fields () const
        -> const std::vector <field_t>&
    {
        return fields_m;
    }

        auto
    find_field (std::string_view name) const
        -> const field_t*
    {
        for (auto&& f: fields_m)
        {
            if (f.name == name) return &f;
        }
        return nullptr;
    }

        bool
    denies_additional () const
    {
        return deny_additional_m;
    }

        auto
    items () const
        -> const node_t*
    {
        return items_m.get ();
    }

        auto
    values () const
        -> const node_t*
    {
        return values_m.get ();
    }

        auto
    compositions () const
        -> const std::vector <composition_t>&
    {
        return compositions_m;
    }
};

    inline auto
contains (
      node_t node
    , std::optional <std::size_t> min_contains = {}
    , std::optional <std::size_t> max_contains = {}
)
    -> rule_t
{
    return {
          contains_rule_t {
              std::make_shared <const node_t> (std::move (node))
            , min_contains
            , max_contains
          }
        , {}
    };
}

} // namespace verity
