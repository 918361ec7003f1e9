#pragma once
#include "check.hpp"
#include "composition.hpp"
#include "errors.hpp"
#include "node.hpp"

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

    namespace
verity
{
    inline auto
validate (const node_t& node, const value_t& value)
    -> errors_t;

    inline auto
check (const value_t& value, const contains_rule_t& rule)
    -> result_t
{
    if (!rule.node)
    {
        detail::misconfigured (__FILE__, __LINE__, "Contains rule without an item node.");
    }
    detail::check_bounds (rule.min_contains, rule.max_contains, "contains");
    if (!value.is_array ()) return std::nullopt;
        std::size_t
    matched = 0;
    for (auto&& item: value.get_array ())
    {
        if (validate (*rule.node, item).empty ())
        {
            ++matched;
        }
    }
    if (!rule.min_contains && !rule.max_contains)
    {
        if (matched > 0) return std::nullopt;
        return violation_t { contains_violation_t { bound_t::minimum, 1, matched, true } };
    }
    if (auto failed = detail::check_size (matched, rule.min_contains, rule.max_contains))
    {
        return violation_t { contains_violation_t { failed->first, failed->second, matched } };
    }
    return std::nullopt;
}

// Runs one rule and tags the violation with the rule's own message, if any.
    inline auto
check (const value_t& value, const rule_t& rule)
    -> result_t
{
        auto
    result = std::visit (
          [&](auto const& kind) { return check (value, kind); }
        , rule.kind
    );
    if (result && rule.message)
    {
        return violation_t { result->kind (), rule.message };
    }
    return result;
}

    namespace
detail // {{{
{
        inline auto
    branches_of (const node_t::composition_t& composition, const value_t& value)
        -> std::vector <branch_t>
    {
            std::vector <branch_t>
        branches;
        for (auto&& node: composition.branches)
        {
            branches.push_back ([&value, node] { return validate (*node, value); });
        }
        return branches;
    }

        inline void
    walk_record (const node_t& node, const value_t& value, errors_t& errors)
    {
            auto&
        object = value.get_object ();
        for (auto&& field: node.fields ())
        {
                auto
            it = object.find (field.name);
            if (it == object.end ())
            {
                if (field.presence == presence_t::required)
                {
                    errors.push (violation_t { required_violation_t { field.name } });
                }
                continue;
            }
            if (field.presence == presence_t::nullable && it->second.is_null ())
            {
                continue;
            }
            errors.merge_field (field.name, validate (*field.node, it->second));
        }
        for (auto&& [name, child]: object)
        {
            if (node.find_field (name)) continue;
            if (node.denies_additional ())
            {
                errors.push (violation_t { additional_property_violation_t { name } });
            }
            if (node.values ())
            {
                errors.merge_field (name, validate (*node.values (), child));
            }
        }
    }

        inline void
    walk_sequence (const node_t& node, const value_t& value, errors_t& errors)
    {
            auto&
        array = value.get_array ();
        for (std::size_t index = 0; index < array.size (); ++index)
        {
            errors.merge_item (index, validate (*node.items (), array[index]));
        }
    }
} // }}} namespace detail

// Applies a node to a value and returns every violation found, at its path.
// The traversal never stops early: the node's own rules, its compositions and
// all of its children are always evaluated.
    inline auto
validate (const node_t& node, const value_t& value)
    -> errors_t
{
        errors_t
    errors;
    for (auto&& rule: node.rules ())
    {
        if (auto violation = check (value, rule))
        {
            errors.push (std::move (*violation));
        }
    }
    for (auto&& composition: node.compositions ())
    {
            auto
        branches = detail::branches_of (composition, value);
        switch (composition.kind)
        {
            case composition_kind_t::all_of:
                errors.merge (all_of (branches));
                break;
            case composition_kind_t::any_of:
                errors.merge (any_of (branches));
                break;
            case composition_kind_t::one_of:
                errors.merge (one_of (branches));
                break;
            case composition_kind_t::negation:
                for (auto&& branch: branches)
                {
                    errors.merge (negation (branch));
                }
                break;
        }
    }
    if (value.is_object ())
    {
        detail::walk_record (node, value, errors);
    }
    if (value.is_array () && node.items ())
    {
        detail::walk_sequence (node, value, errors);
    }
    return errors;
}

} // namespace verity
