#pragma once
#include "violation.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

    namespace
verity
{
// The outcome of one validation pass: the violations of a node itself, then
// its fields (in the order they were first reported) and its items (in index
// order). Children are only ever created by a non-empty merge, so a tree
// without violations anywhere is a passed validation.
    class
errors_t
{
public:
        using
    fields_t = std::vector <std::pair <std::string, errors_t>>;
        using
    items_t = std::vector <std::pair <std::size_t, errors_t>>;

private:
        std::vector <violation_t>
    violations_m;
        fields_t
    fields_m;
        items_t
    items_m;

public:
        [[nodiscard]] bool
    empty () const
    {
        if (!violations_m.empty ()) return false;
        for (auto&& [name, child]: fields_m)
        {
            if (!child.empty ()) return false;
        }
        for (auto&& [index, child]: items_m)
        {
            if (!child.empty ()) return false;
        }
        return true;
    }

    // Total number of violations in the tree.
        [[nodiscard]] auto
    size () const
        -> std::size_t
    {
            auto
        n = violations_m.size ();
        for (auto&& [name, child]: fields_m) n += child.size ();
        for (auto&& [index, child]: items_m) n += child.size ();
        return n;
    }

        auto
    violations () const
        -> const std::vector <violation_t>&
    {
        return violations_m;
    }

        auto
    fields () const
        -> const fields_t&
    {
        return fields_m;
    }

        auto
    items () const
        -> const items_t&
    {
        return items_m;
    }

        void
    push (violation_t violation)
    {
        violations_m.push_back (std::move (violation));
    }

        auto
    field (std::string_view name)
        -> errors_t&
    {
        for (auto&& [key, child]: fields_m)
        {
            if (key == name) return child;
        }
        fields_m.emplace_back (std::string { name }, errors_t {});
        return fields_m.back ().second;
    }

        auto
    item (std::size_t index)
        -> errors_t&
    {
            auto
        it = std::lower_bound (
              items_m.begin ()
            , items_m.end ()
            , index
            , [](auto const& entry, std::size_t i) { return entry.first < i; }
        );
        if (it != items_m.end () && it->first == index)
        {
            return it->second;
        }
        return items_m.emplace (it, index, errors_t {})->second;
    }

        auto
    find_field (std::string_view name) const
        -> const errors_t*
    {
        for (auto&& [key, child]: fields_m)
        {
            if (key == name) return &child;
        }
        return nullptr;
    }

        auto
    find_item (std::size_t index) const
        -> const errors_t*
    {
        for (auto&& [i, child]: items_m)
        {
            if (i == index) return &child;
        }
        return nullptr;
    }

    // Path-wise union: violations are appended, children are merged by key.
        void
    merge (errors_t other)
    {
        for (auto&& v: other.violations_m)
        {
            violations_m.push_back (std::move (v));
        }
        for (auto&& [name, child]: other.fields_m)
        {
            merge_field (name, std::move (child));
        }
        for (auto&& [index, child]: other.items_m)
        {
            merge_item (index, std::move (child));
        }
    }

        void
    merge_field (std::string_view name, errors_t child)
    {
        if (child.empty ()) return;
        field (name).merge (std::move (child));
    }

        void
    merge_item (std::size_t index, errors_t child)
    {
        if (child.empty ()) return;
        item (index).merge (std::move (child));
    }

    // Structured form: message ids and parameters instead of rendered text.
        auto
    to_value () const
        -> json_t
    {
            json_t
        result = tao::json::empty_object;
        if (!violations_m.empty ())
        {
                json_t::array_t
            errors;
            for (auto&& v: violations_m)
            {
                    auto
                c = context (v);
                    json_t
                params = tao::json::empty_object;
                for (auto&& [name, value]: c.params)
                {
                    params[name] = value;
                }
                    json_t
                entry = {
                      { "id", c.id }
                    , { "params", params }
                };
                    const std::vector <errors_t>*
                branches = nullptr;
                if (auto p = v.get_if <any_of_violation_t> ())      branches = &p->branches;
                if (auto p = v.get_if <one_of_none_violation_t> ()) branches = &p->branches;
                if (branches)
                {
                        json_t::array_t
                    trees;
                    for (auto&& b: *branches)
                    {
                        trees.push_back (b.to_value ());
                    }
                    entry["branches"] = std::move (trees);
                }
                errors.push_back (std::move (entry));
            }
            result["errors"] = std::move (errors);
        }
        if (!fields_m.empty ())
        {
                json_t
            properties = tao::json::empty_object;
            for (auto&& [name, child]: fields_m)
            {
                properties[name] = child.to_value ();
            }
            result["properties"] = std::move (properties);
        }
        if (!items_m.empty ())
        {
                json_t
            items = tao::json::empty_object;
            for (auto&& [index, child]: items_m)
            {
                items[std::to_string (index)] = child.to_value ();
            }
            result["items"] = std::move (items);
        }
        return result;
    }

        friend bool
    operator== (const errors_t& lhs, const errors_t& rhs)
    {
        return lhs.to_value () == rhs.to_value ();
    }

        friend bool
    operator!= (const errors_t& lhs, const errors_t& rhs)
    {
        return !(lhs == rhs);
    }
};

} // namespace verity
