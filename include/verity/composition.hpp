#pragma once
#include "errors.hpp"

#include <cstddef>
#include <functional>
#include <vector>

// JSON-Schema combinators over sub-validations. A branch is evaluated lazily
// so that any_of can stop at the first success; an empty result means the
// composition holds.

    namespace
verity
{
    using
branch_t = std::function <errors_t ()>;

// Every failing branch's tree, merged at the current path.
    inline auto
all_of (const std::vector <branch_t>& branches)
    -> errors_t
{
        errors_t
    errors;
    for (auto&& branch: branches)
    {
        errors.merge (branch ());
    }
    return errors;
}

    inline auto
any_of (const std::vector <branch_t>& branches)
    -> errors_t
{
        std::vector <errors_t>
    failures;
    for (auto&& branch: branches)
    {
            auto
        e = branch ();
        if (e.empty ())
        {
            return {};
        }
        failures.push_back (std::move (e));
    }
        errors_t
    errors;
    errors.push (violation_t { any_of_violation_t { std::move (failures) } });
    return errors;
}

// Every branch is evaluated: successes have to be counted.
    inline auto
one_of (const std::vector <branch_t>& branches)
    -> errors_t
{
        std::vector <std::size_t>
    successes;
        std::vector <errors_t>
    failures;
        std::size_t
    index = 0;
    for (auto&& branch: branches)
    {
            auto
        e = branch ();
        if (e.empty ())
        {
            successes.push_back (index);
        }
        else
        {
            failures.push_back (std::move (e));
        }
        ++index;
    }
    if (successes.size () == 1)
    {
        return {};
    }
        errors_t
    errors;
    if (successes.empty ())
    {
        errors.push (violation_t { one_of_none_violation_t { std::move (failures) } });
    }
    else
    {
        errors.push (violation_t { one_of_many_violation_t { std::move (successes) } });
    }
    return errors;
}

    inline auto
negation (const branch_t& inner)
    -> errors_t
{
        errors_t
    errors;
    if (inner ().empty ())
    {
        errors.push (violation_t { not_violation_t {} });
    }
    return errors;
}

} // namespace verity
