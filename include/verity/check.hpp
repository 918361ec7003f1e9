#pragma once
#include "error.hpp"
#include "errors.hpp"
#include "detail/grapheme.hpp"
#include "detail/pattern_cache.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <optional>
#include <regex>
#include <string>

// One evaluator per constraint kind. An evaluator returns the violation it
// found, or nothing; a rule of a kind that does not apply to the value's type
// passes. Rules that cannot be satisfied by any value throw configuration_error.

    namespace
verity
{
    using
result_t = std::optional <violation_t>;

    namespace
detail // {{{
{
        [[noreturn]] inline void
    misconfigured (const char* file, int line, std::string const& message)
    {
        throw configuration_error { fmt::format ("{}:{}: {}", file, line, message) };
    }

        template <typename T>
        void
    check_bounds (
          const std::optional <T>& min
        , const std::optional <T>& max
        , const char* what
    ){
        if (min && max && *max < *min)
        {
            misconfigured (__FILE__, __LINE__, fmt::format (
                  "Inconsistent {} rule: minimum {} is greater than maximum {}."
                , what
                , *min
                , *max
            ));
        }
    }

        inline void
    check_number (const std::optional <json_t>& limit, const char* name)
    {
        if (limit && !limit->is_number ())
        {
            misconfigured (__FILE__, __LINE__, fmt::format (
                  "Rule parameter {} must be a number, got {}."
                , name
                , *limit
            ));
        }
    }

    // Shared shape of the min/max size rules (length, items, properties).
        inline auto
    check_size (
          std::size_t actual
        , const std::optional <std::size_t>& min
        , const std::optional <std::size_t>& max
    )
        -> std::optional <std::pair <bound_t, std::size_t>>
    {
        if (min && actual < *min) return std::pair { bound_t::minimum, *min };
        if (max && actual > *max) return std::pair { bound_t::maximum, *max };
        return std::nullopt;
    }
} // }}} namespace detail

    inline auto
check (const value_t& value, const range_rule_t& rule)
    -> result_t
{
    detail::check_number (rule.minimum,           "minimum");
    detail::check_number (rule.maximum,           "maximum");
    detail::check_number (rule.exclusive_minimum, "exclusive_minimum");
    detail::check_number (rule.exclusive_maximum, "exclusive_maximum");
    if (
           rule.minimum
        && rule.maximum
        && detail::compare (*rule.minimum, *rule.maximum) > 0
    ){
        detail::misconfigured (__FILE__, __LINE__, fmt::format (
              "Inconsistent range rule: minimum {} is greater than maximum {}."
            , *rule.minimum
            , *rule.maximum
        ));
    }
    if (
           rule.exclusive_minimum
        && rule.exclusive_maximum
        && detail::compare (*rule.exclusive_minimum, *rule.exclusive_maximum) >= 0
    ){
        detail::misconfigured (__FILE__, __LINE__, fmt::format (
              "Inconsistent range rule: exclusive minimum {} leaves no room below exclusive maximum {}."
            , *rule.exclusive_minimum
            , *rule.exclusive_maximum
        ));
    }
    if (!value.is_number ()) return std::nullopt;
    if (value.is_double () && !std::isfinite (value.get_double ()))
    {
        return violation_t { not_finite_violation_t { value.get_double () } };
    }
    if (rule.minimum && detail::compare (value, *rule.minimum) < 0)
    {
        return violation_t { range_violation_t { bound_t::minimum, *rule.minimum, value } };
    }
    if (rule.maximum && detail::compare (value, *rule.maximum) > 0)
    {
        return violation_t { range_violation_t { bound_t::maximum, *rule.maximum, value } };
    }
    if (rule.exclusive_minimum && detail::compare (value, *rule.exclusive_minimum) <= 0)
    {
        return violation_t { range_violation_t { bound_t::exclusive_minimum, *rule.exclusive_minimum, value } };
    }
    if (rule.exclusive_maximum && detail::compare (value, *rule.exclusive_maximum) >= 0)
    {
        return violation_t { range_violation_t { bound_t::exclusive_maximum, *rule.exclusive_maximum, value } };
    }
    return std::nullopt;
}

    inline auto
check (const value_t& value, const multiple_of_rule_t& rule)
    -> result_t
{
    if (
           !rule.multiple_of.is_number ()
        || rule.multiple_of.as <double> () <= 0
        || !std::isfinite (rule.multiple_of.as <double> ())
    ){
        detail::misconfigured (__FILE__, __LINE__, fmt::format (
              "Rule parameter multiple_of must be a positive number, got {}."
            , rule.multiple_of
        ));
    }
    if (!value.is_number ()) return std::nullopt;
    if (value.is_double () && !std::isfinite (value.get_double ()))
    {
        return violation_t { not_finite_violation_t { value.get_double () } };
    }
        bool
    is_multiple;
    if (value.is_integer () && rule.multiple_of.is_integer ())
    {
            auto
        divisor = rule.multiple_of.as <std::uint64_t> ();
        if (value.is_signed () && value.get_signed () < 0)
        {
            // Magnitude of a negative int64, INT64_MIN included.
                auto
            magnitude = std::uint64_t { 0 } - static_cast <std::uint64_t> (value.get_signed ());
            is_multiple = magnitude % divisor == 0;
        }
        else
        {
            is_multiple = value.as <std::uint64_t> () % divisor == 0;
        }
    }
    else
    {
        // 0.3 / 0.1 is 2.9999999999999996: compare the quotient to the
        // nearest integer with a tolerance scaled to its magnitude.
            auto
        quotient = value.as <double> () / rule.multiple_of.as <double> ();
            auto
        tolerance = 4 * std::numeric_limits <double>::epsilon () * std::max (1.0, std::abs (quotient));
        is_multiple = std::isfinite (quotient)
            && std::abs (quotient - std::round (quotient)) <= tolerance;
    }
    if (is_multiple) return std::nullopt;
    return violation_t { multiple_of_violation_t { rule.multiple_of, value } };
}

    inline auto
check (const value_t& value, const length_rule_t& rule)
    -> result_t
{
    detail::check_bounds (rule.min_length, rule.max_length, "length");
    if (!value.is_string_type ()) return std::nullopt;
    if (!rule.min_length && !rule.max_length) return std::nullopt;
        auto
    actual = detail::grapheme_count (value.get_string_type ());
    if (auto failed = detail::check_size (actual, rule.min_length, rule.max_length))
    {
        return violation_t { length_violation_t { failed->first, failed->second, actual } };
    }
    return std::nullopt;
}

    inline auto
check (const value_t& value, const pattern_rule_t& rule)
    -> result_t
{
        auto
    re = detail::pattern_cache ().get (rule.pattern);
    if (!value.is_string_type ()) return std::nullopt;
        auto
    text = value.get_string_type ();
    if (std::regex_search (text.begin (), text.end (), *re))
    {
        return std::nullopt;
    }
    return violation_t { pattern_violation_t { rule.pattern, std::string { text } } };
}

    inline auto
check (const value_t& value, const enumeration_rule_t& rule)
    -> result_t
{
    if (rule.values.empty ())
    {
        detail::misconfigured (__FILE__, __LINE__, "Enumeration rule without any allowed value.");
    }
    if (std::any_of (
          std::begin (rule.values)
        , std::end (rule.values)
        , [&](auto&& x){ return detail::equal (value, x); }
    )){
        return std::nullopt;
    }
    return violation_t { enumeration_violation_t { rule.values, value } };
}

    inline auto
check (const value_t& value, const items_rule_t& rule)
    -> result_t
{
    detail::check_bounds (rule.min_items, rule.max_items, "items");
    if (!value.is_array ()) return std::nullopt;
        auto
    actual = value.get_array ().size ();
    if (auto failed = detail::check_size (actual, rule.min_items, rule.max_items))
    {
        return violation_t { items_violation_t { failed->first, failed->second, actual } };
    }
    return std::nullopt;
}

// Reports the duplicate pair with the lowest second index, then the lowest
// first index. No ordering of the items is required.
    inline auto
check (const value_t& value, const unique_items_rule_t&)
    -> result_t
{
    if (!value.is_array ()) return std::nullopt;
        auto&
    items = value.get_array ();
    for (std::size_t second = 1; second < items.size (); ++second)
    {
        for (std::size_t first = 0; first < second; ++first)
        {
            if (detail::equal (items[first], items[second]))
            {
                return violation_t { unique_items_violation_t { first, second } };
            }
        }
    }
    return std::nullopt;
}

    inline auto
check (const value_t& value, const properties_rule_t& rule)
    -> result_t
{
    detail::check_bounds (rule.min_properties, rule.max_properties, "properties");
    if (!value.is_object ()) return std::nullopt;
        auto
    actual = value.get_object ().size ();
    if (auto failed = detail::check_size (actual, rule.min_properties, rule.max_properties))
    {
        return violation_t { properties_violation_t { failed->first, failed->second, actual } };
    }
    return std::nullopt;
}

    inline auto
check (const value_t& value, const type_rule_t& rule)
    -> result_t
{
    if (rule.types.empty ())
    {
        detail::misconfigured (__FILE__, __LINE__, "Type rule without any accepted type.");
    }
    if (std::any_of (
          std::begin (rule.types)
        , std::end (rule.types)
        , [&](auto t){ return type_match (t, value); }
    )){
        return std::nullopt;
    }
    return violation_t { type_violation_t { rule.types, type_of (value) } };
}

    inline auto
check (const value_t& value, const custom_rule_t& rule)
    -> result_t
{
    if (!rule.predicate)
    {
        detail::misconfigured (__FILE__, __LINE__, fmt::format (
              "Custom rule \"{}\" has no predicate."
            , rule.name
        ));
    }
    if (auto failed = rule.predicate (value))
    {
        if (failed->id.empty ())
        {
            failed->id = rule.name;
        }
        return violation_t { std::move (*failed) };
    }
    return std::nullopt;
}

} // namespace verity
