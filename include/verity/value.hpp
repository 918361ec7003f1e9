#pragma once
#include <tao/json.hpp>

#include <fmt/format.h>

#include <cmath>
#include <cstdint>
#include <string>
#include <string_view>

// Make tao::json::value printable.
    template <>
    struct
fmt::formatter <tao::json::value>
    : formatter <std::string>
{
        template <typename FormatContext>
        auto
    format (const tao::json::value& v, FormatContext &ctx) const
    {
        return formatter <std::string>::format (tao::json::to_string (v), ctx);
    }
};

    namespace
verity
{
    using
json_t = tao::json::value;
    // The datum under test. Records and mappings are both json objects.
    using
value_t = json_t;

    enum class
type_t
{
      null
    , boolean
    , integer
    , number
    , string
    , array
    , object
};

    inline auto
to_string (type_t type)
    -> std::string_view
{
    switch (type)
    {
        case type_t::null:    return "null";
        case type_t::boolean: return "boolean";
        case type_t::integer: return "integer";
        case type_t::number:  return "number";
        case type_t::string:  return "string";
        case type_t::array:   return "array";
        case type_t::object:  return "object";
    }
    return "unknown";
}

    namespace
detail // {{{
{
        inline bool
    is_integral (const value_t& value)
    {
        if (value.is_integer ()) return true;
        if (!value.is_double ()) return false;
            auto
        d = value.get_double ();
        return std::isfinite (d) && std::floor (d) == d;
    }

    // Three way comparison of two json numbers, exact between integers.
        inline int
    compare (const value_t& lhs, const value_t& rhs)
    {
        if (lhs.is_double () || rhs.is_double ())
        {
                auto
            l = lhs.as <double> ();
                auto
            r = rhs.as <double> ();
            return (l < r) ? -1 : (r < l) ? 1 : 0;
        }
        if (lhs.is_signed () && rhs.is_signed ())
        {
                auto
            l = lhs.get_signed ();
                auto
            r = rhs.get_signed ();
            return (l < r) ? -1 : (r < l) ? 1 : 0;
        }
        if (lhs.is_signed () && lhs.get_signed () < 0) return -1;
        if (rhs.is_signed () && rhs.get_signed () < 0) return 1;
            auto
        l = lhs.as <std::uint64_t> ();
            auto
        r = rhs.as <std::uint64_t> ();
        return (l < r) ? -1 : (r < l) ? 1 : 0;
    }

    // Value equality, numbers compared by value whatever their representation.
        inline bool
    equal (const value_t& lhs, const value_t& rhs)
    {
        if (lhs.is_number () && rhs.is_number ())
        {
            return compare (lhs, rhs) == 0;
        }
        if (lhs.is_array () && rhs.is_array ())
        {
                auto&
            l = lhs.get_array ();
                auto&
            r = rhs.get_array ();
            if (l.size () != r.size ()) return false;
            for (std::size_t i = 0; i < l.size (); ++i)
            {
                if (!equal (l[i], r[i])) return false;
            }
            return true;
        }
        if (lhs.is_object () && rhs.is_object ())
        {
                auto&
            l = lhs.get_object ();
                auto&
            r = rhs.get_object ();
            if (l.size () != r.size ()) return false;
            for (auto&& [key, value]: l)
            {
                    auto
                it = r.find (key);
                if (it == r.end () || !equal (value, it->second)) return false;
            }
            return true;
        }
        if (lhs.is_string_type () && rhs.is_string_type ())
        {
            return lhs.get_string_type () == rhs.get_string_type ();
        }
        return lhs == rhs;
    }
} // }}} namespace detail

    inline bool
type_match (type_t type, const value_t& value)
{
    switch (type)
    {
        case type_t::null:    return value.is_null        ();
        case type_t::boolean: return value.is_boolean     ();
        case type_t::object:  return value.is_object      ();
        case type_t::array:   return value.is_array       ();
        case type_t::number:  return value.is_number      ();
        case type_t::string:  return value.is_string_type ();
        case type_t::integer: return detail::is_integral  (value);
    }
    return false;
}

    inline auto
type_of (const value_t& value)
    -> type_t
{
    if (value.is_null        ()) return type_t::null;
    if (value.is_boolean     ()) return type_t::boolean;
    if (value.is_integer     ()) return type_t::integer;
    if (value.is_number      ()) return type_t::number;
    if (value.is_string_type ()) return type_t::string;
    if (value.is_array       ()) return type_t::array;
    return type_t::object;
}

} // namespace verity
