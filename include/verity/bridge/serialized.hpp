#pragma once
#include "../error.hpp"
#include "../errors.hpp"
#include "../node.hpp"
#include "../walker.hpp"

#include <tao/json.hpp>

#ifdef VERITY_WITH_TOML
#include <toml++/toml.hpp>
#include <sstream>
#endif

#ifdef VERITY_WITH_YAML
#include <ryml.hpp>
#include <ryml_std.hpp>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <optional>
#include <regex>
#endif

#include <stdexcept>
#include <string>
#include <string_view>

// Parses serialized documents into values so that the same node validates
// JSON, TOML and YAML input alike.

    namespace
verity
{
    enum class
format_t
{
      json
    , toml
    , yaml
};

    inline auto
to_string (format_t format)
    -> std::string_view
{
    switch (format)
    {
        case format_t::json: return "json";
        case format_t::toml: return "toml";
        case format_t::yaml: return "yaml";
    }
    return "unknown";
}

    namespace
detail // {{{
{
        [[noreturn]] inline void
    unsupported_format (format_t format)
    {
        throw conversion_error { fmt::format (
              "{}:{}: Support for {} input was not compiled in."
            , __FILE__
            , __LINE__
            , to_string (format)
        )};
    }

        inline auto
    from_json_text (std::string_view text)
        -> value_t
    {
        try
        {
            return tao::json::from_string (text);
        }
        catch (tao::json::pegtl::parse_error const& e)
        {
            throw conversion_error { fmt::format ("Invalid json input: {}", e.what ()) };
        }
        // The value builder reports duplicate keys this way.
        catch (std::runtime_error const& e)
        {
            throw conversion_error { fmt::format ("Invalid json input: {}", e.what ()) };
        }
    }

#ifdef VERITY_WITH_TOML
        inline auto
    from_toml_node (const toml::node& node)
        -> value_t
    {
        if (auto table = node.as_table ())
        {
                value_t
            result = tao::json::empty_object;
            for (auto&& [key, child]: *table)
            {
                result[std::string { key.str () }] = from_toml_node (child);
            }
            return result;
        }
        if (auto array = node.as_array ())
        {
                value_t::array_t
            result;
            for (auto&& child: *array)
            {
                result.push_back (from_toml_node (child));
            }
            return result;
        }
        if (auto s = node.as_string ())         return s->get ();
        if (auto i = node.as_integer ())        return i->get ();
        if (auto d = node.as_floating_point ()) return d->get ();
        if (auto b = node.as_boolean ())        return b->get ();
        // Dates and times have no json counterpart: they are kept as their
        // TOML text.
            std::ostringstream
        text;
        if      (auto d = node.as_date ())      text << d->get ();
        else if (auto t = node.as_time ())      text << t->get ();
        else if (auto dt = node.as_date_time ()) text << dt->get ();
        return text.str ();
    }

        inline auto
    from_toml_text (std::string_view text)
        -> value_t
    {
        try
        {
                auto
            table = toml::parse (text);
            return from_toml_node (table);
        }
        catch (toml::parse_error const& e)
        {
            throw conversion_error { fmt::format (
                  "Invalid toml input at line {}, column {}: {}"
                , e.source ().begin.line
                , e.source ().begin.column
                , e.description ()
            )};
        }
    }
#endif

#ifdef VERITY_WITH_YAML
        inline void
    yaml_error (const char* message, std::size_t length, ryml::Location location, void*)
    {
        throw conversion_error { fmt::format (
              "Invalid yaml input at line {}, column {}: {}"
            , location.line + 1
            , location.col + 1
            , std::string_view { message, length }
        )};
    }

    // Plain scalars are resolved with the YAML 1.2 core schema; quoted ones
    // are always strings.
        inline auto
    from_yaml_scalar (ryml::csubstr scalar, bool quoted)
        -> value_t
    {
            std::string
        text { scalar.str, scalar.len };
        if (quoted) return text;
        if (text.empty () || text == "~" || text == "null" || text == "Null" || text == "NULL")
        {
            return tao::json::null;
        }
        if (text == "true" || text == "True" || text == "TRUE")    return true;
        if (text == "false" || text == "False" || text == "FALSE") return false;
            static const std::regex
        integer { "[-+]?[0-9]+" };
        if (std::regex_match (text, integer))
        {
                const char*
            first = text.data () + (text.front () == '+' ? 1 : 0);
                const char*
            last = text.data () + text.size ();
            if (text.front () == '-')
            {
                    std::int64_t
                i;
                if (auto [end, ec] = std::from_chars (first, last, i); ec == std::errc {} && end == last)
                {
                    return i;
                }
            }
            else
            {
                    std::uint64_t
                u;
                if (auto [end, ec] = std::from_chars (first, last, u); ec == std::errc {} && end == last)
                {
                    return u;
                }
            }
            // Out of range for 64 bits: kept as a float.
            return std::strtod (text.c_str (), nullptr);
        }
            static const std::regex
        number { "[-+]?(\\.[0-9]+|[0-9]+(\\.[0-9]*)?)([eE][-+]?[0-9]+)?" };
        if (std::regex_match (text, number))
        {
            return std::strtod (text.c_str (), nullptr);
        }
            static const std::regex
        special { "[-+]?\\.(inf|Inf|INF)|\\.(nan|NaN|NAN)" };
        if (std::regex_match (text, special))
        {
            if (text.find_first_of ("nN") != std::string::npos)
            {
                return std::numeric_limits <double>::quiet_NaN ();
            }
            return text.front () == '-'
                ? -std::numeric_limits <double>::infinity ()
                :  std::numeric_limits <double>::infinity ()
            ;
        }
        return text;
    }

    // Core schema tag name ("str" for "!!str", "tag:yaml.org,2002:str" or
    // "!<tag:yaml.org,2002:str>"), nothing for an application tag.
        inline auto
    core_tag (ryml::csubstr tag)
        -> std::optional <std::string>
    {
            std::string_view
        name { tag.str, tag.len };
            constexpr std::string_view
        long_prefix = "tag:yaml.org,2002:";
        if (name.size () > 2 && name.front () == '!' && name[1] == '<' && name.back () == '>')
        {
            name = name.substr (2, name.size () - 3);
        }
        if (name.substr (0, 2) == "!!")
        {
            return std::string { name.substr (2) };
        }
        if (name.substr (0, long_prefix.size ()) == long_prefix)
        {
            return std::string { name.substr (long_prefix.size ()) };
        }
        return std::nullopt;
    }

        [[noreturn]] inline void
    tag_mismatch (ryml::csubstr tag, std::string_view what)
    {
        throw conversion_error { fmt::format (
              "Yaml tag \"{}\" cannot be applied to {}."
            , std::string_view { tag.str, tag.len }
            , what
        )};
    }

        inline auto
    from_yaml_node (ryml::ConstNodeRef node)
        -> value_t
    {
            std::optional <std::string>
        tag;
        if (node.has_val_tag ())
        {
            tag = core_tag (node.val_tag ());
            if (!tag)
            {
                throw conversion_error { fmt::format (
                      "Unsupported yaml tag \"{}\"."
                    , std::string_view { node.val_tag ().str, node.val_tag ().len }
                )};
            }
        }
        if (node.is_map ())
        {
            if (tag && *tag != "map") tag_mismatch (node.val_tag (), "a mapping");
                value_t
            result = tao::json::empty_object;
            for (ryml::ConstNodeRef child: node.children ())
            {
                    auto
                key = child.key ();
                result[std::string { key.str, key.len }] = from_yaml_node (child);
            }
            return result;
        }
        if (node.is_seq ())
        {
            if (tag && *tag != "seq") tag_mismatch (node.val_tag (), "a sequence");
                value_t::array_t
            result;
            for (ryml::ConstNodeRef child: node.children ())
            {
                result.push_back (from_yaml_node (child));
            }
            return result;
        }
        if (!node.has_val ())
        {
            return tao::json::null;
        }
        if (!tag)
        {
            return from_yaml_scalar (node.val (), node.is_val_quoted ());
        }
        if (*tag == "str")
        {
            return std::string { node.val ().str, node.val ().len };
        }
        // An explicit tag overrides quoting; the text must still resolve to it.
            auto
        value = from_yaml_scalar (node.val (), false);
        if (
               (*tag == "null"  && value.is_null ())
            || (*tag == "bool"  && value.is_boolean ())
            || (*tag == "int"   && value.is_integer ())
            || (*tag == "float" && value.is_number ())
        ){
            return value;
        }
        tag_mismatch (node.val_tag (), fmt::format ("\"{}\"", std::string_view { node.val ().str, node.val ().len }));
    }

        inline auto
    from_yaml_text (std::string_view text)
        -> value_t
    {
            const ryml::Callbacks
        callbacks { nullptr, nullptr, nullptr, &yaml_error };
            ryml::Tree
        tree { callbacks };
            ryml::Parser
        parser { callbacks };
        parser.parse_in_arena ({}, ryml::csubstr { text.data (), text.size () }, &tree);
        // Replaces aliases by their anchored node and expands "<<" merge keys.
        tree.resolve ();
            auto
        root = tree.crootref ();
        if (root.is_stream ())
        {
            if (root.num_children () != 1)
            {
                throw conversion_error { fmt::format (
                      "Yaml input must hold exactly one document, it holds {}."
                    , root.num_children ()
                )};
            }
            root = root.first_child ();
        }
        return from_yaml_node (root);
    }
#endif
} // }}} namespace detail

// Throws conversion_error on malformed input, and for a format whose
// support was not built.
    inline auto
from_serialized (std::string_view text, format_t format)
    -> value_t
{
    switch (format)
    {
        case format_t::json:
            return detail::from_json_text (text);
        case format_t::toml:
#ifdef VERITY_WITH_TOML
            return detail::from_toml_text (text);
#else
            detail::unsupported_format (format);
#endif
        case format_t::yaml:
#ifdef VERITY_WITH_YAML
            return detail::from_yaml_text (text);
#else
            detail::unsupported_format (format);
#endif
    }
    detail::unsupported_format (format);
}

    inline auto
validate_serialized (std::string_view text, format_t format, const node_t& node)
    -> errors_t
{
    return validate (node, from_serialized (text, format));
}

} // namespace verity
