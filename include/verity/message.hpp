#pragma once
#include "error.hpp"
#include "errors.hpp"
#include "violation.hpp"

#include <fmt/args.h>
#include <fmt/format.h>

#include <unicode/locid.h>
#include <unicode/plurrule.h>
#include <unicode/unistr.h>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

    namespace
verity
{
// A source of localized message templates. Templates use named fields
// ("must be `<= {maximum}`"); the parameters of the context are substituted
// afterwards, so a catalog only has to pick the right text.
    class
catalog_t
{
public:
    virtual ~catalog_t () = default;

        virtual auto
    lookup (
          std::string_view message_id
        , std::string_view locale
        , const message_context_t& context
    ) const
        -> std::optional <std::string> = 0;
};

    struct
render_options_t
{
        const catalog_t*
    catalog = nullptr;
        std::string
    locale = "en";
};

    namespace
detail // {{{
{
        inline auto
    default_template (std::string_view id)
        -> std::optional <std::string_view>
    {
            static const std::map <std::string_view, std::string_view>
        templates {
              { "minimum",               "the number must be `>= {minimum}`." }
            , { "maximum",               "the number must be `<= {maximum}`." }
            , { "exclusive_minimum",     "the number must be `> {exclusive_minimum}`." }
            , { "exclusive_maximum",     "the number must be `< {exclusive_maximum}`." }
            , { "not_finite",            "the number must be finite, got `{actual}`." }
            , { "multiple_of",           "the value must be multiple of `{multiple_of}`." }
            , { "min_length",            "the length of the value must be `>= {min_length}`." }
            , { "max_length",            "the length of the value must be `<= {max_length}`." }
            , { "pattern",               "the value must match the pattern of \"{pattern}\"." }
            , { "enumerate",             "the value must be in [{enumerate}]." }
            , { "min_items",             "the length of the items must be `>= {min_items}`." }
            , { "max_items",             "the length of the items must be `<= {max_items}`." }
            , { "unique_items",          "the items must be unique, item {second} repeats item {first}." }
            , { "contains",              "the items must contain at least one matching item." }
            , { "min_contains",          "the number of matching items must be `>= {min_contains}`." }
            , { "max_contains",          "the number of matching items must be `<= {max_contains}`." }
            , { "min_properties",        "the size of the properties must be `>= {min_properties}`." }
            , { "max_properties",        "the size of the properties must be `<= {max_properties}`." }
            , { "required",              "the property \"{property}\" is required." }
            , { "additional_properties", "the property \"{property}\" is not allowed." }
            , { "type",                  "the value must be of type {expected}, got {actual}." }
            , { "any_of",                "the value must match at least one of the alternatives." }
            , { "one_of_none",           "the value must match exactly one of the alternatives, it matches none." }
            , { "one_of_many",           "the value must match exactly one of the alternatives, it matches {count}: [{matched}]." }
            , { "not",                   "the value must not match the negated rule." }
        };
        if (
                auto
              it = templates.find (id)
            ; it != templates.end ()
        ){
            return it->second;
        }
        return std::nullopt;
    }

    // Strings are substituted bare, arrays as a comma separated list.
        inline auto
    display (const json_t& value)
        -> std::string
    {
        if (value.is_string_type ())
        {
            return std::string { value.get_string_type () };
        }
        if (value.is_array ())
        {
                std::string
            result;
            for (auto&& item: value.get_array ())
            {
                if (!result.empty ()) result += ", ";
                result += tao::json::to_string (item);
            }
            return result;
        }
        return tao::json::to_string (value);
    }

    // Throws fmt::format_error when the template does not fit the parameters.
        inline auto
    substitute (std::string_view pattern, const message_context_t& context)
        -> std::string
    {
            fmt::dynamic_format_arg_store <fmt::format_context>
        store;
        for (auto&& [name, value]: context.params)
        {
            store.push_back (fmt::arg (name.c_str (), display (value)));
        }
        return fmt::vformat (pattern, store);
    }

        inline auto
    try_substitute (std::string_view pattern, const message_context_t& context)
        -> std::optional <std::string>
    {
        // An empty template counts as no template.
        if (pattern.empty ()) return std::nullopt;
        try
        {
            return substitute (pattern, context);
        }
        catch (fmt::format_error const&)
        {
            return std::nullopt;
        }
    }

    // "/name/0", with the JSON pointer escapes.
        inline auto
    append_token (std::string path, std::string_view token)
        -> std::string
    {
        path += '/';
        for (auto c: token)
        {
            if      (c == '~') path += "~0";
            else if (c == '/') path += "~1";
            else               path += c;
        }
        return path;
    }
} // }}} namespace detail

// Catalog, then the rule's own template, then the built-in one. A template
// that does not format falls through to the next source.
    inline auto
render (const violation_t& violation, const render_options_t& options = {})
    -> std::string
{
        auto
    context = verity::context (violation);
    if (options.catalog)
    {
        if (
                auto
              pattern = options.catalog->lookup (context.id, options.locale, context)
        ){
            if (auto text = detail::try_substitute (*pattern, context)) return *text;
        }
    }
    if (violation.message ())
    {
        if (auto text = detail::try_substitute (*violation.message (), context)) return *text;
    }
    if (auto c = violation.get_if <custom_violation_t> ())
    {
        if (auto text = detail::try_substitute (c->message, context)) return *text;
        return context.id;
    }
    if (auto pattern = detail::default_template (context.id))
    {
        return detail::substitute (*pattern, context);
    }
    return context.id;
}

    using
rendered_t = std::vector <std::pair <std::string, std::vector <std::string>>>;

    namespace
detail // {{{
{
        inline void
    render_into (
          const errors_t& errors
        , const std::string& path
        , const render_options_t& options
        , rendered_t& out
    ){
        if (!errors.violations ().empty ())
        {
                std::vector <std::string>
            messages;
            for (auto&& v: errors.violations ())
            {
                messages.push_back (render (v, options));
            }
            out.emplace_back (path, std::move (messages));
        }
        for (auto&& [name, child]: errors.fields ())
        {
            render_into (child, append_token (path, name), options, out);
        }
        for (auto&& [index, child]: errors.items ())
        {
            render_into (child, append_token (path, std::to_string (index)), options, out);
        }
    }
} // }}} namespace detail

// Every node holding violations, depth first, keyed by JSON pointer ("" is
// the root).
    inline auto
render (const errors_t& errors, const render_options_t& options = {})
    -> rendered_t
{
        rendered_t
    out;
    detail::render_into (errors, "", options, out);
    return out;
}

// Serialisable form: {"errors": [...], "properties": {...}, "items": {...}}.
    inline auto
to_json (const errors_t& errors, const render_options_t& options = {})
    -> json_t
{
        json_t
    result = tao::json::empty_object;
    if (!errors.violations ().empty ())
    {
            json_t::array_t
        messages;
        for (auto&& v: errors.violations ())
        {
            messages.emplace_back (render (v, options));
        }
        result["errors"] = std::move (messages);
    }
    if (!errors.fields ().empty ())
    {
            json_t
        properties = tao::json::empty_object;
        for (auto&& [name, child]: errors.fields ())
        {
            properties[name] = to_json (child, options);
        }
        result["properties"] = std::move (properties);
    }
    if (!errors.items ().empty ())
    {
            json_t
        items = tao::json::empty_object;
        for (auto&& [index, child]: errors.items ())
        {
            items[std::to_string (index)] = to_json (child, options);
        }
        result["items"] = std::move (items);
    }
    return result;
}

    struct
flat_error_t
{
        std::string
    path;
        std::string
    message;
};

// One entry per violation, for error responses that want a flat list.
    inline auto
flatten (const errors_t& errors, const render_options_t& options = {})
    -> std::vector <flat_error_t>
{
        std::vector <flat_error_t>
    flat;
    for (auto&& [path, messages]: render (errors, options))
    {
        for (auto&& message: messages)
        {
            flat.push_back ({ path, message });
        }
    }
    return flat;
}

// Catalog read from a json document:
//
//     { "fr": { "max_length": "la longueur doit être `<= {max_length}`.",
//               "max_items": { "=0": "...", "one": "...", "other": "..." } } }
//
// Plural variants are keyed by exact count ("=N") or by the CLDR category of
// the locale, with "other" as the last resort.
    class
json_catalog_t
    : public catalog_t
{
        json_t
    document_m;
        std::map <std::string, std::unique_ptr <icu::PluralRules>, std::less <>>
    plural_rules_m;

        void
    check_document () const
    {
        if (!document_m.is_object ())
        {
            throw conversion_error { "Catalog document must be an object of locales." };
        }
        for (auto&& [locale, messages]: document_m.get_object ())
        {
            if (!messages.is_object ())
            {
                throw conversion_error { fmt::format (
                      "Catalog locale \"{}\" must map message ids to templates."
                    , locale
                )};
            }
            for (auto&& [id, entry]: messages.get_object ())
            {
                if (entry.is_string_type ()) continue;
                if (!entry.is_object ())
                {
                    throw conversion_error { fmt::format (
                          "Catalog entry \"{}\" of locale \"{}\" must be a template or an object of plural variants."
                        , id
                        , locale
                    )};
                }
                for (auto&& [key, variant]: entry.get_object ())
                {
                    if (!variant.is_string_type ())
                    {
                        throw conversion_error { fmt::format (
                              "Plural variant \"{}\" of catalog entry \"{}\" ({}) must be a string."
                            , key
                            , id
                            , locale
                        )};
                    }
                }
            }
        }
    }

    // The document locale serving a requested one: "fr-CA" falls back to "fr".
        auto
    resolve_locale (std::string_view locale) const
        -> std::optional <std::string>
    {
            std::string
        tag { locale };
        while (!tag.empty ())
        {
            if (document_m.find (tag)) return tag;
                auto
            dash = tag.find_last_of ("-_");
            if (dash == std::string::npos) break;
            tag.resize (dash);
        }
        return std::nullopt;
    }

        auto
    plural_category (std::string_view locale, double count) const
        -> std::string
    {
            auto
        it = plural_rules_m.find (locale);
        if (it == plural_rules_m.end () || !it->second)
        {
            return "other";
        }
            std::string
        category;
        it->second->select (count).toUTF8String (category);
        return category;
    }

public:
    explicit json_catalog_t (json_t document)
        : document_m { std::move (document) }
    {
        check_document ();
        for (auto&& [locale, messages]: document_m.get_object ())
        {
                UErrorCode
            status = U_ZERO_ERROR;
                std::unique_ptr <icu::PluralRules>
            rules { icu::PluralRules::forLocale (icu::Locale (locale.c_str ()), status) };
            if (U_FAILURE (status))
            {
                rules.reset ();
            }
            plural_rules_m.emplace (locale, std::move (rules));
        }
    }

        auto
    lookup (
          std::string_view message_id
        , std::string_view locale
        , const message_context_t& context
    ) const
        -> std::optional <std::string> override
    {
            auto
        tag = resolve_locale (locale);
        if (!tag) return std::nullopt;
            auto
        entry = document_m.at (*tag).find (std::string { message_id });
        if (!entry) return std::nullopt;
        if (entry->is_string_type ())
        {
            return std::string { entry->get_string_type () };
        }
            const json_t*
        count = context.count ? context.find (*context.count) : nullptr;
        if (count && count->is_number ())
        {
            if (auto exact = entry->find (fmt::format ("={}", count->as <double> ())))
            {
                return std::string { exact->get_string_type () };
            }
            if (auto variant = entry->find (plural_category (*tag, count->as <double> ())))
            {
                return std::string { variant->get_string_type () };
            }
        }
        if (auto other = entry->find ("other"))
        {
            return std::string { other->get_string_type () };
        }
        return std::nullopt;
    }
};

} // namespace verity
