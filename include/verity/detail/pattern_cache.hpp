#pragma once
#include "../error.hpp"

#include <fmt/format.h>

#include <memory>
#include <mutex>
#include <regex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

    namespace
verity::detail
{
// Process-wide, compile-once cache of patterns. Compiled expressions are
// never touched after publication; two threads meeting a new pattern at the
// same time may both compile it, the first one to publish wins.
    class
pattern_cache_t
{
        std::shared_mutex
    mutex_m;
        std::unordered_map <std::string, std::shared_ptr <const std::regex>>
    patterns_m;

public:
        auto
    get (const std::string& pattern)
        -> std::shared_ptr <const std::regex>
    {
        {
                std::shared_lock
            lock { mutex_m };
            if (
                    auto
                  it = patterns_m.find (pattern)
                ; it != patterns_m.end ()
            ){
                return it->second;
            }
        }
            std::shared_ptr <const std::regex>
        compiled;
        try
        {
            compiled = std::make_shared <const std::regex> (pattern, std::regex::ECMAScript);
        }
        catch (std::regex_error const& e)
        {
            throw configuration_error { fmt::format (
                  "{}:{}: Invalid pattern \"{}\": {}."
                , __FILE__
                , __LINE__
                , pattern
                , e.what ()
            )};
        }
            std::unique_lock
        lock { mutex_m };
        return patterns_m.emplace (pattern, std::move (compiled)).first->second;
    }

        auto
    size ()
        -> std::size_t
    {
            std::shared_lock
        lock { mutex_m };
        return patterns_m.size ();
    }
};

    inline auto
pattern_cache ()
    -> pattern_cache_t&
{
        static pattern_cache_t
    cache;
    return cache;
}

} // namespace verity::detail
