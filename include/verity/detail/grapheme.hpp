#pragma once
#include <unicode/brkiter.h>
#include <unicode/locid.h>
#include <unicode/unistr.h>

#include <fmt/format.h>

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string_view>

    namespace
verity::detail
{
    inline auto
make_character_iterator ()
    -> std::unique_ptr <icu::BreakIterator>
{
        UErrorCode
    status = U_ZERO_ERROR;
        std::unique_ptr <icu::BreakIterator>
    iterator { icu::BreakIterator::createCharacterInstance (icu::Locale::getRoot (), status) };
    if (U_FAILURE (status) || !iterator)
    {
        throw std::runtime_error { fmt::format (
              "{}:{}: Could not create a grapheme break iterator: {}."
            , __FILE__
            , __LINE__
            , u_errorName (status)
        )};
    }
    return iterator;
}

// Number of extended grapheme clusters in a UTF-8 string. Ill-formed
// sequences count as one replacement character each.
    inline auto
grapheme_count (std::string_view text)
    -> std::size_t
{
    if (text.empty ()) return 0;
        thread_local std::unique_ptr <icu::BreakIterator>
    iterator = make_character_iterator ();
        auto
    unicode = icu::UnicodeString::fromUTF8 (
        icu::StringPiece (text.data (), static_cast <int32_t> (text.size ()))
    );
    iterator->setText (unicode);
        std::size_t
    count = 0;
    for (
          auto boundary = iterator->next ()
        ; boundary != icu::BreakIterator::DONE
        ; boundary = iterator->next ()
    ){
        ++count;
    }
    return count;
}

} // namespace verity::detail
