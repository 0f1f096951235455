/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#pragma once
#ifndef GROVE_CONTENT_HPP
#define GROVE_CONTENT_HPP

#include "common.hpp"

#include <concepts>
#include <cstdint>
#include <string>
#include <string_view>

namespace grove {

/**
 * @brief Node content codec. `parse` turns raw text into a value, `value` yields the payload used for child lookups
 *        and path matching, and `serialize` (optional, defaults to `value`) turns it back into text accepted by `parse`.
 */
template< typename C >
concept NodeContent = requires( std::string_view raw
                              , C const& c )
{
    { C::parse( raw ) } -> std::same_as< Result< C > >;
    { c.value() } -> std::convertible_to< std::string const& >;
};

template< NodeContent C >
auto serialize( C const& content )
    -> std::string
{
    if constexpr( requires{ { content.serialize() } -> std::convertible_to< std::string >; } )
    {
        return content.serialize();
    }
    else
    {
        return std::string{ content.value() };
    }
}

/// Stores the content verbatim.
class RawContent
{
public:
    static auto parse( std::string_view const raw )
        -> Result< RawContent >;

    auto value() const
        -> std::string const&;

    auto operator==( RawContent const& ) const -> bool = default;

private:
    explicit RawContent( std::string_view const raw );

    std::string content_;
};

/**
 * @brief Content of the form "<weight>:<text>", where weight is an unsigned 32-bit integer.
 *
 * Only `text` takes part in child lookups. Whitespace around the weight is ignored; `text` is kept verbatim.
 */
class WeightedContent
{
public:
    static constexpr char separator = ':';

    static auto parse( std::string_view const raw )
        -> Result< WeightedContent >;

    auto value() const
        -> std::string const&;
    auto weight() const
        -> uint32_t;
    auto serialize() const
        -> std::string;

    auto operator==( WeightedContent const& ) const -> bool = default;

private:
    WeightedContent( uint32_t const weight
                   , std::string_view const text );

    uint32_t weight_ = {};
    std::string text_ = {};
};

} // namespace grove

#endif // GROVE_CONTENT_HPP
