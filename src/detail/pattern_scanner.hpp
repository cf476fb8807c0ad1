//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef PATHMUX_DETAIL_PATTERN_SCANNER_HPP
#define PATHMUX_DETAIL_PATTERN_SCANNER_HPP

#include <pathmux/detail/config.hpp>
#include <boost/system/error_code.hpp>
#include <cstddef>
#include <string_view>

namespace pathmux {
namespace detail {

// Validate the tokens of a route pattern.
//
// A variable ":name" or wildcard "*name" must start a
// segment and have a non-empty name free of ':' and '*'.
// A variable name ends at the next '/', a wildcard name
// at the end of the pattern.
//
// Returns the number of tokens, or 0 with ec set.
PATHMUX_DECL
std::size_t
scan_pattern(
    std::string_view pattern,
    system::error_code& ec);

// Return the length of the token starting at s[0],
// which must be ':' or '*'.
inline
std::size_t
token_size(std::string_view s) noexcept
{
    if(s[0] == '*')
        return s.size();
    auto const n = s.find('/');
    if(n == std::string_view::npos)
        return s.size();
    return n;
}

inline
bool
is_token_char(char c) noexcept
{
    return c == ':' || c == '*';
}

} // detail
} // pathmux

#endif
