//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef PATHMUX_DETAIL_PCT_DECODE_HPP
#define PATHMUX_DETAIL_PCT_DECODE_HPP

#include <pathmux/detail/config.hpp>
#include <boost/url/pct_string_view.hpp>
#include <string>
#include <string_view>

namespace pathmux {
namespace detail {

// decode all percent escapes except slashes '/' and '\'
// into dest, replacing its contents
PATHMUX_DECL
void
pct_decode_path(
    urls::pct_string_view s,
    std::string& dest);

// lower-case the ASCII letters in s
PATHMUX_DECL
void
to_lower_inplace(
    std::string& s) noexcept;

} // detail
} // pathmux

#endif
