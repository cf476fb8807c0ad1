//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef PATHMUX_CLEAN_PATH_HPP
#define PATHMUX_CLEAN_PATH_HPP

#include <pathmux/detail/config.hpp>
#include <string>
#include <string_view>

namespace pathmux {

/** Return the canonical form of a URL path.

    The following rules are applied until no further
    processing can be done:

    @li An empty path becomes "/".
    @li A missing leading slash is added.
    @li Multiple slashes are replaced by a single slash.
    @li Each "." element is eliminated.
    @li Each ".." element is eliminated along with the
        element before it, if any. A ".." at the root
        is eliminated.

    A trailing slash is preserved, and a final "."
    element leaves a trailing slash in its place.

    @par Example
    @code
    assert( clean_path( "abc/../../././../def" ) == "/def" );
    assert( clean_path( "/abc/." ) == "/abc/" );
    @endcode
*/
PATHMUX_DECL
std::string
clean_path(std::string_view s);

} // pathmux

#endif
