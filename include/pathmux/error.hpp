//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef PATHMUX_ERROR_HPP
#define PATHMUX_ERROR_HPP

#include <pathmux/detail/config.hpp>
#include <boost/system/error_code.hpp>

namespace pathmux {

/** Error codes returned when registering routes.

    Every value describes a configuration error: a
    route that can never be served correctly. These
    are detected when the route is added, never while
    a request is being dispatched.
*/
enum class error
{
    /// Not an error
    success = 0,

    /// The method string is empty.
    empty_method,

    /// The method is not a recognized HTTP method token.
    unknown_method,

    /// The route pattern is empty.
    empty_pattern,

    /// The route pattern does not begin with '/'.
    missing_leading_slash,

    /// The route handler is empty.
    null_handler,

    /// A ':' or '*' is not followed by a name.
    unnamed_token,

    /// A token name contains ':' or '*'.
    invalid_token_name,

    /// Something follows a wildcard token.
    wildcard_not_last,

    /// A token does not begin a path segment.
    token_not_segment,

    /** Two different tokens start at the same position.

        For example "/a/:x" and "/a/:y".
    */
    conflicting_token,

    /// The route was already registered.
    duplicate_route
};

} // pathmux

#include <pathmux/impl/error.hpp>

#endif
