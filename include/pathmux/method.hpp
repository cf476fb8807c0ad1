//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef PATHMUX_METHOD_HPP
#define PATHMUX_METHOD_HPP

#include <pathmux/detail/config.hpp>
#include <cstddef>
#include <iosfwd>
#include <string_view>

namespace pathmux {

/** HTTP request methods accepted by the router.

    Only the methods defined in RFC 9110 and
    RFC 5789 (PATCH) may be used to register
    routes. Requests carrying any other method
    token have the method @ref method::unknown
    and are never dispatched to a route.

    The enumerators are declared in the order
    used when listing methods in an `Allow`
    header.
*/
enum class method : unsigned char
{
    get = 0,
    head,
    post,
    put,
    patch,
    delete_,
    connect,
    options,
    trace,

    /// Any other method token
    unknown
};

/// The number of known methods
constexpr std::size_t method_count =
    static_cast<std::size_t>(method::unknown);

/** Return the method for a method token.

    The comparison is case-sensitive, method
    tokens are upper case.

    @return The method, or @ref method::unknown.
*/
PATHMUX_DECL
method
string_to_method(
    std::string_view s) noexcept;

/** Return the method token for a method.

    @return The token, or an empty string for
    @ref method::unknown.
*/
PATHMUX_DECL
std::string_view
to_string(method m) noexcept;

/// Format the method token to an output stream.
PATHMUX_DECL
std::ostream&
operator<<(std::ostream& os, method m);

} // pathmux

#endif
