//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef PATHMUX_STATUS_HPP
#define PATHMUX_STATUS_HPP

#include <pathmux/detail/config.hpp>
#include <iosfwd>
#include <string_view>

namespace pathmux {

/** HTTP status codes produced by the router and its handlers.
*/
enum class status : unsigned short
{
    unknown                 = 0,

    ok                      = 200,
    created                 = 201,
    accepted                = 202,
    no_content              = 204,
    reset_content           = 205,

    multiple_choices        = 300,
    moved_permanently       = 301,
    found                   = 302,
    see_other               = 303,
    not_modified            = 304,
    use_proxy               = 305,
    temporary_redirect      = 307,
    permanent_redirect      = 308,

    bad_request             = 400,
    unauthorized            = 401,
    forbidden               = 403,
    not_found               = 404,
    method_not_allowed      = 405,

    internal_server_error   = 500,
    not_implemented         = 501,
    bad_gateway             = 502,
    service_unavailable     = 503,
    gateway_timeout         = 504
};

/** Return the integer value of a status code.
*/
constexpr
unsigned
to_status_int(status v) noexcept
{
    return static_cast<unsigned>(v);
}

/** Return the reason phrase for a status code.

    @return The phrase, such as "Not Found", or
    "Unknown Status" if the code is not listed
    in @ref status.
*/
PATHMUX_DECL
std::string_view
obsolete_reason(status v) noexcept;

/// Format the status code to an output stream.
PATHMUX_DECL
std::ostream&
operator<<(std::ostream& os, status v);

//------------------------------------------------

/** HTTP status code utilities.

    These helpers classify status codes for the
    response helpers and default handlers.

    @par Example
    @code
    if( statuses::is_redirect( 308 ) )
        res.set( "Location", target );
    @endcode

    @see status
*/
namespace statuses {

/** Check if a status code indicates an empty response body.

    Responses with these status codes must not include a
    message body:

    @li 204 No Content
    @li 205 Reset Content
    @li 304 Not Modified

    @param code The HTTP status code to check.
*/
PATHMUX_DECL
bool
is_empty(unsigned code) noexcept;

/** Check if a status code indicates a redirect.

    Returns `true` for 300, 301, 302, 303, 305, 307
    and 308. 304 Not Modified is not a redirect.

    @param code The HTTP status code to check.
*/
PATHMUX_DECL
bool
is_redirect(unsigned code) noexcept;

} // statuses

} // pathmux

#endif
