//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef PATHMUX_ROUTE_CONTEXT_HPP
#define PATHMUX_ROUTE_CONTEXT_HPP

#include <pathmux/detail/config.hpp>
#include <pathmux/response.hpp>
#include <stop_token>

namespace pathmux {

/** Per-request state passed to route handlers.

    A context is created on the stack by @ref mux::serve
    for each request and destroyed when the call returns.
    It borrows the response sink and the stop token given
    by the caller, handlers must not keep references to
    it beyond their own invocation.
*/
class route_context
{
public:
    route_context(
        response& res,
        std::stop_token st = {}) noexcept
        : res_(&res)
        , st_(std::move(st))
    {
    }

    route_context(route_context const&) = delete;
    route_context& operator=(route_context const&) = delete;

    /// Return the response being built.
    response&
    res() const noexcept
    {
        return *res_;
    }

    /** Return the stop token for the request.

        The router forwards this token without
        inspecting it.
    */
    std::stop_token const&
    stop_token() const noexcept
    {
        return st_;
    }

    /// Return true if cancellation was requested.
    bool
    stop_requested() const noexcept
    {
        return st_.stop_requested();
    }

private:
    response* res_;
    std::stop_token st_;
};

} // pathmux

#endif
