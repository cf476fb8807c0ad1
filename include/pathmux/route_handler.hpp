//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef PATHMUX_ROUTE_HANDLER_HPP
#define PATHMUX_ROUTE_HANDLER_HPP

#include <pathmux/detail/config.hpp>
#include <boost/system/error_code.hpp>
#include <exception>
#include <functional>
#include <string_view>
#include <type_traits>
#include <utility>

namespace pathmux {

class request;
class route_context;

/** The result type returned by a route handler.

    A handler which completes normally returns a
    default-constructed value. A failing value is
    logged by the router and passed to the error
    handler, which prepares the response.
*/
using route_result = system::error_code;

/** A function which handles a matched request.

    The handler is invoked with this equivalent
    signature:
    @code
    route_result( route_context&, request& );
    @endcode

    Handlers may throw. Exceptions are caught by the
    router only when a panic handler is configured.
*/
using route_handler = std::function<
    route_result(route_context&, request&)>;

/** A function which wraps a handler in another handler.

    Middleware receives the next handler in the chain
    and returns a handler that usually calls it.
*/
using middleware = std::function<
    route_handler(route_handler)>;

/** A function invoked when a handler throws.

    The handler receives the exception that was
    caught and prepares the response.
*/
using panic_handler = std::function<
    void(route_context&, request&, std::exception_ptr)>;

/** A function invoked when a handler returns a failure.
*/
using error_handler = std::function<
    void(route_context&, request&, system::error_code)>;

/** The outcome of a route lookup.
*/
struct lookup_result
{
    /** The matched handler, or `nullptr`.

        The pointer refers to storage owned by
        the router.
    */
    route_handler const* handler = nullptr;

    /// The pattern the handler was registered with.
    std::string_view route;

    /// True if a route matched.
    bool found = false;
};

/** Apply middleware to a handler.

    The middleware are applied in reverse so that
    the first one listed is the outermost: it runs
    first when the returned handler is invoked.

    @param h The innermost handler.

    @param first The first of the middleware to apply.

    @param last One past the last of the middleware
    to apply.
*/
PATHMUX_DECL
route_handler
apply_middleware(
    route_handler h,
    middleware const* first,
    middleware const* last);

/** Apply middleware to a handler.

    @par Example
    @code
    auto h = middleware_stack(
        hello, log_requests, require_auth );
    // runs log_requests, then require_auth, then hello
    @endcode

    @param h The innermost handler.

    @param mn The middleware, outermost first.
*/
template<class... MN>
route_handler
middleware_stack(
    route_handler h,
    MN&&... mn)
{
    static_assert(
        (std::is_convertible_v<MN, middleware> && ...),
        "each argument must be convertible to middleware");
    if constexpr(sizeof...(MN) == 0)
    {
        return h;
    }
    else
    {
        middleware const v[] = {
            middleware(std::forward<MN>(mn))... };
        return apply_middleware(
            std::move(h), v, v + sizeof...(MN));
    }
}

} // pathmux

#endif
