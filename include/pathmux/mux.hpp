//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef PATHMUX_MUX_HPP
#define PATHMUX_MUX_HPP

#include <pathmux/detail/config.hpp>
#include <pathmux/mux_options.hpp>
#include <pathmux/path_values.hpp>
#include <pathmux/request.hpp>
#include <pathmux/response.hpp>
#include <pathmux/route_context.hpp>
#include <pathmux/route_handler.hpp>
#include <boost/system/error_code.hpp>
#include <iosfwd>
#include <stop_token>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace pathmux {

/** A request router with one prefix tree per method.

    Routes are registered with a method, a pattern and
    a handler. A pattern is a path which may contain
    variables and a trailing wildcard:

    @code
    /users/:id          // :id matches one path segment
    /static/*filepath   // *filepath matches the rest
    @endcode

    Each variable must occupy a whole segment. A
    literal segment and a variable may share a parent,
    in which case the literal is tried first.

    All routes must be registered before requests
    are served. After that, @ref serve and @ref lookup
    may be called concurrently.

    @par Example
    @code
    mux m( mux_options::defaults() );
    m.get( "/users/:id",
        []( route_context& ctx, request& req ) -> route_result
        {
            ctx.res().set_body( std::string( req.path_value( "id" ) ) );
            return {};
        });

    request req( "GET", "/users/42" );
    response res;
    m.serve( req, res );
    @endcode
*/
class mux
{
public:
    /// Destructor
    PATHMUX_DECL
    ~mux();

    /** Constructor

        @param opt The options for the mux.
    */
    PATHMUX_DECL
    explicit
    mux(mux_options opt = {});

    /** Constructor

        The moved-from object may only be
        destroyed or assigned to.
    */
    PATHMUX_DECL
    mux(mux&& other) noexcept;

    /// Assignment
    PATHMUX_DECL
    mux&
    operator=(mux&& other) noexcept;

    mux(mux const&) = delete;
    mux& operator=(mux const&) = delete;

    /** Register a route.

        The handler is wrapped by the given middleware,
        the first one outermost, and then by the global
        middleware in the options.

        @param method The method token, such as "GET".

        @param pattern The route pattern, beginning
        with '/'.

        @param h The handler.

        @param mn Zero or more @ref middleware.

        @throws system::system_error The method is empty
        or not recognized, the pattern is malformed or
        conflicts with a registered route, or the
        handler is empty.
    */
    template<class... MN>
    void
    handle(
        std::string_view method,
        std::string_view pattern,
        route_handler h,
        MN&&... mn)
    {
        static_assert(
            (std::is_convertible_v<MN, middleware> && ...),
            "each argument must be convertible to middleware");
        handle_impl(method, pattern, std::move(h),
            std::vector<middleware>{
                middleware(std::forward<MN>(mn))... });
    }

    /** Register a route.

        This function behaves like the throwing
        overload, except that failures are reported
        through `ec` and leave the mux unchanged.
        Middleware may be applied to `h` with
        @ref middleware_stack.

        @param method The method token, such as "GET".

        @param pattern The route pattern, beginning
        with '/'.

        @param h The handler.

        @param ec Set to the error, if any.
    */
    PATHMUX_DECL
    void
    handle(
        std::string_view method,
        std::string_view pattern,
        route_handler h,
        system::error_code& ec);

    /// Register a GET route.
    template<class... MN>
    void
    get(std::string_view pattern,
        route_handler h, MN&&... mn)
    {
        handle("GET", pattern, std::move(h),
            std::forward<MN>(mn)...);
    }

    /// Register a HEAD route.
    template<class... MN>
    void
    head(std::string_view pattern,
        route_handler h, MN&&... mn)
    {
        handle("HEAD", pattern, std::move(h),
            std::forward<MN>(mn)...);
    }

    /// Register a POST route.
    template<class... MN>
    void
    post(std::string_view pattern,
        route_handler h, MN&&... mn)
    {
        handle("POST", pattern, std::move(h),
            std::forward<MN>(mn)...);
    }

    /// Register a PUT route.
    template<class... MN>
    void
    put(std::string_view pattern,
        route_handler h, MN&&... mn)
    {
        handle("PUT", pattern, std::move(h),
            std::forward<MN>(mn)...);
    }

    /// Register a PATCH route.
    template<class... MN>
    void
    patch(std::string_view pattern,
        route_handler h, MN&&... mn)
    {
        handle("PATCH", pattern, std::move(h),
            std::forward<MN>(mn)...);
    }

    /// Register a DELETE route.
    template<class... MN>
    void
    del(std::string_view pattern,
        route_handler h, MN&&... mn)
    {
        handle("DELETE", pattern, std::move(h),
            std::forward<MN>(mn)...);
    }

    /// Register an OPTIONS route.
    template<class... MN>
    void
    options(std::string_view pattern,
        route_handler h, MN&&... mn)
    {
        handle("OPTIONS", pattern, std::move(h),
            std::forward<MN>(mn)...);
    }

    /** Find the route for a method and path.

        No redirects or fallbacks are attempted.

        @param method The method token.

        @param path The decoded request path.

        @param pv Receives the values of the path
        variables. It is cleared first, and left
        empty if no route matches.

        @return The result. The handler pointer and
        the names in `pv` remain valid until the mux
        is modified or destroyed.
    */
    PATHMUX_DECL
    lookup_result
    lookup(
        std::string_view method,
        std::string_view path,
        path_values& pv) const;

    /** Dispatch a request.

        The matching handler is invoked. Otherwise the
        request is redirected, or answered by the
        options, method not allowed or not found
        handler, depending on the options.

        @param req The request. Its path values are
        replaced with those of the matched route.

        @param res The response to build.

        @param st A stop token made available to
        handlers through the @ref route_context.

        @throws Any exception thrown by a handler,
        if no panic handler is configured.
    */
    PATHMUX_DECL
    void
    serve(
        request& req,
        response& res,
        std::stop_token st = {}) const;

    /** Write the routing trees to a stream.

        Each method is followed by its tree, one node
        per line indented by depth. Nodes which end a
        route show the route.
    */
    PATHMUX_DECL
    void
    print_tree(std::ostream& os) const;

private:
    struct impl;

    // returns the route in conflict, if any
    PATHMUX_DECL
    std::string_view
    try_handle(
        std::string_view method,
        std::string_view pattern,
        route_handler h,
        std::vector<middleware> mw,
        system::error_code& ec);

    PATHMUX_DECL
    void
    handle_impl(
        std::string_view method,
        std::string_view pattern,
        route_handler h,
        std::vector<middleware> mw);

    impl* impl_;
};

} // pathmux

#endif
