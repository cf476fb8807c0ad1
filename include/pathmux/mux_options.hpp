//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef PATHMUX_MUX_OPTIONS_HPP
#define PATHMUX_MUX_OPTIONS_HPP

#include <pathmux/detail/config.hpp>
#include <pathmux/route_handler.hpp>
#include <spdlog/fwd.h>
#include <memory>
#include <utility>
#include <vector>

namespace pathmux {

class mux;

/** Return a handler which responds 404 Not Found.

    The response has a `text/plain` body holding
    the reason phrase.
*/
PATHMUX_DECL
route_handler
default_not_found_handler();

/** Return a handler which responds 405 Method Not Allowed.

    Any `Allow` field already set by the router
    is left in place.
*/
PATHMUX_DECL
route_handler
default_method_not_allowed_handler();

/** Return a handler which responds 500 Internal Server Error.
*/
PATHMUX_DECL
error_handler
default_error_handler();

/** Return a handler which responds 500 Internal Server Error.

    Any fields or body written before the exception
    was thrown are discarded.
*/
PATHMUX_DECL
panic_handler
default_panic_handler();

//------------------------------------------------

/** Configuration options for @ref mux.

    Options are set with chained calls and are fixed
    once the mux is constructed.

    @par Example
    @code
    mux m( mux_options()
        .set_allow_header( true )
        .redirect_trailing_slash( true )
        .on_panic( default_panic_handler() ) );
    @endcode
*/
class mux_options
{
public:
    /** Constructor

        No redirects are enabled, the `Allow` header
        is not set and exceptions thrown by handlers
        propagate to the caller of @ref mux::serve.
        The not found, method not allowed and error
        handlers are the defaults.
    */
    PATHMUX_DECL
    mux_options();

    /** Return options with the common features enabled.

        This is equivalent to:
        @code
        mux_options()
            .set_allow_header( true )
            .redirect_clean_path( true )
            .redirect_trailing_slash( true )
            .on_panic( default_panic_handler() );
        @endcode
    */
    PATHMUX_DECL
    static
    mux_options
    defaults();

    /** Set whether 405 responses carry an `Allow` field.

        @return A reference to `*this` for chaining.
    */
    mux_options&
    set_allow_header(bool value) noexcept
    {
        allow_header_ = value;
        return *this;
    }

    /** Set whether routing ignores the case of literal text.

        When enabled, literal text in patterns is lower
        cased at registration, and requests whose path
        does not match are redirected to the lower case
        path if that matches. Variable names keep their
        case.

        @return A reference to `*this` for chaining.
    */
    mux_options&
    case_insensitive(bool value) noexcept
    {
        case_insensitive_ = value;
        return *this;
    }

    /** Set whether to redirect paths with a trailing slash.

        A request for "/foo/" which does not match is
        redirected to "/foo" if that matches.

        @return A reference to `*this` for chaining.
    */
    mux_options&
    redirect_trailing_slash(bool value) noexcept
    {
        trailing_slash_ = value;
        return *this;
    }

    /** Set whether to redirect unclean paths.

        A request path which does not match is cleaned
        with @ref clean_path and redirected if the clean
        path matches.

        @return A reference to `*this` for chaining.
    */
    mux_options&
    redirect_clean_path(bool value) noexcept
    {
        clean_path_ = value;
        return *this;
    }

    /** Add middleware applied to every route.

        Global middleware wraps the per-route middleware,
        and runs in the order it was added.

        @return A reference to `*this` for chaining.
    */
    mux_options&
    use(middleware mw)
    {
        mw_.push_back(std::move(mw));
        return *this;
    }

    /** Set the handler for exceptions thrown by handlers.

        An empty function disables the handler, and
        exceptions propagate to the caller.

        @return A reference to `*this` for chaining.
    */
    mux_options&
    on_panic(panic_handler h)
    {
        panic_ = std::move(h);
        return *this;
    }

    /** Set the handler for OPTIONS requests.

        The handler is invoked for an OPTIONS request
        whose path matches no OPTIONS route but matches
        a route of another method. The `Allow` field is
        set before it runs.

        @return A reference to `*this` for chaining.
    */
    mux_options&
    on_options(route_handler h)
    {
        options_ = std::move(h);
        return *this;
    }

    /// Set the handler for 405 responses.
    mux_options&
    on_method_not_allowed(route_handler h)
    {
        method_not_allowed_ = std::move(h);
        return *this;
    }

    /// Set the handler for 404 responses.
    mux_options&
    on_not_found(route_handler h)
    {
        not_found_ = std::move(h);
        return *this;
    }

    /// Set the handler for failures returned by handlers.
    mux_options&
    on_error(error_handler h)
    {
        error_ = std::move(h);
        return *this;
    }

    /** Set the logger.

        The default is `spdlog::default_logger()`.
    */
    mux_options&
    logger(std::shared_ptr<spdlog::logger> p) noexcept
    {
        log_ = std::move(p);
        return *this;
    }

private:
    friend class mux;

    std::vector<middleware> mw_;
    route_handler options_;
    route_handler method_not_allowed_;
    route_handler not_found_;
    error_handler error_;
    panic_handler panic_;
    std::shared_ptr<spdlog::logger> log_;
    bool allow_header_ = false;
    bool case_insensitive_ = false;
    bool trailing_slash_ = false;
    bool clean_path_ = false;
};

} // pathmux

#endif
