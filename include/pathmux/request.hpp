//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef PATHMUX_REQUEST_HPP
#define PATHMUX_REQUEST_HPP

#include <pathmux/detail/config.hpp>
#include <pathmux/method.hpp>
#include <pathmux/path_values.hpp>
#include <boost/system/error_code.hpp>
#include <boost/url/url.hpp>
#include <boost/url/url_view.hpp>
#include <string>
#include <string_view>

namespace pathmux {

/** The routing view of an HTTP request.

    This holds the parts of a request the router
    needs: the method, the request target, the
    percent-decoded path used for matching, and the
    values bound to path variables by the matched
    route.

    Objects may be reused for successive requests by
    calling @ref assign, which keeps previously
    allocated storage.

    @par Example
    @code
    request req( "GET", "/users/42?fields=name" );
    res.reset();
    m.serve( req, res );
    @endcode
*/
class PATHMUX_DECL request
{
public:
    /** Constructor

        The request is empty, its method is
        @ref method::unknown and its path is "/".
    */
    request() = default;

    /** Constructor

        @throws system::system_error The target
        is not a valid request target.
    */
    request(
        std::string_view method,
        std::string_view target);

    request(request const&) = delete;
    request& operator=(request const&) = delete;

    /** Set the method and target.

        Any previously bound path values are cleared.

        @param method The request method token.

        @param target The request target, in origin
        form ("/path?query") or absolute form.

        @param ec Set to the error if the target
        cannot be parsed.
    */
    void
    assign(
        std::string_view method,
        std::string_view target,
        system::error_code& ec);

    /** Set the method and target.

        @throws system::system_error The target
        is not a valid request target.
    */
    void
    assign(
        std::string_view method,
        std::string_view target);

    /// Return the method.
    pathmux::method
    method() const noexcept
    {
        return verb_;
    }

    /// Return the method token as received.
    std::string_view
    method_str() const noexcept
    {
        return verb_str_;
    }

    /// Return the parsed request target.
    urls::url_view
    url() const noexcept
    {
        return url_;
    }

    /** Return the path used for matching.

        Percent-escapes are decoded, except those
        for '/' and '\' which are kept encoded.
    */
    std::string_view
    path() const noexcept
    {
        return path_;
    }

    /// Return the values bound to path variables.
    path_values&
    values() noexcept
    {
        return values_;
    }

    /// Return the values bound to path variables.
    path_values const&
    values() const noexcept
    {
        return values_;
    }

    /** Return the value of a path variable.

        @return The value, or an empty string if no
        variable with this name was bound.
    */
    std::string_view
    path_value(
        std::string_view name) const noexcept
    {
        return values_.find(name);
    }

private:
    std::string verb_str_;
    urls::url url_;
    std::string path_ = "/";
    path_values values_;
    pathmux::method verb_ = pathmux::method::unknown;
};

} // pathmux

#endif
