//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef PATHMUX_RESPONSE_HPP
#define PATHMUX_RESPONSE_HPP

#include <pathmux/detail/config.hpp>
#include <pathmux/status.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pathmux {

/** The response sink passed to route handlers.

    This collects the status, header fields and body
    produced while a request is dispatched. Writing
    the response to a connection is left to the host
    server.

    Field names are compared case-insensitively.
*/
class PATHMUX_DECL response
{
public:
    /// A header field
    struct field
    {
        std::string name;
        std::string value;
    };

    response() = default;

    /// Return the status code. The default is 200.
    pathmux::status
    status() const noexcept
    {
        return status_;
    }

    /// Return the status code as an integer.
    unsigned
    status_int() const noexcept
    {
        return to_status_int(status_);
    }

    /// Set the status code.
    response&
    set_status(pathmux::status v) noexcept
    {
        status_ = v;
        return *this;
    }

    /** Set a header field, replacing any existing value.
    */
    response&
    set(
        std::string_view name,
        std::string_view value);

    /** Remove every field with the given name.

        @return The number of fields removed.
    */
    std::size_t
    erase(
        std::string_view name) noexcept;

    /// Return true if a field with the name exists.
    bool
    exists(
        std::string_view name) const noexcept;

    /** Return the value of a field.

        @return The value, or `s` if the field
        does not exist.
    */
    std::string_view
    value_or(
        std::string_view name,
        std::string_view s) const noexcept;

    /// Return all header fields in insertion order.
    std::vector<field> const&
    fields() const noexcept
    {
        return fields_;
    }

    /// Return the body.
    std::string const&
    body() const noexcept
    {
        return body_;
    }

    /// Set the body.
    response&
    set_body(std::string s)
    {
        body_ = std::move(s);
        return *this;
    }

    /** Clear the response for reuse.

        The status returns to 200 and all fields
        and the body are removed.
    */
    void
    reset() noexcept;

private:
    std::vector<field> fields_;
    std::string body_;
    pathmux::status status_ = pathmux::status::ok;
};

/** Prepare a redirect response.

    Sets the status code and the `Location` field.

    @param res The response to modify.

    @param location The value of the `Location` field.

    @param code The redirect status code.

    @throws std::invalid_argument `code` is not
    a redirect status code.
*/
PATHMUX_DECL
void
redirect(
    response& res,
    std::string_view location,
    status code);

/** Prepare a plain text response for a status code.

    The body is the reason phrase of the status code,
    unless the status code forbids a body.
*/
PATHMUX_DECL
void
respond_status(
    response& res,
    status code);

} // pathmux

#endif
