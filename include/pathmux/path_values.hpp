//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef PATHMUX_PATH_VALUES_HPP
#define PATHMUX_PATH_VALUES_HPP

#include <pathmux/detail/config.hpp>
#include <cstddef>
#include <string_view>
#include <vector>

namespace pathmux {

/** The values bound to the path variables of a matched route.

    A route pattern such as "/users/:id/*rest" declares
    the variables `id` and `rest`. When a request path
    matches the route, the router appends one entry per
    variable to this container.

    Both the names and the values are views. Names refer
    to storage owned by the router, values refer to the
    path that was searched. The container must not be
    used after either of them is destroyed or modified.

    The container keeps its capacity across calls to
    @ref clear, so reusing one object for successive
    requests avoids allocating on the request path.

    @par Example
    @code
    path_values pv;
    auto r = m.lookup( "GET", "/users/42", pv );
    if( r.found )
        assert( pv.find( "id" ) == "42" );
    @endcode
*/
class PATHMUX_DECL path_values
{
public:
    /// A bound path variable
    struct value_type
    {
        std::string_view name;
        std::string_view value;
    };

    using const_iterator =
        std::vector<value_type>::const_iterator;

    path_values() = default;

    /// Return the number of bound variables.
    std::size_t
    size() const noexcept
    {
        return v_.size();
    }

    /// Return true if no variables are bound.
    bool
    empty() const noexcept
    {
        return v_.empty();
    }

    const_iterator
    begin() const noexcept
    {
        return v_.begin();
    }

    const_iterator
    end() const noexcept
    {
        return v_.end();
    }

    /** Remove all entries.

        Capacity is retained.
    */
    void
    clear() noexcept
    {
        v_.clear();
    }

    /** Bind a value to a name.

        A later binding for the same name hides
        any earlier one.
    */
    void
    set(
        std::string_view name,
        std::string_view value)
    {
        v_.push_back({ name, value });
    }

    /** Return true if a value is bound to the name.
    */
    bool
    contains(
        std::string_view name) const noexcept;

    /** Return the value bound to the name.

        The lookup is an exact, case-sensitive
        comparison of the name.

        @return The most recently bound value, or an
        empty string if the name is not bound.
    */
    std::string_view
    find(
        std::string_view name) const noexcept;

private:
    std::vector<value_type> v_;
};

} // pathmux

#endif
