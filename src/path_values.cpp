//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include <pathmux/path_values.hpp>

namespace pathmux {

bool
path_values::
contains(
    std::string_view name) const noexcept
{
    for(auto const& e : v_)
        if(e.name == name)
            return true;
    return false;
}

std::string_view
path_values::
find(
    std::string_view name) const noexcept
{
    // newest binding wins
    for(auto it = v_.rbegin(); it != v_.rend(); ++it)
        if(it->name == name)
            return it->value;
    return {};
}

} // pathmux
