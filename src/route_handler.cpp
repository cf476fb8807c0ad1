//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include <pathmux/route_handler.hpp>

namespace pathmux {

route_handler
apply_middleware(
    route_handler h,
    middleware const* first,
    middleware const* last)
{
    while(last != first)
    {
        --last;
        if(*last)
            h = (*last)(std::move(h));
    }
    return h;
}

} // pathmux
