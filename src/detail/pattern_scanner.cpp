//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include "src/detail/pattern_scanner.hpp"
#include <pathmux/error.hpp>

namespace pathmux {
namespace detail {

std::size_t
scan_pattern(
    std::string_view pattern,
    system::error_code& ec)
{
    std::size_t count = 0;
    std::size_t i = 0;
    auto const n = pattern.size();
    while(i < n)
    {
        char const c = pattern[i];
        if(! is_token_char(c))
        {
            ++i;
            continue;
        }
        if(i == 0 || pattern[i - 1] != '/')
        {
            ec = error::token_not_segment;
            return 0;
        }

        // the name runs to the end of the segment
        auto const start = i + 1;
        auto end = pattern.find('/', start);
        if(end == std::string_view::npos)
            end = n;
        auto const name =
            pattern.substr(start, end - start);
        if(name.empty())
        {
            ec = error::unnamed_token;
            return 0;
        }
        if(name.find_first_of(":*") !=
            std::string_view::npos)
        {
            ec = error::invalid_token_name;
            return 0;
        }
        if(c == '*' && end != n)
        {
            ec = error::wildcard_not_last;
            return 0;
        }
        ++count;
        i = end;
    }
    ec = {};
    return count;
}

} // detail
} // pathmux
