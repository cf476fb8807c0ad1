//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include <pathmux/clean_path.hpp>

namespace pathmux {

std::string
clean_path(std::string_view s)
{
    std::string dest;
    dest.reserve(s.size() + 2);
    dest.push_back('/');
    if(s.empty())
        return dest;

    bool trailing =
        s.size() > 1 && s.back() == '/';

    std::size_t pos = 0;
    while(pos < s.size())
    {
        auto end = s.find('/', pos);
        if(end == std::string_view::npos)
            end = s.size();
        auto const seg = s.substr(pos, end - pos);
        pos = end + 1;

        if(seg.empty())
            continue;
        if(seg == ".")
        {
            if(end == s.size())
                trailing = true;
            continue;
        }
        if(seg == "..")
        {
            // never above the root
            if(dest.size() > 1)
                dest.resize(dest.rfind('/') > 0 ?
                    dest.rfind('/') : 1);
            continue;
        }
        if(dest.size() > 1)
            dest.push_back('/');
        dest.append(seg.data(), seg.size());
    }

    if(trailing && dest.size() > 1)
        dest.push_back('/');
    return dest;
}

} // pathmux
