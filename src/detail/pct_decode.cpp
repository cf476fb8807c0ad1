//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include "src/detail/pct_decode.hpp"
#include <boost/url/grammar/ci_string.hpp>
#include <boost/url/grammar/hexdig_chars.hpp>

namespace pathmux {
namespace detail {

void
pct_decode_path(
    urls::pct_string_view s,
    std::string& dest)
{
    dest.clear();
    std::string_view sv(s.data(), s.size());
    dest.reserve(sv.size());
    auto it = sv.data();
    auto const end = it + sv.size();
    while(it != end)
    {
        if(*it != '%')
        {
            dest.push_back(*it++);
            continue;
        }
        // pct_string_view can never
        // have invalid pct-encodings
        ++it;
        auto d0 = grammar::hexdig_value(*it++);
        auto d1 = grammar::hexdig_value(*it++);
        char c = static_cast<char>(d0 * 16 + d1);
        if( c != '/' &&
            c != '\\')
        {
            dest.push_back(c);
            continue;
        }
        // keep the escape so a decoded
        // slash cannot start a new segment
        dest.append(it - 3, 3);
    }
}

void
to_lower_inplace(
    std::string& s) noexcept
{
    for(auto& c : s)
        c = grammar::to_lower(c);
}

} // detail
} // pathmux
