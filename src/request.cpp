//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include <pathmux/request.hpp>
#include <pathmux/detail/except.hpp>
#include <boost/url/parse.hpp>
#include "src/detail/pct_decode.hpp"

namespace pathmux {

request::
request(
    std::string_view method,
    std::string_view target)
{
    assign(method, target);
}

void
request::
assign(
    std::string_view method,
    std::string_view target,
    system::error_code& ec)
{
    values_.clear();
    auto rv = urls::parse_uri_reference(target);
    if(! rv)
    {
        ec = rv.error();
        return;
    }
    url_ = *rv;
    verb_str_.assign(method.data(), method.size());
    verb_ = string_to_method(method);
    detail::pct_decode_path(
        url_.encoded_path(), path_);
    // absolute-form without a path
    if(path_.empty())
        path_ = "/";
    ec = {};
}

void
request::
assign(
    std::string_view method,
    std::string_view target)
{
    system::error_code ec;
    assign(method, target, ec);
    if(ec.failed())
        detail::throw_system_error(ec);
}

} // pathmux
