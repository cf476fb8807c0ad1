//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include <pathmux/response.hpp>
#include <pathmux/detail/except.hpp>
#include <boost/url/grammar/ci_string.hpp>
#include <algorithm>

namespace pathmux {

response&
response::
set(
    std::string_view name,
    std::string_view value)
{
    erase(name);
    fields_.push_back({
        std::string(name),
        std::string(value) });
    return *this;
}

std::size_t
response::
erase(
    std::string_view name) noexcept
{
    auto const n = fields_.size();
    fields_.erase(
        std::remove_if(
            fields_.begin(), fields_.end(),
            [name](field const& f)
            {
                return grammar::ci_is_equal(
                    f.name, name);
            }),
        fields_.end());
    return n - fields_.size();
}

bool
response::
exists(
    std::string_view name) const noexcept
{
    for(auto const& f : fields_)
        if(grammar::ci_is_equal(f.name, name))
            return true;
    return false;
}

std::string_view
response::
value_or(
    std::string_view name,
    std::string_view s) const noexcept
{
    for(auto const& f : fields_)
        if(grammar::ci_is_equal(f.name, name))
            return f.value;
    return s;
}

void
response::
reset() noexcept
{
    fields_.clear();
    body_.clear();
    status_ = pathmux::status::ok;
}

//------------------------------------------------

void
redirect(
    response& res,
    std::string_view location,
    status code)
{
    if(! statuses::is_redirect(
            to_status_int(code)))
        detail::throw_invalid_argument(
            "not a redirect status");
    res.set_status(code);
    res.set("Location", location);
}

void
respond_status(
    response& res,
    status code)
{
    res.set_status(code);
    if(statuses::is_empty(
            to_status_int(code)))
    {
        res.erase("Content-Type");
        res.set_body({});
        return;
    }
    res.set("Content-Type",
        "text/plain; charset=utf-8");
    res.set_body(std::string(
        obsolete_reason(code)));
}

} // pathmux
