//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include <pathmux/error.hpp>

namespace pathmux {

namespace detail {

const char*
error_cat_type::
name() const noexcept
{
    return "pathmux";
}

std::string
error_cat_type::
message(int code) const
{
    return message(code, nullptr, 0);
}

char const*
error_cat_type::
message(
    int code,
    char*,
    std::size_t) const noexcept
{
    switch(static_cast<error>(code))
    {
    case error::success: return "success";
    case error::empty_method: return "method cannot be empty";
    case error::unknown_method: return "method is not a valid HTTP method";
    case error::empty_pattern: return "cannot register an empty path";
    case error::missing_leading_slash: return "path does not begin with '/'";
    case error::null_handler: return "handler cannot be empty";
    case error::unnamed_token: return "path variable has no name";
    case error::invalid_token_name: return "path variable names cannot contain ':' or '*'";
    case error::wildcard_not_last: return "wildcard must be set at the end of the path";
    case error::token_not_segment: return "path variable must begin a path segment";
    case error::conflicting_token: return "only one path variable can be registered per segment";
    case error::duplicate_route: return "route has previously been registered";
    default:
        return "Unknown";
    }
}

// msvc 14.0 has a bug that warns about inability
// to use constexpr construction here, even though
// there's no constexpr construction
#if defined(_MSC_VER) && _MSC_VER <= 1900
# pragma warning( push )
# pragma warning( disable : 4592 )
#endif

#if defined(__cpp_constinit) && __cpp_constinit >= 201907L
constinit error_cat_type error_cat;
#else
error_cat_type error_cat;
#endif

#if defined(_MSC_VER) && _MSC_VER <= 1900
# pragma warning( pop )
#endif

} // detail

} // pathmux
