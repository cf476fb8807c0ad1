//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include <pathmux/status.hpp>
#include <ostream>

namespace pathmux {

std::string_view
obsolete_reason(status v) noexcept
{
    switch(v)
    {
    case status::ok:                    return "OK";
    case status::created:               return "Created";
    case status::accepted:              return "Accepted";
    case status::no_content:            return "No Content";
    case status::reset_content:         return "Reset Content";

    case status::multiple_choices:      return "Multiple Choices";
    case status::moved_permanently:     return "Moved Permanently";
    case status::found:                 return "Found";
    case status::see_other:             return "See Other";
    case status::not_modified:          return "Not Modified";
    case status::use_proxy:             return "Use Proxy";
    case status::temporary_redirect:    return "Temporary Redirect";
    case status::permanent_redirect:    return "Permanent Redirect";

    case status::bad_request:           return "Bad Request";
    case status::unauthorized:          return "Unauthorized";
    case status::forbidden:             return "Forbidden";
    case status::not_found:             return "Not Found";
    case status::method_not_allowed:    return "Method Not Allowed";

    case status::internal_server_error: return "Internal Server Error";
    case status::not_implemented:       return "Not Implemented";
    case status::bad_gateway:           return "Bad Gateway";
    case status::service_unavailable:   return "Service Unavailable";
    case status::gateway_timeout:       return "Gateway Timeout";

    default:
        break;
    }
    return "Unknown Status";
}

std::ostream&
operator<<(std::ostream& os, status v)
{
    return os << to_status_int(v);
}

//------------------------------------------------

namespace statuses {

bool
is_empty( unsigned code ) noexcept
{
    switch( code )
    {
    case 204: // No Content
    case 205: // Reset Content
    case 304: // Not Modified
        return true;
    default:
        return false;
    }
}

bool
is_redirect( unsigned code ) noexcept
{
    switch( code )
    {
    case 300: // Multiple Choices
    case 301: // Moved Permanently
    case 302: // Found
    case 303: // See Other
    case 305: // Use Proxy
    case 307: // Temporary Redirect
    case 308: // Permanent Redirect
        return true;
    default:
        return false;
    }
}

} // statuses

} // pathmux
