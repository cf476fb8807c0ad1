//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include <pathmux/mux_options.hpp>
#include <pathmux/request.hpp>
#include <pathmux/response.hpp>
#include <pathmux/route_context.hpp>
#include <spdlog/spdlog.h>

namespace pathmux {

route_handler
default_not_found_handler()
{
    return [](route_context& ctx, request&) -> route_result
    {
        respond_status(ctx.res(), status::not_found);
        return {};
    };
}

route_handler
default_method_not_allowed_handler()
{
    return [](route_context& ctx, request&) -> route_result
    {
        respond_status(ctx.res(),
            status::method_not_allowed);
        return {};
    };
}

error_handler
default_error_handler()
{
    return [](route_context& ctx, request&,
        system::error_code)
    {
        respond_status(ctx.res(),
            status::internal_server_error);
    };
}

panic_handler
default_panic_handler()
{
    return [](route_context& ctx, request&,
        std::exception_ptr)
    {
        ctx.res().reset();
        respond_status(ctx.res(),
            status::internal_server_error);
    };
}

//------------------------------------------------

mux_options::
mux_options()
    : method_not_allowed_(
        default_method_not_allowed_handler())
    , not_found_(default_not_found_handler())
    , error_(default_error_handler())
    , log_(spdlog::default_logger())
{
}

mux_options
mux_options::
defaults()
{
    return mux_options()
        .set_allow_header(true)
        .redirect_clean_path(true)
        .redirect_trailing_slash(true)
        .on_panic(default_panic_handler());
}

} // pathmux
