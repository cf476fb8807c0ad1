//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef PATHMUX_HPP
#define PATHMUX_HPP

#include <pathmux/clean_path.hpp>
#include <pathmux/error.hpp>
#include <pathmux/method.hpp>
#include <pathmux/mux.hpp>
#include <pathmux/mux_options.hpp>
#include <pathmux/path_values.hpp>
#include <pathmux/request.hpp>
#include <pathmux/response.hpp>
#include <pathmux/route_context.hpp>
#include <pathmux/route_handler.hpp>
#include <pathmux/status.hpp>

#endif
