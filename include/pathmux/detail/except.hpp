//
// Copyright (c) 2019 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef PATHMUX_DETAIL_EXCEPT_HPP
#define PATHMUX_DETAIL_EXCEPT_HPP

#include <pathmux/detail/config.hpp>
#include <boost/assert/source_location.hpp>
#include <boost/system/error_code.hpp>
#include <string>

namespace pathmux {
namespace detail {

PATHMUX_DECL BOOST_NORETURN void throw_invalid_argument(
    char const* what,
    boost::source_location const& loc = BOOST_CURRENT_LOCATION);

PATHMUX_DECL BOOST_NORETURN void throw_system_error(
    system::error_code const& ec,
    boost::source_location const& loc = BOOST_CURRENT_LOCATION);

PATHMUX_DECL BOOST_NORETURN void throw_system_error(
    system::error_code const& ec,
    std::string const& what,
    boost::source_location const& loc = BOOST_CURRENT_LOCATION);

} // detail
} // pathmux

#endif
