//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef PATHMUX_IMPL_ERROR_HPP
#define PATHMUX_IMPL_ERROR_HPP

#include <boost/system/error_category.hpp>
#include <boost/system/is_error_code_enum.hpp>
#include <string>
#include <system_error>
#include <type_traits>

namespace boost {
namespace system {

template<>
struct is_error_code_enum<
    ::pathmux::error>
{
    static bool const value = true;
};

} // system
} // boost

namespace std {
template<>
struct is_error_code_enum<
    ::pathmux::error>
    : std::true_type {};
} // std

namespace pathmux {

namespace detail {

struct PATHMUX_SYMBOL_VISIBLE
    error_cat_type
    : system::error_category
{
    PATHMUX_DECL const char* name(
        ) const noexcept override;
    PATHMUX_DECL std::string message(
        int) const override;
    PATHMUX_DECL char const* message(
        int, char*, std::size_t
            ) const noexcept override;
    BOOST_SYSTEM_CONSTEXPR error_cat_type()
        : error_category(0x8c2a4d1e93b05f71)
    {
    }
};

PATHMUX_DECL extern
    error_cat_type error_cat;

} // detail

inline
BOOST_SYSTEM_CONSTEXPR
system::error_code
make_error_code(
    error ev) noexcept
{
    return system::error_code{
        static_cast<std::underlying_type<
            error>::type>(ev),
        detail::error_cat};
}

} // pathmux

#endif
