//
// Copyright (c) 2019 Vinnie Falco (vinnie.falco@gmail.com)
// Copyright (c) 2025 Mohammad Nejati
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef PATHMUX_DETAIL_CONFIG_HPP
#define PATHMUX_DETAIL_CONFIG_HPP

#include <boost/config.hpp>
#include <stdint.h>

namespace pathmux {

//------------------------------------------------

# if (defined(PATHMUX_DYN_LINK) || defined(BOOST_ALL_DYN_LINK)) && !defined(PATHMUX_STATIC_LINK)
#  if defined(PATHMUX_SOURCE)
#   define PATHMUX_DECL        BOOST_SYMBOL_EXPORT
#   define PATHMUX_BUILD_DLL
#  else
#   define PATHMUX_DECL        BOOST_SYMBOL_IMPORT
#  endif
# endif // shared lib

# ifndef  PATHMUX_DECL
#  define PATHMUX_DECL
# endif

#if defined(__MINGW32__)
    #define PATHMUX_SYMBOL_VISIBLE PATHMUX_DECL
#else
    #define PATHMUX_SYMBOL_VISIBLE BOOST_SYMBOL_VISIBLE
#endif

} // pathmux

// lift the Boost libraries we build on into our namespace
namespace boost {
namespace system {}
namespace urls {
namespace grammar {}
}
} // boost

namespace pathmux {
namespace system = ::boost::system;
namespace urls = ::boost::urls;
namespace grammar = ::boost::urls::grammar;
} // pathmux

#endif
