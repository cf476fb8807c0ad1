//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

// Test that header file is self-contained.
#include <pathmux/error.hpp>

#include "test_suite.hpp"
#include <cstring>

namespace pathmux {

struct error_test
{
    void
    check(error e)
    {
        auto const ec = make_error_code(e);
        BOOST_TEST_EQ(std::strcmp(
            ec.category().name(), "pathmux"), 0);
        BOOST_TEST(! ec.message().empty());
        BOOST_TEST(ec.failed());
        BOOST_TEST(&ec.category() ==
            &make_error_code(e).category());
    }

    void
    run()
    {
        check(error::empty_method);
        check(error::unknown_method);
        check(error::empty_pattern);
        check(error::missing_leading_slash);
        check(error::null_handler);
        check(error::unnamed_token);
        check(error::invalid_token_name);
        check(error::wildcard_not_last);
        check(error::token_not_segment);
        check(error::conflicting_token);
        check(error::duplicate_route);

        // implicit conversion
        system::error_code ec = error::duplicate_route;
        BOOST_TEST(ec == error::duplicate_route);
        BOOST_TEST(ec != error::conflicting_token);

        ec = error::success;
        BOOST_TEST(! ec.failed());
    }
};

TEST_SUITE(
    error_test,
    "pathmux.error");

} // pathmux
