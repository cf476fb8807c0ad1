//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

// Test that header file is self-contained.
#include <pathmux/method.hpp>

#include "test_suite.hpp"
#include <sstream>

namespace pathmux {

struct method_test
{
    void
    check(method m, std::string_view s)
    {
        BOOST_TEST(string_to_method(s) == m);
        BOOST_TEST_EQ(to_string(m), s);

        std::stringstream ss;
        ss << m;
        BOOST_TEST_EQ(ss.str(), s);
    }

    void
    run()
    {
        check(method::get,      "GET");
        check(method::head,     "HEAD");
        check(method::post,     "POST");
        check(method::put,      "PUT");
        check(method::patch,    "PATCH");
        check(method::delete_,  "DELETE");
        check(method::connect,  "CONNECT");
        check(method::options,  "OPTIONS");
        check(method::trace,    "TRACE");

        // tokens are case-sensitive
        BOOST_TEST(string_to_method("get") == method::unknown);
        BOOST_TEST(string_to_method("") == method::unknown);
        BOOST_TEST(string_to_method("PANDA") == method::unknown);
        BOOST_TEST(string_to_method("GETS") == method::unknown);
        BOOST_TEST(string_to_method("PURGE") == method::unknown);

        BOOST_TEST(to_string(method::unknown).empty());
        BOOST_TEST_EQ(method_count, 9u);
    }
};

TEST_SUITE(
    method_test,
    "pathmux.method");

} // pathmux
