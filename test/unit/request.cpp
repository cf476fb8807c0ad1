//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

// Test that header file is self-contained.
#include <pathmux/request.hpp>

#include <boost/system/system_error.hpp>
#include "test_suite.hpp"

namespace pathmux {

struct request_test
{
    void
    test_default()
    {
        request req;
        BOOST_TEST(req.method() == method::unknown);
        BOOST_TEST(req.method_str().empty());
        BOOST_TEST_EQ(req.path(), "/");
        BOOST_TEST(req.values().empty());
    }

    void
    test_assign()
    {
        request req("GET", "/users/42?fields=name");
        BOOST_TEST(req.method() == method::get);
        BOOST_TEST_EQ(req.method_str(), "GET");
        BOOST_TEST_EQ(req.path(), "/users/42");
        BOOST_TEST_EQ(req.url().query(), "fields=name");

        // percent-escapes are decoded
        req.assign("POST", "/caf%C3%A9/a%20b");
        BOOST_TEST(req.method() == method::post);
        BOOST_TEST_EQ(req.path(), "/caf\xc3\xa9/a b");

        // except slashes
        req.assign("GET", "/files/a%2Fb");
        BOOST_TEST_EQ(req.path(), "/files/a%2Fb");
        req.assign("GET", "/files/a%5cb");
        BOOST_TEST_EQ(req.path(), "/files/a%5cb");

        // absolute-form
        req.assign("GET", "http://example.com");
        BOOST_TEST_EQ(req.path(), "/");
        req.assign("GET", "http://example.com/x/y");
        BOOST_TEST_EQ(req.path(), "/x/y");

        // unrecognized methods are kept
        req.assign("PURGE", "/");
        BOOST_TEST(req.method() == method::unknown);
        BOOST_TEST_EQ(req.method_str(), "PURGE");
    }

    void
    test_values()
    {
        request req("GET", "/");
        req.values().set("id", "7");
        BOOST_TEST_EQ(req.path_value("id"), "7");
        BOOST_TEST(req.path_value("other").empty());

        // assign clears the values
        req.assign("GET", "/x");
        BOOST_TEST(req.values().empty());
    }

    void
    test_errors()
    {
        request req;
        system::error_code ec;
        req.assign("GET", "/a b", ec);
        BOOST_TEST(ec.failed());

        BOOST_TEST_THROWS(
            request("GET", "/%zz"),
            system::system_error);
    }

    void
    run()
    {
        test_default();
        test_assign();
        test_values();
        test_errors();
    }
};

TEST_SUITE(
    request_test,
    "pathmux.request");

} // pathmux
