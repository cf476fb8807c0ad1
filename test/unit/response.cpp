//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

// Test that header file is self-contained.
#include <pathmux/response.hpp>

#include "test_suite.hpp"
#include <stdexcept>

namespace pathmux {

struct response_test
{
    void
    test_fields()
    {
        response res;
        BOOST_TEST(res.status() == status::ok);
        BOOST_TEST_EQ(res.status_int(), 200u);
        BOOST_TEST(res.fields().empty());

        res.set("Content-Type", "text/plain");
        BOOST_TEST(res.exists("content-type"));
        BOOST_TEST_EQ(res.value_or("CONTENT-TYPE", ""), "text/plain");
        BOOST_TEST_EQ(res.value_or("Allow", "none"), "none");

        // set replaces
        res.set("content-type", "text/html");
        BOOST_TEST_EQ(res.fields().size(), 1u);
        BOOST_TEST_EQ(res.value_or("Content-Type", ""), "text/html");

        BOOST_TEST_EQ(res.erase("Content-Type"), 1u);
        BOOST_TEST_EQ(res.erase("Content-Type"), 0u);
        BOOST_TEST(! res.exists("Content-Type"));

        res.set_status(status::not_found).set_body("gone");
        BOOST_TEST_EQ(res.status_int(), 404u);
        BOOST_TEST_EQ(res.body(), "gone");

        res.reset();
        BOOST_TEST(res.status() == status::ok);
        BOOST_TEST(res.body().empty());
        BOOST_TEST(res.fields().empty());
    }

    void
    test_redirect()
    {
        response res;
        redirect(res, "/login?next=%2F", status::found);
        BOOST_TEST(res.status() == status::found);
        BOOST_TEST_EQ(res.value_or("Location", ""), "/login?next=%2F");

        redirect(res, "/other", status::permanent_redirect);
        BOOST_TEST_EQ(res.status_int(), 308u);
        BOOST_TEST_EQ(res.value_or("Location", ""), "/other");

        BOOST_TEST_THROWS(
            redirect(res, "/x", status::not_modified),
            std::invalid_argument);
        BOOST_TEST_THROWS(
            redirect(res, "/x", status::ok),
            std::invalid_argument);
    }

    void
    test_respond_status()
    {
        response res;
        respond_status(res, status::not_found);
        BOOST_TEST_EQ(res.status_int(), 404u);
        BOOST_TEST_EQ(res.body(), "Not Found");
        BOOST_TEST_EQ(res.value_or("Content-Type", ""),
            "text/plain; charset=utf-8");

        // no body allowed
        respond_status(res, status::no_content);
        BOOST_TEST_EQ(res.status_int(), 204u);
        BOOST_TEST(res.body().empty());
        BOOST_TEST(! res.exists("Content-Type"));
    }

    void
    run()
    {
        test_fields();
        test_redirect();
        test_respond_status();
    }
};

TEST_SUITE(
    response_test,
    "pathmux.response");

} // pathmux
