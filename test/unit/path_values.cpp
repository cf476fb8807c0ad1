//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

// Test that header file is self-contained.
#include <pathmux/path_values.hpp>

#include "test_suite.hpp"

namespace pathmux {

struct path_values_test
{
    void
    run()
    {
        path_values pv;
        BOOST_TEST(pv.empty());
        BOOST_TEST_EQ(pv.size(), 0u);
        BOOST_TEST(pv.find("id").empty());
        BOOST_TEST(! pv.contains("id"));

        pv.set("id", "42");
        pv.set("rest", "/a/b");
        BOOST_TEST_EQ(pv.size(), 2u);
        BOOST_TEST(pv.contains("id"));
        BOOST_TEST_EQ(pv.find("id"), "42");
        BOOST_TEST_EQ(pv.find("rest"), "/a/b");

        // names are case-sensitive
        BOOST_TEST(! pv.contains("ID"));
        BOOST_TEST(pv.find("ID").empty());

        // newest binding wins
        pv.set("id", "43");
        BOOST_TEST_EQ(pv.find("id"), "43");

        std::size_t n = 0;
        for(auto const& v : pv)
        {
            BOOST_TEST(! v.name.empty());
            ++n;
        }
        BOOST_TEST_EQ(n, 3u);

        pv.clear();
        BOOST_TEST(pv.empty());
        BOOST_TEST(pv.find("id").empty());
    }
};

TEST_SUITE(
    path_values_test,
    "pathmux.path_values");

} // pathmux
