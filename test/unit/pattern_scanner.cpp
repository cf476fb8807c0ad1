//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

// Test that header file is self-contained.
#include "src/detail/pattern_scanner.hpp"

#include <pathmux/error.hpp>
#include "test_suite.hpp"
#include <string>

namespace pathmux {
namespace detail {

struct pattern_scanner_test
{
    void
    ok(std::string_view s, std::size_t n)
    {
        system::error_code ec;
        BOOST_TEST_EQ(scan_pattern(s, ec), n);
        BOOST_TEST(! ec.failed());
    }

    void
    bad(std::string_view s, error e)
    {
        system::error_code ec;
        BOOST_TEST_EQ(scan_pattern(s, ec), 0u);
        BOOST_TEST(ec == e);
    }

    void
    test_valid()
    {
        ok("/", 0);
        ok("/users/list", 0);
        ok("/:path", 1);
        ok("/:path/", 1);
        ok("/a/:b/:c/:d", 3);
        ok("/home/:sub/:path", 2);
        ok("/path/*wildcard", 1);
        ok("/foo/:bar/*wildcard", 2);
        ok("/files/:name.json", 1);

        std::string many;
        for(int i = 0; i < 128; ++i)
            many += "/:path";
        ok(many, 128);
    }

    void
    test_invalid()
    {
        bad("/bad/:", error::unnamed_token);
        bad("/bad/:/x", error::unnamed_token);
        bad("/*", error::unnamed_token);
        bad("/bad/:pa:ram", error::invalid_token_name);
        bad("/bad/:ram:", error::invalid_token_name);
        bad("/bad/:asdf*", error::invalid_token_name);
        bad("/path/*ff*", error::invalid_token_name);
        bad("/*path/bar", error::wildcard_not_last);
        bad("/*path/", error::wildcard_not_last);
        bad("/a:b", error::token_not_segment);
        bad("/files/img*rest", error::token_not_segment);
        bad(":path", error::token_not_segment);
    }

    void
    test_token_size()
    {
        BOOST_TEST_EQ(token_size(":id"), 3u);
        BOOST_TEST_EQ(token_size(":id/rest"), 3u);
        BOOST_TEST_EQ(token_size("*rest"), 5u);
        BOOST_TEST(is_token_char(':'));
        BOOST_TEST(is_token_char('*'));
        BOOST_TEST(! is_token_char('/'));
    }

    void
    run()
    {
        test_valid();
        test_invalid();
        test_token_size();
    }
};

TEST_SUITE(
    pattern_scanner_test,
    "pathmux.detail.pattern_scanner");

} // detail
} // pathmux
