//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

// Test that header file is self-contained.
#include <pathmux/clean_path.hpp>

#include "test_suite.hpp"
#include <string>

namespace pathmux {

struct clean_path_test
{
    void
    check(
        std::string_view s,
        std::string_view want)
    {
        BOOST_TEST_EQ(clean_path(s), want);
        // idempotent
        BOOST_TEST_EQ(clean_path(want), want);
    }

    void
    test_clean()
    {
        // already clean
        check("/", "/");
        check("/abc", "/abc");
        check("/a/b/c", "/a/b/c");
        check("/abc/", "/abc/");
        check("/a/b/c/", "/a/b/c/");

        // missing root
        check("", "/");
        check("a/", "/a/");
        check("abc", "/abc");
        check("abc/def", "/abc/def");
        check("a/b/c", "/a/b/c");

        // doubled slashes
        check("//", "/");
        check("/abc//", "/abc/");
        check("/abc/def//", "/abc/def/");
        check("/a/b/c//", "/a/b/c/");
        check("/abc//def//ghi", "/abc/def/ghi");
        check("//abc", "/abc");
        check("///abc", "/abc");
        check("//abc//", "/abc/");

        // "." elements
        check(".", "/");
        check("./", "/");
        check("/abc/./def", "/abc/def");
        check("/./abc/def", "/abc/def");
        check("/abc/.", "/abc/");

        // ".." elements
        check("..", "/");
        check("../", "/");
        check("../../", "/");
        check("../..", "/");
        check("../../abc", "/abc");
        check("/abc/def/ghi/../jkl", "/abc/def/jkl");
        check("/abc/def/../ghi/../jkl", "/abc/jkl");
        check("/abc/def/..", "/abc");
        check("/abc/def/../..", "/");
        check("/abc/def/../../..", "/");
        check("/abc/def/../../../ghi/jkl/../../../mno", "/mno");

        // combinations
        check("abc/./../def", "/def");
        check("abc//./../def", "/def");
        check("abc/../../././../def", "/def");
    }

    void
    test_long()
    {
        for(std::size_t i = 1; i <= 1234; ++i)
        {
            std::string const ss(i, 'a');
            std::string const want = "/" + ss;
            check(want, want);
            check(ss, want);
            check("//" + ss, want);
            check("/" + ss + "/b/..", want);
        }
    }

    void
    run()
    {
        test_clean();
        test_long();
    }
};

TEST_SUITE(
    clean_path_test,
    "pathmux.clean_path");

} // pathmux
