//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

// Test that header file is self-contained.
#include <pathmux/route_handler.hpp>

#include <pathmux/request.hpp>
#include <pathmux/route_context.hpp>
#include "test_suite.hpp"
#include <string>

namespace pathmux {

struct route_handler_test
{
    // appends its tag before calling the next handler
    static
    middleware
    trace(std::string& log, char tag)
    {
        return [&log, tag](route_handler next) -> route_handler
        {
            return [&log, tag, next](
                route_context& ctx, request& req) -> route_result
            {
                log.push_back(tag);
                return next(ctx, req);
            };
        };
    }

    void
    test_order()
    {
        std::string log;
        route_handler h =
            [&log](route_context&, request&) -> route_result
            {
                log.push_back('h');
                return {};
            };

        response res;
        route_context ctx(res);
        request req("GET", "/");

        auto h0 = middleware_stack(h);
        BOOST_TEST(! h0(ctx, req).failed());
        BOOST_TEST_EQ(log, "h");

        // the first middleware runs first
        log.clear();
        auto h3 = middleware_stack(h,
            trace(log, '1'), trace(log, '2'), trace(log, '3'));
        BOOST_TEST(! h3(ctx, req).failed());
        BOOST_TEST_EQ(log, "123h");

        // empty middleware are skipped
        log.clear();
        auto h2 = middleware_stack(h,
            trace(log, '1'), middleware(), trace(log, '2'));
        BOOST_TEST(! h2(ctx, req).failed());
        BOOST_TEST_EQ(log, "12h");
    }

    void
    test_short_circuit()
    {
        bool called = false;
        route_handler h =
            [&called](route_context&, request&) -> route_result
            {
                called = true;
                return {};
            };
        middleware deny =
            [](route_handler) -> route_handler
            {
                return [](route_context& ctx, request&) -> route_result
                {
                    ctx.res().set_status(status::forbidden);
                    return {};
                };
            };

        response res;
        route_context ctx(res);
        request req("GET", "/");
        auto hs = middleware_stack(h, deny);
        BOOST_TEST(! hs(ctx, req).failed());
        BOOST_TEST(! called);
        BOOST_TEST(res.status() == status::forbidden);
    }

    void
    test_context()
    {
        response res;
        std::stop_source src;
        route_context ctx(res, src.get_token());
        BOOST_TEST(&ctx.res() == &res);
        BOOST_TEST(! ctx.stop_requested());
        src.request_stop();
        BOOST_TEST(ctx.stop_requested());
        BOOST_TEST(ctx.stop_token().stop_requested());

        route_context ctx2(res);
        BOOST_TEST(! ctx2.stop_token().stop_possible());
    }

    void
    run()
    {
        test_order();
        test_short_circuit();
        test_context();
    }
};

TEST_SUITE(
    route_handler_test,
    "pathmux.route_handler");

} // pathmux
