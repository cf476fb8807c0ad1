//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include <pathmux/mux.hpp>
#include <pathmux/clean_path.hpp>
#include <pathmux/error.hpp>
#include <pathmux/method.hpp>
#include <pathmux/route_context.hpp>
#include <pathmux/detail/except.hpp>
#include "src/detail/pattern_scanner.hpp"
#include "src/detail/pct_decode.hpp"
#include "src/detail/route_tree.hpp"
#include <boost/assert.hpp>
#include <boost/stacktrace.hpp>
#include <boost/url/grammar/ci_string.hpp>
#include <boost/url/url.hpp>
#include <spdlog/spdlog.h>
#include <array>
#include <exception>
#include <memory>
#include <ostream>
#include <string>

namespace pathmux {

namespace {

// lower case the literal text, leaving token names alone
void
lower_literals(std::string& s) noexcept
{
    std::size_t i = 0;
    while(i < s.size())
    {
        if(detail::is_token_char(s[i]))
        {
            i += detail::token_size(
                std::string_view(s).substr(i));
            continue;
        }
        s[i] = grammar::to_lower(s[i]);
        ++i;
    }
}

std::string
describe(std::exception_ptr const& ep)
{
    try
    {
        std::rethrow_exception(ep);
    }
    catch(std::exception const& e)
    {
        return e.what();
    }
    catch(...)
    {
        return "unknown exception";
    }
}

} // (anon)

//------------------------------------------------

struct mux::impl
{
    std::vector<middleware> mw;
    route_handler options;
    route_handler method_not_allowed;
    route_handler not_found;
    error_handler on_error;
    panic_handler on_panic;
    std::shared_ptr<spdlog::logger> log;
    std::array<std::unique_ptr<
        detail::route_tree>, method_count> trees;
    bool allow_header = false;
    bool case_insensitive = false;
    bool trailing_slash = false;
    bool clean_path = false;

    detail::route_tree const*
    tree(method m) const noexcept
    {
        if(m == method::unknown)
            return nullptr;
        return trees[static_cast<
            std::size_t>(m)].get();
    }

    void invoke(route_handler const& h,
        route_context& ctx, request& req) const;
    void dispatch(route_context& ctx, request& req) const;
    bool try_redirect(detail::route_tree const& t,
        route_context& ctx, request& req) const;
    bool try_not_allowed(
        route_context& ctx, request& req) const;
};

void
mux::
impl::
invoke(
    route_handler const& h,
    route_context& ctx,
    request& req) const
{
    auto const rv = h(ctx, req);
    if(! rv.failed())
        return;
    log->warn("pathmux: {} {}: handler failed: {}",
        req.method_str(), req.path(), rv.message());
    on_error(ctx, req, rv);
}

void
mux::
impl::
dispatch(
    route_context& ctx,
    request& req) const
{
    auto& pv = req.values();
    pv.clear();
    auto const* t = tree(req.method());
    if(t)
    {
        auto const r = t->search(req.path(), pv);
        if(r.found)
        {
            invoke(*r.handler, ctx, req);
            return;
        }
        pv.clear();
        if(try_redirect(*t, ctx, req))
            return;
    }
    if(try_not_allowed(ctx, req))
        return;
    log->debug("pathmux: {} {}: no matching route",
        req.method_str(), req.path());
    invoke(not_found, ctx, req);
}

bool
mux::
impl::
try_redirect(
    detail::route_tree const& t,
    route_context& ctx,
    request& req) const
{
    auto const m = req.method();
    auto const path = req.path();
    if( m == method::connect ||
        path == "/")
        return false;
    if( ! case_insensitive &&
        ! clean_path &&
        ! trailing_slash)
        return false;

    // each step works on the output of the previous
    std::string s(path);
    if(case_insensitive)
        detail::to_lower_inplace(s);
    if(clean_path)
        s = pathmux::clean_path(s);
    if( trailing_slash &&
        s.size() > 1 &&
        s.back() == '/')
        s.pop_back();
    if(s == path)
        return false;

    auto& pv = req.values();
    auto const r = t.search(s, pv);
    pv.clear();
    if(! r.found)
        return false;

    urls::url u(req.url());
    u.set_path(s);
    auto const code =
        (m == method::get || m == method::head) ?
            status::moved_permanently :
            status::permanent_redirect;
    log->debug("pathmux: {} {}: redirecting to {}",
        req.method_str(), path,
        std::string_view(u.buffer()));
    redirect(ctx.res(), u.buffer(), code);
    return true;
}

bool
mux::
impl::
try_not_allowed(
    route_context& ctx,
    request& req) const
{
    auto const m = req.method();
    bool const answer_options =
        m == method::options &&
        static_cast<bool>(options);
    bool const want_allow =
        allow_header || answer_options;

    std::string allow;
    bool found = false;
    bool options_listed = false;
    auto& pv = req.values();
    for(std::size_t i = 0; i < method_count; ++i)
    {
        auto const mi = static_cast<method>(i);
        if( mi == m ||
            ! trees[i])
            continue;
        auto const r = trees[i]->search(req.path(), pv);
        pv.clear();
        if(! r.found)
            continue;
        found = true;
        if(! want_allow)
            break;
        if(! allow.empty())
            allow.append(", ");
        allow.append(to_string(mi));
        if(mi == method::options)
            options_listed = true;
    }
    if(! found)
        return false;

    if(options && ! options_listed)
        allow.append(", OPTIONS");
    if(answer_options)
    {
        ctx.res().set("Allow", allow);
        invoke(options, ctx, req);
        return true;
    }
    if(allow_header)
        ctx.res().set("Allow", allow);
    log->debug("pathmux: {} {}: method not allowed",
        req.method_str(), req.path());
    invoke(method_not_allowed, ctx, req);
    return true;
}

//------------------------------------------------

mux::
~mux()
{
    delete impl_;
}

mux::
mux(mux_options opt)
    : impl_(new impl)
{
    impl_->mw = std::move(opt.mw_);
    impl_->options = std::move(opt.options_);
    impl_->method_not_allowed = opt.method_not_allowed_ ?
        std::move(opt.method_not_allowed_) :
        default_method_not_allowed_handler();
    impl_->not_found = opt.not_found_ ?
        std::move(opt.not_found_) :
        default_not_found_handler();
    impl_->on_error = opt.error_ ?
        std::move(opt.error_) :
        default_error_handler();
    impl_->on_panic = std::move(opt.panic_);
    impl_->log = opt.log_ ?
        std::move(opt.log_) :
        spdlog::default_logger();
    impl_->allow_header = opt.allow_header_;
    impl_->case_insensitive = opt.case_insensitive_;
    impl_->trailing_slash = opt.trailing_slash_;
    impl_->clean_path = opt.clean_path_;
}

mux::
mux(mux&& other) noexcept
    : impl_(other.impl_)
{
    other.impl_ = nullptr;
}

mux&
mux::
operator=(mux&& other) noexcept
{
    auto p = impl_;
    impl_ = other.impl_;
    other.impl_ = nullptr;
    delete p;
    return *this;
}

//------------------------------------------------

std::string_view
mux::
try_handle(
    std::string_view verb,
    std::string_view pattern,
    route_handler h,
    std::vector<middleware> mw,
    system::error_code& ec)
{
    auto const m = string_to_method(verb);
    std::size_t tokens = 0;
    if(verb.empty())
        ec = error::empty_method;
    else if(m == method::unknown)
        ec = error::unknown_method;
    else if(pattern.empty())
        ec = error::empty_pattern;
    else if(pattern[0] != '/')
        ec = error::missing_leading_slash;
    else if(! h)
        ec = error::null_handler;
    else
        tokens = detail::scan_pattern(pattern, ec);
    if(ec.failed())
        return {};

    std::string key(pattern);
    if(impl_->case_insensitive)
        lower_literals(key);

    h = apply_middleware(std::move(h),
        mw.data(), mw.data() + mw.size());
    h = apply_middleware(std::move(h),
        impl_->mw.data(),
        impl_->mw.data() + impl_->mw.size());

    auto& t = impl_->trees[
        static_cast<std::size_t>(m)];
    if(! t)
        t = std::make_unique<detail::route_tree>();
    auto const other = t->insert(key, std::move(h), ec);
    if(ec.failed())
    {
        // an insert into a new tree only fails on
        // an empty key, which was rejected above
        BOOST_ASSERT(! t->empty());
        return other;
    }

    impl_->log->debug(
        "pathmux: registered {} {} ({} variables)",
        verb, pattern, tokens);
    return {};
}

void
mux::
handle_impl(
    std::string_view verb,
    std::string_view pattern,
    route_handler h,
    std::vector<middleware> mw)
{
    system::error_code ec;
    auto const other = try_handle(verb, pattern,
        std::move(h), std::move(mw), ec);
    if(ec == error::conflicting_token)
        detail::throw_system_error(ec,
            std::string(verb) + " '" +
            std::string(pattern) + "' conflicts with '" +
            std::string(other) + "'");
    if(ec.failed())
        detail::throw_system_error(ec,
            std::string(verb) + " '" +
            std::string(pattern) + "'");
}

void
mux::
handle(
    std::string_view verb,
    std::string_view pattern,
    route_handler h,
    system::error_code& ec)
{
    try_handle(verb, pattern,
        std::move(h), {}, ec);
}

//------------------------------------------------

lookup_result
mux::
lookup(
    std::string_view verb,
    std::string_view path,
    path_values& pv) const
{
    pv.clear();
    auto const* t = impl_->tree(
        string_to_method(verb));
    if(! t)
        return {};
    auto r = t->search(path, pv);
    if(! r.found)
        pv.clear();
    return r;
}

void
mux::
serve(
    request& req,
    response& res,
    std::stop_token st) const
{
    route_context ctx(res, std::move(st));
    if(! impl_->on_panic)
    {
        impl_->dispatch(ctx, req);
        return;
    }
    try
    {
        impl_->dispatch(ctx, req);
    }
    catch(...)
    {
        auto ep = std::current_exception();
        impl_->log->error(
            "pathmux: {} {}: recovered from exception: {}\n"
            "stack at the point of recovery:\n{}",
            req.method_str(), req.path(), describe(ep),
            boost::stacktrace::to_string(
                boost::stacktrace::stacktrace()));
        impl_->on_panic(ctx, req, ep);
    }
}

void
mux::
print_tree(std::ostream& os) const
{
    for(std::size_t i = 0; i < method_count; ++i)
    {
        auto const& t = impl_->trees[i];
        if(! t || t->empty())
            continue;
        os << '[' << static_cast<method>(i) << "]\n";
        t->print(os, 1);
    }
}

} // pathmux
