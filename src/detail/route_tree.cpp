//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#include "src/detail/route_tree.hpp"
#include "src/detail/pattern_scanner.hpp"
#include <pathmux/error.hpp>
#include <boost/assert.hpp>
#include <algorithm>
#include <ostream>

namespace pathmux {
namespace detail {

namespace {

std::size_t
common_prefix(
    std::string_view a,
    std::string_view b) noexcept
{
    auto const n = (std::min)(a.size(), b.size());
    std::size_t i = 0;
    while(i < n && a[i] == b[i])
        ++i;
    return i;
}

// length of the literal run at the front of s
std::size_t
literal_size(std::string_view s) noexcept
{
    auto const n = s.find_first_of(":*");
    if(n == std::string_view::npos)
        return s.size();
    return n;
}

} // (anon)

//------------------------------------------------

auto
route_tree::
edge_set::
find(unsigned char label) const noexcept ->
    node*
{
    auto it = std::lower_bound(
        v_.begin(), v_.end(), label,
        [](edge const& e, unsigned char c)
        {
            return e.label < c;
        });
    if(it != v_.end() && it->label == label)
        return it->child.get();
    return nullptr;
}

auto
route_tree::
edge_set::
add(std::unique_ptr<node> child) ->
    node&
{
    auto const label = static_cast<
        unsigned char>(child->key[0]);
    auto it = std::lower_bound(
        v_.begin(), v_.end(), label,
        [](edge const& e, unsigned char c)
        {
            return e.label < c;
        });
    BOOST_ASSERT(it == v_.end() || it->label != label);
    auto& n = *child;
    v_.insert(it, edge{ label, std::move(child) });
    return n;
}

//------------------------------------------------

std::string_view
route_tree::
insert(
    std::string_view pattern,
    route_handler h,
    system::error_code& ec)
{
    if(pattern.empty())
    {
        ec = error::empty_pattern;
        return {};
    }

    node* cur = &root_;
    auto key = pattern;
    while(! key.empty())
    {
        node* child = cur->edges.find(
            static_cast<unsigned char>(key[0]));
        if(! child)
        {
            cur = &append_chain(*cur, key);
            key = {};
            break;
        }

        if(child->param)
        {
            // tokens must be identical
            auto const n = token_size(key);
            if(key.substr(0, n) != child->key)
            {
                ec = error::conflicting_token;
                return first_route(*child);
            }
            key.remove_prefix(n);
            cur = child;
            continue;
        }

        auto const n = common_prefix(key, child->key);
        if(n < child->key.size())
            split(*child, n);
        key.remove_prefix(n);
        cur = child;
    }

    if(cur->leaf)
    {
        ec = error::duplicate_route;
        return cur->route;
    }
    cur->leaf = true;
    cur->handler = std::move(h);
    cur->route.assign(pattern.data(), pattern.size());
    ec = {};
    return cur->route;
}

auto
route_tree::
append_chain(
    node& parent,
    std::string_view key) ->
        node&
{
    node* cur = &parent;
    while(! key.empty())
    {
        auto p = std::make_unique<node>();
        std::size_t n;
        if(is_token_char(key[0]))
        {
            n = token_size(key);
            p->param = true;
        }
        else
        {
            n = literal_size(key);
        }
        p->key.assign(key.data(), n);
        key.remove_prefix(n);
        cur = &cur->edges.add(std::move(p));
    }
    return *cur;
}

void
route_tree::
split(node& n, std::size_t at)
{
    BOOST_ASSERT(at > 0 && at < n.key.size());
    auto rest = std::make_unique<node>();
    rest->key = n.key.substr(at);
    rest->route = std::move(n.route);
    rest->handler = std::move(n.handler);
    rest->edges = std::move(n.edges);
    rest->leaf = n.leaf;

    n.key.resize(at);
    n.route.clear();
    n.handler = nullptr;
    n.edges = edge_set();
    n.leaf = false;
    n.edges.add(std::move(rest));
}

std::string_view
route_tree::
first_route(node const& n) noexcept
{
    if(n.leaf)
        return n.route;
    for(auto const& e : n.edges)
    {
        auto s = first_route(*e.child);
        if(! s.empty())
            return s;
    }
    return {};
}

//------------------------------------------------

lookup_result
route_tree::
search(
    std::string_view path,
    path_values& pv) const
{
    lookup_result r;
    node const* cur = &root_;
    std::size_t i = 0;
    auto const n = path.size();
    while(i < n)
    {
        // literal
        node const* child = cur->edges.find(
            static_cast<unsigned char>(path[i]));
        if( child &&
            ! child->param &&
            path.substr(i).starts_with(child->key))
        {
            i += child->key.size();
            cur = child;
            continue;
        }

        // variable
        child = cur->edges.find(':');
        if(child)
        {
            auto end = path.find('/', i);
            if(end == std::string_view::npos)
                end = n;
            if(end > i)
            {
                pv.set(
                    std::string_view(child->key).substr(1),
                    path.substr(i, end - i));
                i = end;
                cur = child;
                continue;
            }
        }

        // wildcard, from the preceding '/'
        child = cur->edges.find('*');
        if(child && i > 0)
        {
            pv.set(
                std::string_view(child->key).substr(1),
                path.substr(i - 1));
            r.handler = &child->handler;
            r.route = child->route;
            r.found = true;
            return r;
        }
        return r;
    }

    if(cur->leaf)
    {
        r.handler = &cur->handler;
        r.route = cur->route;
        r.found = true;
        return r;
    }

    // "/path/" matches "/path/*rest" with "/"
    node const* child = cur->edges.find('*');
    if( child &&
        n > 0 &&
        path.back() == '/')
    {
        pv.set(
            std::string_view(child->key).substr(1),
            path.substr(n - 1));
        r.handler = &child->handler;
        r.route = child->route;
        r.found = true;
    }
    return r;
}

//------------------------------------------------

void
route_tree::
print(
    std::ostream& os,
    std::size_t depth) const
{
    for(auto const& e : root_.edges)
        print_node(os, *e.child, depth);
}

void
route_tree::
print_node(
    std::ostream& os,
    node const& n,
    std::size_t depth)
{
    os << std::string(depth * 2, ' ') <<
        '[' << n.key << ']';
    if(n.leaf)
        os << " -> " << n.route;
    os << '\n';
    for(auto const& e : n.edges)
        print_node(os, *e.child, depth + 1);
}

} // detail
} // pathmux
