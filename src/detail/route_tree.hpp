//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/http
//

#ifndef PATHMUX_DETAIL_ROUTE_TREE_HPP
#define PATHMUX_DETAIL_ROUTE_TREE_HPP

#include <pathmux/detail/config.hpp>
#include <pathmux/path_values.hpp>
#include <pathmux/route_handler.hpp>
#include <boost/system/error_code.hpp>
#include <cstddef>
#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace pathmux {
namespace detail {

/*  A compressed prefix tree of route patterns

    Each node holds a fragment of a pattern. A node
    holds either a run of literal bytes which never
    contains ':' or '*', or exactly one token such as
    ":id" or "*rest". Children are found by the first
    byte of their fragment, so at most one variable
    and one wildcard child exist per node.
*/
class PATHMUX_DECL route_tree
{
public:
    struct node;

    // children of a node, sorted by label
    class edge_set
    {
    public:
        struct edge
        {
            unsigned char label;
            std::unique_ptr<node> child;
        };

        using const_iterator =
            std::vector<edge>::const_iterator;

        node*
        find(unsigned char label) const noexcept;

        // label must not be present
        node&
        add(std::unique_ptr<node> child);

        bool
        empty() const noexcept
        {
            return v_.empty();
        }

        std::size_t
        size() const noexcept
        {
            return v_.size();
        }

        const_iterator
        begin() const noexcept
        {
            return v_.begin();
        }

        const_iterator
        end() const noexcept
        {
            return v_.end();
        }

    private:
        std::vector<edge> v_;
    };

    struct node
    {
        std::string key;
        std::string route;      // set on leaves
        route_handler handler;  // set on leaves
        edge_set edges;
        bool param = false;     // key is a token
        bool leaf = false;
    };

    route_tree() = default;
    route_tree(route_tree const&) = delete;
    route_tree& operator=(route_tree const&) = delete;

    bool
    empty() const noexcept
    {
        return root_.edges.empty();
    }

    /*  Insert a validated pattern.

        On success returns the stored route. On
        failure ec is set and the return value is the
        route already registered which conflicts.
    */
    std::string_view
    insert(
        std::string_view pattern,
        route_handler h,
        system::error_code& ec);

    /*  Find the route matching path.

        Variable values are appended to pv as views
        into path, and names as views into the tree.
        On a miss pv may hold partial bindings.
    */
    lookup_result
    search(
        std::string_view path,
        path_values& pv) const;

    // write one line per node, indented by depth
    void
    print(
        std::ostream& os,
        std::size_t depth = 0) const;

private:
    static
    node&
    append_chain(
        node& parent,
        std::string_view key);

    static void split(node& n, std::size_t at);
    static std::string_view first_route(
        node const& n) noexcept;
    static void print_node(std::ostream& os,
        node const& n, std::size_t depth);

    node root_;
};

} // detail
} // pathmux

#endif
