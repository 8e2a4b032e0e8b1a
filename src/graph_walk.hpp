#pragma once

// Internal: three-state depth-first traversal shared by the module import
// check and the component orderer.  Not installed.

#include "libctdi/exceptions.hpp"
#include "stacktrace_utils.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace libctdi::internal {

enum class visit_state { unvisited, in_progress, done };

template <typename Edges, typename Name, typename Where>
class depth_first_walk {
public:
    depth_first_walk(std::size_t node_count, Edges edges, Name name,
                     Where where, cycle_kind kind)
        : edges_(std::move(edges))
        , name_(std::move(name))
        , where_(std::move(where))
        , kind_(kind)
        , states_(node_count, visit_state::unvisited)
    {
        order_.reserve(node_count);
    }

    /// Post-order over all nodes, roots taken in index order.
    std::vector<std::size_t> run() {
        for (std::size_t i = 0; i < states_.size(); ++i) {
            if (states_[i] == visit_state::unvisited) visit(i);
        }
        return std::move(order_);
    }

private:
    void visit(std::size_t node) {
        auto& state = states_[node];
        if (state == visit_state::done) return;
        if (state == visit_state::in_progress) {
            // Cycle is the path from the node's first occurrence, closed
            // by the node itself.
            auto it = std::find(path_.begin(), path_.end(), node);
            std::vector<std::string> cycle;
            for (; it != path_.end(); ++it) cycle.push_back(name_(*it));
            cycle.push_back(name_(node));
            raise(circular_dependency(std::move(cycle), kind_, where_(node)));
        }

        state = visit_state::in_progress;
        path_.push_back(node);

        for (std::size_t next : edges_(node)) {
            visit(next);
        }

        path_.pop_back();
        states_[node] = visit_state::done;
        order_.push_back(node);
    }

    Edges edges_;
    Name name_;
    Where where_;
    cycle_kind kind_;
    std::vector<visit_state> states_;
    std::vector<std::size_t> path_;
    std::vector<std::size_t> order_;
};

/// Depth-first post-order of nodes [0, node_count).
///   edges(i) -> range of successor indices of node i
///   name(i)  -> display name used in cycle paths
///   where(i) -> source_position reported when node i closes a cycle
/// Throws circular_dependency of the given kind on the first back edge.
template <typename Edges, typename Name, typename Where>
std::vector<std::size_t> depth_first_order(std::size_t node_count, Edges edges,
                                           Name name, Where where, cycle_kind kind) {
    depth_first_walk<Edges, Name, Where> walk(node_count, std::move(edges),
                                              std::move(name), std::move(where),
                                              kind);
    return walk.run();
}

} // namespace libctdi::internal
