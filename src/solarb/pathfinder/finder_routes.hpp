#pragma once

#include "routes.hpp"
#include <solarb/model/solarb_model_fwd.hpp>

namespace solarb {
namespace pathfinder {

/**
 * @brief route discovery over a pool snapshot
 *
 * Routes are enumerated depth-first, following the snapshot's
 * directed swaps in pool insertion order, so the discovery order is
 * reproducible for a given snapshot.
 */
struct Finder {
    // it needs access to the snapshot object
    const model::PoolSnapshot *snapshot;

    explicit Finder(const model::PoolSnapshot *snapshot_)
        : snapshot(snapshot_)
    {}

    /**
     * @brief find all routes that start and end on @p start_token
     *
     * Routes are @p min_hops to @p max_hops long, and never cross the
     * same pool twice. A route ends as soon as it gets back to @p start_token.
     * Intermediate tokens may repeat: filtering those is the route guard's job.
     *
     * @param max_count stop after this many routes (0: no limit)
     * @return number of routes passed to @p callback
     */
    unsigned find_all_routes(Route::listener_t callback
                             , const token_t &start_token
                             , unsigned min_hops
                             , unsigned max_hops
                             , unsigned max_count = 0) const;
};

} // namespace pathfinder
} // namespace solarb
