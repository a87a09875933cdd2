/**
 * @file solarb_pool_idx.hpp
 * @brief Facility for recurrent lookups on pools and swaps of a snapshot
 *
 * The machinery implemented here is based around boost::multi_index.
 * multi_index is great but ostensibly tortuous to use and read,
 * which is the reason this code is partitioned here.
 */

#pragma once
#include "solarb_model.hpp"
#include <boost/multi_index_container.hpp>
#include <boost/multi_index/hashed_index.hpp>
#include <boost/multi_index/composite_key.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/multi_index/global_fun.hpp>


namespace solarb {
namespace model {
namespace idx {

using namespace boost::multi_index;


/**
 * @defgroup indexes Available indexing (and lookup) strategies
 * @{
 */
struct by_tag {};
struct by_address {};
struct by_src_token {};
struct by_dest_token {};
struct by_src_and_dest_token {};

/** @} */


/**
 * @defgroup key_extractors Swap key extractors.
 *
 * They implement the equivalent of a computed key in a DB.
 *
 * @{
 */
inline datatag_t swapPoolTag(const DirectedSwap &s) noexcept
{
    return s.pool->tag;
}

/** @} */


/**
 * @defgroup PoolIndex Index of the snapshot's pools
 *
 * Items can be looked up:
 *
 *  - by_address in O(1)
 *  - by_tag in log(n); iterating this index walks the pools in insertion order
 *
 * @{
 */
typedef multi_index_container<
  PoolEntry*,
  indexed_by<
        // 1. index by on-chain address
          hashed_unique<      tag<by_address>,  member<PoolEntry, const std::string, &PoolEntry::address> >
        // 2. index by insertion sequence
        , ordered_unique<     tag<by_tag>    ,  member<PoolEntry, const datatag_t  , &PoolEntry::tag> >
  >
> PoolIndex_base;

/**
 * @}
 */


struct PoolIndex: PoolIndex_base {
    using PoolIndex_base::PoolIndex_base;

    /**
     * @brief lookup pools by tag value
     * @return matching pool pointer or null
     */
    const PoolEntry* lookup(datatag_t tag) const noexcept
    {
        auto &idx = get<by_tag>();
        auto i = idx.find(tag);
        if (i == idx.end())
        {
            return nullptr;
        }
        return *i;
    }

    /**
     * @brief lookup pools by on-chain address
     * @return matching pool pointer or null
     */
    const PoolEntry* lookup(const std::string &addr) const noexcept
    {
        auto &idx = get<by_address>();
        auto i = idx.find(addr);
        if (i == idx.end())
        {
            return nullptr;
        }
        return *i;
    }
};


/**
 * @defgroup SwapIndex Index of known swaps
 *
 * Swaps operate a currency change operation in one direction
 * between a source and a destination token. They tie together
 * source, destination token and the operable pool.
 *
 * Swaps can be looked up:
 *
 *  - by_src_token
 *  - by_dest_token
 *  - by_src_and_dest_token
 *
 * Within the same key, swaps come out in pool insertion order.
 * Scans rely on this to be reproducible.
 *
 * @{
 */
typedef multi_index_container<
  DirectedSwap*,
  indexed_by<
          ordered_non_unique< tag<by_src_token>,  composite_key<DirectedSwap,
                 member<DirectedSwap, const token_t, &DirectedSwap::tokenSrc>
               , global_fun<const DirectedSwap&, datatag_t, swapPoolTag>                       >
          >
        , ordered_non_unique< tag<by_dest_token>,  composite_key<DirectedSwap,
                 member<DirectedSwap, const token_t, &DirectedSwap::tokenDest>
               , global_fun<const DirectedSwap&, datatag_t, swapPoolTag>                       >
          >
        , ordered_non_unique< tag<by_src_and_dest_token>,  composite_key<DirectedSwap,
                 member<DirectedSwap, const token_t, &DirectedSwap::tokenSrc>
               , member<DirectedSwap, const token_t, &DirectedSwap::tokenDest>
               , global_fun<const DirectedSwap&, datatag_t, swapPoolTag>                       >
          >
  >
> SwapIndex_base;


struct SwapIndex: SwapIndex_base
{
    using SwapIndex_base::SwapIndex_base;
};


/**
 * @}
 */


} // namespace idx
} // namespace model
} // namespace solarb
