/**
 * @file solarb_model.hpp
 * @brief Model of a pool snapshot, as delivered by the price/pool feed.
 *
 * This includes:
 *
 *  - PoolRecord
 *  - PoolEntry
 *  - DirectedSwap
 *  - PoolSnapshot
 */

#pragma once

#include "solarb_common.hpp"
#include "solarb_model_fwd.hpp"
#include "solarb_types.hpp"
#include "solarb_fees.hpp"
#include <boost/noncopyable.hpp>
#include <memory>
#include <mutex>
#include <set>
#include <vector>


namespace solarb {
namespace model {


/**
 * @brief One pool, as reported by the feed
 *
 * Plain input row. token_a/token_b orientation is arbitrary.
 */
struct PoolRecord
{
    std::string pool_address;
    token_t token_a;
    token_t token_b;
    amount_t reserve_a = 0;
    amount_t reserve_b = 0;
    int fee_bps = -1;         ///< <0: inherit the DEX's default fee
    std::string dex_name;
    PoolKind kind = POOL_CONSTANT_PRODUCT;
};


/**
 * @brief Define a potential swap from a source to a destination token.
 *
 * The swap is operated by the referred pool.
 * A pool operates swaps both ways, so each pool owns two of these.
 * They are the edges of the (directed) token graph.
 */
struct DirectedSwap: boost::noncopyable
{
    const token_t tokenSrc;
    const token_t tokenDest;
    const PoolEntry *pool;

    DirectedSwap(const token_t &tokenSrc_
                 , const token_t &tokenDest_
                 , const PoolEntry *pool_)
        : tokenSrc(tokenSrc_)
        , tokenDest(tokenDest_)
        , pool(pool_)
    { }

    /**
     * @brief hop leg of a route using this swap
     */
    Hop hop() const;
};


/**
 * @brief A pool indexed in a snapshot
 *
 * Reserves are frozen at snapshot time.
 * Fee rate is either the pool's own or inherited from its DEX.
 */
struct PoolEntry: boost::noncopyable, fees::HasParentFees
{
    const datatag_t tag;        ///< insertion sequence number in the snapshot
    const std::string address;
    const token_t token_a;
    const token_t token_b;
    const amount_t reserve_a;
    const amount_t reserve_b;
    const std::string dex_name;
    const PoolKind kind;
    const DirectedSwap *swaps[2] = {nullptr, nullptr};

    PoolEntry(datatag_t tag_
              , const PoolRecord &record
              , const fees::HasFees *dex_fees);

    bool has_token(const token_t &token) const noexcept;

    /**
     * @brief the other token of the pair
     * @throws std::invalid_argument if @p token is not traded by this pool
     */
    const token_t &counterpart(const token_t &token) const;

    /**
     * @brief pool state oriented for a swap selling @p from
     * @throws std::invalid_argument if @p from is not traded by this pool
     */
    PoolReserves reserves_from(const token_t &from) const;

    /**
     * @brief route leg selling @p from through this pool
     * @throws std::invalid_argument if @p from is not traded by this pool
     */
    Hop hop_from(const token_t &from) const;

    std::string get_name() const;
};


/**
 * @brief Snapshot of the known pools at one point in time
 *
 * Pools are directed-graph edges between tokens (nodes).
 * The snapshot is populated by the feed collaborator, then handed over
 * to a scan. Lookups are safe from any thread once population is done.
 *
 * A fresh snapshot is expected for each scan cycle: nothing is ever updated
 * in place.
 */
struct PoolSnapshot: boost::noncopyable
{
    PoolSnapshot();
    explicit PoolSnapshot(const std::vector<PoolRecord> &records);
    ~PoolSnapshot();

    /**
     * @brief default fee rate of pools of @p dex_name which don't carry their own
     */
    void set_dex_fee(const std::string &dex_name, int feesBPS);
    int dex_fee(const std::string &dex_name) const;

    /**
     * @brief introduce a new pool in the snapshot
     *
     * Pools with zero reserves are accepted: they are part of the snapshot,
     * but any route crossing them fails at evaluation.
     *
     * @return the indexed pool, or null if the record is a duplicate
     *         (by address) or is malformed
     */
    const PoolEntry *add_pool(const PoolRecord &record);
    const PoolEntry *add_pool(const std::string &address
                              , const token_t &token_a
                              , const token_t &token_b
                              , amount_t reserve_a
                              , amount_t reserve_b
                              , int fee_bps = -1
                              , const std::string &dex_name = std::string());

    /**
     * @brief fetch a known pool
     * @return pool, or null if not existing
     */
    const PoolEntry *lookup_pool(const std::string &address) const;
    const PoolEntry *lookup_pool(datatag_t tag) const;
    bool has_pool(const std::string &address) const;

    /**
     * @brief swaps selling @p token, ordered by pool insertion
     */
    std::vector<const DirectedSwap *> swaps_from(const token_t &token) const;

    /**
     * @brief swaps buying @p token, ordered by pool insertion
     */
    std::vector<const DirectedSwap *> swaps_to(const token_t &token) const;

    /**
     * @brief swaps selling @p from to buy @p to, ordered by pool insertion
     */
    std::vector<const DirectedSwap *> lookup_swap(const token_t &from, const token_t &to) const;

    /**
     * @brief all pools, in insertion order
     */
    std::vector<const PoolEntry *> pools() const;

    /**
     * @brief all known tokens, sorted
     */
    std::vector<token_t> tokens() const;
    bool has_token(const token_t &token) const;

    std::size_t pools_count() const;
    std::size_t tokens_count() const;
    std::size_t swaps_count() const;

private:
    mutable std::mutex m_update_mutex;
    typedef std::lock_guard<std::mutex> lock_guard_t;

    fees::FeeSchedule m_fee_schedule;
    std::vector<std::unique_ptr<PoolEntry>> m_pools;
    std::vector<std::unique_ptr<DirectedSwap>> m_swaps;
    std::set<token_t> m_tokens;
    std::unique_ptr<idx::PoolIndex> m_pool_index;
    std::unique_ptr<idx::SwapIndex> m_swap_index;
};


} // namespace model
} // namespace solarb
