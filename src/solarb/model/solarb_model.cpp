#include "solarb_model.hpp"
#include "solarb_pool_idx.hpp"
#include "../commons/solarb_log.hpp"
#include <stdexcept>

namespace solarb {
namespace model {

using namespace idx;


Hop DirectedSwap::hop() const
{
    return pool->hop_from(tokenSrc);
}


PoolEntry::PoolEntry(datatag_t tag_
                     , const PoolRecord &record
                     , const fees::HasFees *dex_fees)
    : fees::HasParentFees(dex_fees, record.fee_bps)
    , tag(tag_)
    , address(record.pool_address)
    , token_a(record.token_a)
    , token_b(record.token_b)
    , reserve_a(record.reserve_a)
    , reserve_b(record.reserve_b)
    , dex_name(record.dex_name)
    , kind(record.kind)
{}

bool PoolEntry::has_token(const token_t &token) const noexcept
{
    return token == token_a || token == token_b;
}

const token_t &PoolEntry::counterpart(const token_t &token) const
{
    if (token == token_a) return token_b;
    if (token == token_b) return token_a;
    throw std::invalid_argument(strfmt("token %1% is not traded by pool %2%", token, address));
}

PoolReserves PoolEntry::reserves_from(const token_t &from) const
{
    const unsigned fee = static_cast<unsigned>(feesBPS());
    if (from == token_a)
    {
        return PoolReserves(reserve_a, reserve_b, fee, kind);
    }
    if (from == token_b)
    {
        return PoolReserves(reserve_b, reserve_a, fee, kind);
    }
    throw std::invalid_argument(strfmt("token %1% is not traded by pool %2%", from, address));
}

Hop PoolEntry::hop_from(const token_t &from) const
{
    return Hop(from, counterpart(from), reserves_from(from), dex_name, address);
}

std::string PoolEntry::get_name() const
{
    return strfmt("%1%(%2%-%3%, %4%)", dex_name, token_a, token_b, address);
}


PoolSnapshot::PoolSnapshot()
    : m_pool_index(new PoolIndex)
    , m_swap_index(new SwapIndex)
{
    log_trace("PoolSnapshot created at 0x%1%", this);
}

PoolSnapshot::PoolSnapshot(const std::vector<PoolRecord> &records)
    : PoolSnapshot()
{
    for (auto &r: records)
    {
        add_pool(r);
    }
}

PoolSnapshot::~PoolSnapshot() = default;


namespace {
// private to this code unit

/**
 * Checks the outcome of a container emplace()
 * @return true if the emplace() was rejected and an existing
 *         duplicate was found in the container
 */
template<typename T>
bool already_exists(const T &i) { return !i.second; }

} // unnamed namespace


void PoolSnapshot::set_dex_fee(const std::string &dex_name, int feesBPS)
{
    lock_guard_t lock_guard(m_update_mutex);
    m_fee_schedule.set_dex_fee(dex_name, feesBPS);
}

int PoolSnapshot::dex_fee(const std::string &dex_name) const
{
    lock_guard_t lock_guard(m_update_mutex);
    return m_fee_schedule.dex_fee(dex_name);
}


const PoolEntry *PoolSnapshot::add_pool(const PoolRecord &record)
{
    if (record.pool_address.empty()
            || record.token_a.empty()
            || record.token_b.empty())
    {
        log_warning("add_pool(): incomplete pool record (address \"%1%\", tokens \"%2%\", \"%3%\") ignored"
                    , record.pool_address, record.token_a, record.token_b);
        return nullptr;
    }
    if (record.token_a == record.token_b)
    {
        log_warning("add_pool(): pool %1% swaps %2% with itself, ignored"
                    , record.pool_address, record.token_a);
        return nullptr;
    }

    lock_guard_t lock_guard(m_update_mutex);
    auto ptr = std::make_unique<PoolEntry>(m_pools.size() + 1
                                           , record
                                           , m_fee_schedule.dex(record.dex_name));
    auto item = m_pool_index->emplace(ptr.get());
    if (already_exists(item))
    {
        log_warning("add_pool(): duplicate pool address %1% ignored", record.pool_address);
        return nullptr;
    }
    auto pool = ptr.get();
    m_pools.emplace_back(std::move(ptr));

    if (record.reserve_a == 0 || record.reserve_b == 0)
    {
        log_debug("add_pool(): pool %1% has zero reserves. Routes crossing it won't evaluate"
                  , pool->get_name());
    }

    // create the two directed swaps
    m_swaps.emplace_back(std::make_unique<DirectedSwap>(pool->token_a, pool->token_b, pool));
    pool->swaps[0] = m_swaps.back().get();
    m_swaps.emplace_back(std::make_unique<DirectedSwap>(pool->token_b, pool->token_a, pool));
    pool->swaps[1] = m_swaps.back().get();
    for (auto os: pool->swaps)
    {
        m_swap_index->emplace(const_cast<DirectedSwap*>(os));
    }
    m_tokens.insert(pool->token_a);
    m_tokens.insert(pool->token_b);
    return pool;
}

const PoolEntry *PoolSnapshot::add_pool(const std::string &address
                                        , const token_t &token_a
                                        , const token_t &token_b
                                        , amount_t reserve_a
                                        , amount_t reserve_b
                                        , int fee_bps
                                        , const std::string &dex_name)
{
    PoolRecord r;
    r.pool_address = address;
    r.token_a = token_a;
    r.token_b = token_b;
    r.reserve_a = reserve_a;
    r.reserve_b = reserve_b;
    r.fee_bps = fee_bps;
    r.dex_name = dex_name;
    return add_pool(r);
}


const PoolEntry *PoolSnapshot::lookup_pool(const std::string &address) const
{
    return m_pool_index->lookup(address);
}

const PoolEntry *PoolSnapshot::lookup_pool(datatag_t tag) const
{
    return m_pool_index->lookup(tag);
}

bool PoolSnapshot::has_pool(const std::string &address) const
{
    return lookup_pool(address) != nullptr;
}


std::vector<const DirectedSwap *> PoolSnapshot::swaps_from(const token_t &token) const
{
    std::vector<const DirectedSwap *> res;
    auto &idx = m_swap_index->get<by_src_token>();
    auto range = idx.equal_range(boost::make_tuple(token));
    for (auto i = range.first; i != range.second; ++i)
    {
        res.emplace_back(*i);
    }
    return res;
}

std::vector<const DirectedSwap *> PoolSnapshot::swaps_to(const token_t &token) const
{
    std::vector<const DirectedSwap *> res;
    auto &idx = m_swap_index->get<by_dest_token>();
    auto range = idx.equal_range(boost::make_tuple(token));
    for (auto i = range.first; i != range.second; ++i)
    {
        res.emplace_back(*i);
    }
    return res;
}

std::vector<const DirectedSwap *> PoolSnapshot::lookup_swap(const token_t &from, const token_t &to) const
{
    std::vector<const DirectedSwap *> res;
    auto &idx = m_swap_index->get<by_src_and_dest_token>();
    auto range = idx.equal_range(boost::make_tuple(from, to));
    for (auto i = range.first; i != range.second; ++i)
    {
        res.emplace_back(*i);
    }
    return res;
}


std::vector<const PoolEntry *> PoolSnapshot::pools() const
{
    std::vector<const PoolEntry *> res;
    res.reserve(m_pools.size());
    for (auto &p: m_pools)
    {
        res.emplace_back(p.get());
    }
    return res;
}

std::vector<token_t> PoolSnapshot::tokens() const
{
    return std::vector<token_t>(m_tokens.begin(), m_tokens.end());
}

bool PoolSnapshot::has_token(const token_t &token) const
{
    return m_tokens.count(token) > 0;
}

std::size_t PoolSnapshot::pools_count() const
{
    return m_pools.size();
}

std::size_t PoolSnapshot::tokens_count() const
{
    return m_tokens.size();
}

std::size_t PoolSnapshot::swaps_count() const
{
    return m_swaps.size();
}


} // namespace model
} // namespace solarb
