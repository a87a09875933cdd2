/**
 * @file solarb_fees.hpp
 * @brief Fees model and cost accounting of an arbitrage attempt
 *
 * Two concerns live here:
 *
 *  - swap fee rates. Applies to DEXes and pools: a pool either carries
 *    its own rate or inherits the one of its DEX.
 *  - the total cost of executing a route: network fee, priority fee, DEX fees
 *    and a safety margin. All in base units of the traded input.
 */

#pragma once

#include "solarb_types.hpp"
#include <map>
#include <vector>

namespace solarb {
namespace model {
namespace fees {


struct HasFees
{
    virtual ~HasFees() {}
    virtual int feesBPS() const = 0;
    virtual bool hasFees() const { return feesBPS() != 0; }
};


struct HasFixedFees: HasFees
{
    HasFixedFees() = default;
    HasFixedFees(const HasFixedFees &) = default;
    HasFixedFees(int feesBPS);

    virtual int feesBPS() const;
    virtual bool hasFees() const;
    void setFeesBPS(int val);
private:
    int m_feesBPS = -1; // <0: not set
};


/**
 * @brief fee rate with fallback on a parent fee rate
 *
 * Own rate if set, else parent's rate if a parent is known, else 0.
 */
struct HasParentFees: HasFixedFees
{
    using HasFixedFees::HasFixedFees;
    HasParentFees(const HasFees *parentFees, int feesBPS = -1);

    virtual int feesBPS() const;
    virtual bool hasFees() const;
private:
    const HasFees *m_parentFees = nullptr;
};


/**
 * @brief default fee rate per DEX label
 *
 * Entries are never removed, so pointers returned by dex() stay valid
 * for the lifetime of the schedule.
 */
struct FeeSchedule
{
    void set_dex_fee(const std::string &dex_name, int feesBPS);
    const HasFees *dex(const std::string &dex_name);
    bool has_dex(const std::string &dex_name) const;
    int dex_fee(const std::string &dex_name) const;
private:
    std::map<std::string, HasFixedFees> m_dex;
};


/**
 * @brief fixed inputs of the cost model
 */
struct CostParameters
{
    /**
     * @brief per-transaction network fee, base units
     *
     * @default 5000 (one signature on Solana)
     */
    amount_t network_base_fee = 5000;

    /**
     * @brief compute-unit price paid for inclusion, base units
     *
     * @default 1000000 (0.001 SOL)
     */
    amount_t priority_fee = 1000000;

    /**
     * @brief surcharge over the cost subtotal, percent
     *
     * @default 20.0
     */
    double safety_margin_pct = 20.0;
};


/**
 * @brief computed cost of a route
 *
 * slippage_cost and price_impact_cost are diagnostic figures: the exact
 * curve simulation already accounts for them in the gross output, therefore
 * they are not part of total_cost.
 */
struct CostBreakdown
{
    amount_t network_base_fee = 0;
    amount_t priority_fee = 0;
    amount_t dex_fees_total = 0;
    amount_t slippage_cost = 0;
    amount_t price_impact_cost = 0;
    amount_t safety_margin = 0;
    amount_t total_cost = 0;

    std::string infos() const;
};

std::ostream& operator<< (std::ostream& stream, const CostBreakdown& o);


/**
 * @brief total cost of trading @p trade_amount through @p hops
 *
 * DEX fees compound: the fee of each hop is taken on the amount still
 * in play after the previous hops' fees.
 * Never fails. Non-decreasing in trade_amount and in the number of hops.
 */
CostBreakdown total_arbitrage_costs(amount_t trade_amount
                                    , const std::vector<Hop> &hops
                                    , const CostParameters &params);

CostBreakdown total_arbitrage_costs(amount_t trade_amount
                                    , const std::vector<Hop> &hops
                                    , amount_t network_base_fee
                                    , amount_t priority_fee
                                    , double safety_margin_pct);


} // namespace fees
} // namespace model
} // namespace solarb
