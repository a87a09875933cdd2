#include "solarb_fees.hpp"
#include "solarb_amm_estimation.hpp"
#include "../commons/solarb_log.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace solarb {
namespace model {
namespace fees {


HasFixedFees::HasFixedFees(int feesBPS)
    : m_feesBPS(feesBPS)
{}

int HasFixedFees::feesBPS() const
{
    return m_feesBPS < 0 ? 0 : m_feesBPS;
}

bool HasFixedFees::hasFees() const
{
    return m_feesBPS >= 0;
}

void HasFixedFees::setFeesBPS(int val)
{
    m_feesBPS = val;
}

HasParentFees::HasParentFees(const HasFees *parentFees, int feesBPS)
    : HasFixedFees(feesBPS)
    , m_parentFees(parentFees)
{}


int HasParentFees::feesBPS() const
{
    if (HasFixedFees::hasFees())
    {
        return HasFixedFees::feesBPS();
    }
    if (m_parentFees != nullptr)
    {
        return m_parentFees->feesBPS();
    }
    return 0;
}

bool HasParentFees::hasFees() const
{
    return HasFixedFees::hasFees() ||
            (m_parentFees != nullptr && m_parentFees->hasFees());
}


void FeeSchedule::set_dex_fee(const std::string &dex_name, int feesBPS)
{
    m_dex[dex_name].setFeesBPS(feesBPS);
}

const HasFees *FeeSchedule::dex(const std::string &dex_name)
{
    // unknown DEXes get a placeholder with no rate. It can be set later
    // and pools already pointing at it pick the new rate up.
    return &m_dex[dex_name];
}

bool FeeSchedule::has_dex(const std::string &dex_name) const
{
    auto i = m_dex.find(dex_name);
    return i != m_dex.end() && i->second.hasFees();
}

int FeeSchedule::dex_fee(const std::string &dex_name) const
{
    auto i = m_dex.find(dex_name);
    if (i == m_dex.end())
    {
        return 0;
    }
    return i->second.feesBPS();
}


std::string CostBreakdown::infos() const
{
    std::stringstream ss;
    ss << "network fee " << network_base_fee
       << ", priority fee " << priority_fee
       << ", dex fees " << dex_fees_total
       << ", safety margin " << safety_margin
       << ", total " << total_cost
       << " (slippage ~" << slippage_cost
       << ", price impact ~" << price_impact_cost << ")";
    return ss.str();
}

std::ostream& operator<< (std::ostream& stream, const CostBreakdown& o)
{
    stream << o.infos();
    return stream;
}


static amount_t m_saturate(const wide_amount_t &v)
{
    amount_t res;
    return narrow_amount(v, res) ? res : AMOUNT_MAX;
}

static amount_t m_saturate(double v)
{
    if (!(v > 0)) return 0;
    if (v >= static_cast<double>(AMOUNT_MAX)) return AMOUNT_MAX;
    return static_cast<amount_t>(v);
}


CostBreakdown total_arbitrage_costs(amount_t trade_amount
                                    , const std::vector<Hop> &hops
                                    , const CostParameters &params)
{
    CostBreakdown res;
    res.network_base_fee = params.network_base_fee;
    res.priority_fee = params.priority_fee;

    wide_amount_t dex_fees = 0;
    double slippage_cost = 0;
    double impact_cost = 0;

    // value still in play, measured in the route's input asset
    amount_t in_play = trade_amount;
    // the same, in units of the token entering the current hop
    amount_t hop_amount = trade_amount;
    bool simulate = true;

    for (unsigned i = 0; i < hops.size(); ++i)
    {
        const auto &hop = hops[i];
        const unsigned fee_bps = std::min(hop.pool.fee_bps, BPS_DENOMINATOR);
        const wide_amount_t wide_fee = wide_amount_t(in_play) * fee_bps / BPS_DENOMINATOR;
        const amount_t fee = wide_fee.convert_to<amount_t>();
        dex_fees += fee;

        if (simulate)
        {
            try {
                slippage_cost += static_cast<double>(in_play) * amm::swap_slippage(hop.pool, hop_amount) / 100.0;
                impact_cost += static_cast<double>(in_play) * amm::swap_price_impact(hop.pool, hop_amount) / 100.0;
                hop_amount = amm::swap_output(hop.pool, hop_amount);
            } catch (const amm::swap_error &e) {
                // curve figures are diagnostics: stop collecting them, keep on with the fees
                log_trace("cost model: curve estimation stopped at hop %1%: %2%", i, e.what());
                simulate = false;
            }
        }

        in_play -= fee;
    }

    res.dex_fees_total = m_saturate(dex_fees);
    res.slippage_cost = m_saturate(slippage_cost);
    res.price_impact_cost = m_saturate(impact_cost);

    const wide_amount_t subtotal = wide_amount_t(res.network_base_fee)
            + res.priority_fee
            + dex_fees;
    const double margin_pct = params.safety_margin_pct > 0 ? params.safety_margin_pct : 0;
    const wide_amount_t margin_bps = static_cast<unsigned long long>(std::llround(margin_pct * 100.0));
    const wide_amount_t margin = subtotal * margin_bps / BPS_DENOMINATOR;

    res.safety_margin = m_saturate(margin);
    res.total_cost = m_saturate(subtotal + margin);
    return res;
}

CostBreakdown total_arbitrage_costs(amount_t trade_amount
                                    , const std::vector<Hop> &hops
                                    , amount_t network_base_fee
                                    , amount_t priority_fee
                                    , double safety_margin_pct)
{
    CostParameters params;
    params.network_base_fee = network_base_fee;
    params.priority_fee = priority_fee;
    params.safety_margin_pct = safety_margin_pct;
    return total_arbitrage_costs(trade_amount, hops, params);
}


} // namespace fees
} // namespace model
} // namespace solarb
