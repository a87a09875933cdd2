/**
 * @file solarb_types.hpp
 * @brief Numeric and value types shared by the whole model
 */

#pragma once

#include "solarb_common.hpp"
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <limits>
#include <ostream>


namespace solarb {
namespace model {

namespace bignum {

using namespace boost::multiprecision;
using uint128_t = boost::multiprecision::uint128_t;
using uint256_t = boost::multiprecision::uint256_t;

}

/**
 * @brief Token amount in base units (lamports, micro-USDC, ...)
 *
 * On-chain SPL balances are u64, and so is everything that enters
 * or leaves the model.
 */
typedef std::uint64_t amount_t;

/**
 * @brief Widened intermediate for products of two amount_t
 *
 * (2^64-1)^2 < 2^128, so any product of two amounts fits.
 * Anything that needs a third factor goes through checked narrowing.
 */
typedef bignum::uint128_t wide_amount_t;

constexpr amount_t AMOUNT_MAX = std::numeric_limits<amount_t>::max();

/**
 * @brief basis points denominator (10000 bps = 100%)
 */
constexpr unsigned BPS_DENOMINATOR = 10000;

/**
 * @brief token identifier (mint address or symbol, opaque to the model)
 */
typedef std::string token_t;

typedef unsigned long int datatag_t;


/**
 * @brief Closed set of pool curve kinds
 *
 * Each kind has its own swap formula. They are selected by switch()
 * in the amm module. Only constant product (x*y=k) is modelled at the moment.
 */
typedef enum {
    POOL_CONSTANT_PRODUCT,
} PoolKind;

const char *pool_kind_name(PoolKind kind);


/**
 * @brief One liquidity pool's state, oriented for a swap direction
 *
 * reserve_in is the reserve of the token being sold into the pool,
 * reserve_out is the reserve of the token being bought.
 * Both must be > 0 for the pool to be usable.
 */
struct PoolReserves
{
    amount_t reserve_in = 0;
    amount_t reserve_out = 0;
    unsigned fee_bps = 0;
    PoolKind kind = POOL_CONSTANT_PRODUCT;

    PoolReserves() = default;
    PoolReserves(amount_t reserve_in_
                 , amount_t reserve_out_
                 , unsigned fee_bps_
                 , PoolKind kind_ = POOL_CONSTANT_PRODUCT)
        : reserve_in(reserve_in_)
        , reserve_out(reserve_out_)
        , fee_bps(fee_bps_)
        , kind(kind_)
    {}

    bool usable() const noexcept { return reserve_in > 0 && reserve_out > 0; }

    /**
     * @brief same pool, opposite swap direction
     */
    PoolReserves reversed() const noexcept
    {
        return PoolReserves(reserve_out, reserve_in, fee_bps, kind);
    }

    bool operator==(const PoolReserves &o) const noexcept
    {
        return reserve_in == o.reserve_in
                && reserve_out == o.reserve_out
                && fee_bps == o.fee_bps
                && kind == o.kind;
    }
};

std::ostream& operator<< (std::ostream& stream, const PoolReserves& o);


/**
 * @brief One directed swap leg
 *
 * dex_name and pool_address are labels, used for fee lookup and reporting.
 * Behaviour only depends on pool.
 */
struct Hop
{
    token_t from_token;
    token_t to_token;
    PoolReserves pool;
    std::string dex_name;
    std::string pool_address;

    Hop() = default;
    Hop(const token_t &from_token_
        , const token_t &to_token_
        , const PoolReserves &pool_
        , const std::string &dex_name_ = std::string()
        , const std::string &pool_address_ = std::string())
        : from_token(from_token_)
        , to_token(to_token_)
        , pool(pool_)
        , dex_name(dex_name_)
        , pool_address(pool_address_)
    {}

    bool operator==(const Hop &o) const noexcept
    {
        return from_token == o.from_token
                && to_token == o.to_token
                && pool_address == o.pool_address
                && pool == o.pool;
    }
};

std::ostream& operator<< (std::ostream& stream, const Hop& o);


/**
 * @brief narrows a widened value back to amount_t
 * @return false if @p v does not fit
 */
inline bool narrow_amount(const wide_amount_t &v, amount_t &out) noexcept
{
    if (v > wide_amount_t(AMOUNT_MAX))
    {
        return false;
    }
    out = v.convert_to<amount_t>();
    return true;
}

} // namespace model
} // namespace solarb
