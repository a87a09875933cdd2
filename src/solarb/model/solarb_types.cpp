#include "solarb_types.hpp"

namespace solarb {
namespace model {


const char *pool_kind_name(PoolKind kind)
{
    switch (kind) {
    case POOL_CONSTANT_PRODUCT: return "constant-product";
    }
    return "unknown";
}

std::ostream& operator<< (std::ostream& stream, const PoolReserves& o)
{
    stream << "(" << o.reserve_in
           << ", " << o.reserve_out
           << ", " << o.fee_bps << "bps"
           << ", " << pool_kind_name(o.kind) << ")";
    return stream;
}

std::ostream& operator<< (std::ostream& stream, const Hop& o)
{
    stream << o.from_token << "->" << o.to_token;
    if (!o.dex_name.empty()) stream << "@" << o.dex_name;
    stream << o.pool;
    return stream;
}


} // namespace model
} // namespace solarb
