#pragma once

namespace solarb {
namespace model {

struct PoolRecord;
struct PoolEntry;
struct DirectedSwap;
struct PoolSnapshot;

namespace idx {
struct PoolIndex;
struct SwapIndex;
} // namespace idx

} // namespace model
} // namespace solarb
