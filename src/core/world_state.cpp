#include "turngate/core/world_state.h"

namespace turngate {

StructureStatus derive_structure_status(int durability, int max_durability,
                                        const StructureThresholds& thresholds) {
  if (durability <= 0 || max_durability <= 0) return StructureStatus::Destroyed;
  const double ratio = static_cast<double>(durability) / static_cast<double>(max_durability);
  if (ratio < thresholds.breached_ratio) return StructureStatus::Breached;
  if (ratio < thresholds.damaged_ratio) return StructureStatus::Damaged;
  return StructureStatus::Stable;
}

} // namespace turngate
