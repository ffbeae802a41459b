#include "snapshot.hpp"
#include "serialize.hpp"
#include "util.hpp"

std::string SnapshotBuilder::make_snapshot_id(int64_t ts_ms) {
    return "PS-" + std::to_string(ts_ms);
}

std::string SnapshotBuilder::lineage_hash(const std::optional<PerceptionState>& previous,
                                          const PerceptionState& current) {
    std::string prev = previous ? nlohmann::json(*previous).dump() : "GENESIS";
    return util::hash_parts({prev, nlohmann::json(current).dump()});
}
