#ifndef ATLAS_MAP_SNAPSHOT_H
#define ATLAS_MAP_SNAPSHOT_H

#include "atlas/core/types.h"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace atlas {

static constexpr std::uint32_t snapshotMagicAmap = 0x50414D41; // "AMAP"
static constexpr std::uint32_t snapshotVersionAmap = 1;
static constexpr std::size_t snapshotHeaderBytesAmap = 4 * 4; // magic + version + sectionCount + reserved
static constexpr std::size_t snapshotSectionEntryBytes = 4 * 4; // tag + offset + size + crc32

struct MapSnapshotData {
    MapDocument map;
    std::uint32_t nextId{1};
    std::uint32_t version{0};
};

// Parse AMAP snapshot bytes into a MapSnapshotData structure.
// Returns EngineError::Ok on success; out is unspecified on failure.
EngineError parseMapSnapshot(const std::uint8_t* src, std::uint32_t byteCount, MapSnapshotData& out);

// Build bytes for an AMAP snapshot. Objects are written in layer order, so
// z-order survives a round trip.
std::vector<std::uint8_t> buildMapSnapshotBytes(const MapSnapshotData& data);

} // namespace atlas

#endif // ATLAS_MAP_SNAPSHOT_H
