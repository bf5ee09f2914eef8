// MapEngine snapshot save/load (AMAP).

#include "atlas/engine.h"
#include "atlas/core/logging.h"

MapEngine::ByteBufferMeta MapEngine::saveSnapshot() const {
    atlas::MapSnapshotData data;
    data.map = map_;
    data.nextId = nextId_;
    data.version = atlas::snapshotVersionAmap;
    snapshotBytes_ = atlas::buildMapSnapshotBytes(data);
    return ByteBufferMeta{
        generation_,
        static_cast<std::uint32_t>(snapshotBytes_.size()),
        reinterpret_cast<std::uintptr_t>(snapshotBytes_.data()),
    };
}

EngineError MapEngine::loadSnapshot(const std::uint8_t* src, std::uint32_t byteCount) {
    atlas::MapSnapshotData data;
    const EngineError err = atlas::parseMapSnapshot(src, byteCount, data);
    if (err != EngineError::Ok) {
        ATLAS_LOG_WARN("snapshot rejected (error %u)", static_cast<unsigned>(err));
        setError(err);
        return err;
    }

    loadMap(data.map);
    trackNextId(data.nextId - 1);
    return EngineError::Ok;
}

void MapEngine::loadSnapshotFromPtr(std::uintptr_t ptr, std::uint32_t byteCount) {
    loadSnapshot(reinterpret_cast<const std::uint8_t*>(ptr), byteCount);
}
