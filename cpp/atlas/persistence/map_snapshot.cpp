#include "atlas/persistence/map_snapshot.h"
#include "atlas/core/util.h"
#include "atlas/persistence/snapshot_internal.h"
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace {
struct SectionView {
    const std::uint8_t* data{nullptr};
    std::uint32_t size{0};
};

bool readString(const SectionView& sec, std::size_t& o, std::string& out) {
    using atlas::snapshot::detail::requireBytes;
    if (!requireBytes(o, 4, sec.size)) return false;
    const std::uint32_t len = readU32(sec.data, o); o += 4;
    if (!requireBytes(o, len, sec.size)) return false;
    out.assign(reinterpret_cast<const char*>(sec.data + o), len);
    o += len;
    return true;
}
} // namespace

namespace atlas {
using namespace snapshot::detail;

EngineError parseMapSnapshot(const std::uint8_t* src, std::uint32_t byteCount, MapSnapshotData& out) {
    if (!src || byteCount < snapshotHeaderBytesAmap) {
        return EngineError::BufferTruncated;
    }

    const std::uint32_t magic = readU32(src, 0);
    if (magic != snapshotMagicAmap) return EngineError::InvalidMagic;

    const std::uint32_t version = readU32(src, 4);
    if (version != snapshotVersionAmap) return EngineError::UnsupportedVersion;
    out.version = version;

    const std::uint32_t sectionCount = readU32(src, 8);
    const std::size_t headerBytes = snapshotHeaderBytesAmap;
    std::size_t tableBytes = 0;
    if (!tryMul(static_cast<std::size_t>(sectionCount), snapshotSectionEntryBytes, tableBytes)) {
        return EngineError::InvalidPayloadSize;
    }
    std::size_t headerPlusTable = 0;
    if (!tryAdd(headerBytes, tableBytes, headerPlusTable)) {
        return EngineError::InvalidPayloadSize;
    }
    if (byteCount < headerPlusTable) {
        return EngineError::BufferTruncated;
    }

    std::unordered_map<std::uint32_t, SectionView> sections;
    sections.reserve(sectionCount);

    for (std::uint32_t i = 0; i < sectionCount; ++i) {
        const std::size_t base = headerBytes + i * snapshotSectionEntryBytes;
        const std::uint32_t tag = readU32(src, base + 0);
        const std::uint32_t offset = readU32(src, base + 4);
        const std::uint32_t size = readU32(src, base + 8);
        const std::uint32_t expectedCrc = readU32(src, base + 12);

        std::size_t end = 0;
        if (!tryAdd(static_cast<std::size_t>(offset), static_cast<std::size_t>(size), end)) {
            return EngineError::InvalidPayloadSize;
        }
        if (offset < headerPlusTable) return EngineError::InvalidPayloadSize;
        if (end > byteCount) return EngineError::BufferTruncated;

        const std::uint8_t* payload = src + offset;
        const std::uint32_t actualCrc = crc32(payload, size);
        if (actualCrc != expectedCrc) return EngineError::InvalidPayloadSize;

        if (sections.find(tag) == sections.end()) {
            sections.emplace(tag, SectionView{payload, size});
        }
    }

    const auto findSection = [&](std::uint32_t tag) -> const SectionView* {
        auto it = sections.find(tag);
        if (it == sections.end()) return nullptr;
        return &it->second;
    };

    const SectionView* meta = findSection(TAG_META);
    const SectionView* layr = findSection(TAG_LAYR);
    const SectionView* objs = findSection(TAG_OBJS);
    const SectionView* nidx = findSection(TAG_NIDX);
    if (!meta || !layr || !objs || !nidx) {
        return EngineError::InvalidPayloadSize;
    }

    MapDocument& map = out.map;

    // META
    {
        std::size_t o = 0;
        if (!requireBytes(o, metaFixedBytes, meta->size)) return EngineError::BufferTruncated;
        map.id = readU32(meta->data, o); o += 4;
        map.worldId = readU32(meta->data, o); o += 4;
        map.gridSize.width = readU32(meta->data, o); o += 4;
        map.gridSize.height = readU32(meta->data, o); o += 4;
        if (!readString(*meta, o, map.name)) return EngineError::BufferTruncated;
        if (!readString(*meta, o, map.description)) return EngineError::BufferTruncated;
        if (!readString(*meta, o, map.imageDataUrl)) return EngineError::BufferTruncated;
    }

    // LAYR
    std::unordered_map<std::uint32_t, std::size_t> layerIndex;
    {
        std::size_t o = 0;
        if (!requireBytes(o, 4, layr->size)) return EngineError::BufferTruncated;
        const std::uint32_t layerCount = readU32(layr->data, o); o += 4;
        // Every layer record needs at least its fixed fields.
        if (layerCount > (layr->size - o) / layerFixedBytes) return EngineError::BufferTruncated;

        map.layers.clear();
        map.layers.reserve(layerCount);
        for (std::uint32_t i = 0; i < layerCount; ++i) {
            if (!requireBytes(o, layerFixedBytes - 4, layr->size)) return EngineError::BufferTruncated;
            MapLayer layer;
            layer.id = readU32(layr->data, o); o += 4;
            const std::uint32_t type = readU32(layr->data, o); o += 4;
            const std::uint32_t flags = readU32(layr->data, o); o += 4;
            if (!readString(*layr, o, layer.name)) return EngineError::BufferTruncated;

            if (layer.id == 0) return EngineError::InvalidPayloadSize;
            if (type > static_cast<std::uint32_t>(LayerType::Quest)) return EngineError::InvalidPayloadSize;
            if (layerIndex.find(layer.id) != layerIndex.end()) return EngineError::InvalidPayloadSize;
            layer.type = static_cast<LayerType>(type);
            layer.isVisible = (flags & kLayerFlagVisible) != 0;

            layerIndex.emplace(layer.id, map.layers.size());
            map.layers.push_back(std::move(layer));
        }
    }

    // OBJS
    {
        std::size_t o = 0;
        if (!requireBytes(o, 4, objs->size)) return EngineError::BufferTruncated;
        const std::uint32_t objectCount = readU32(objs->data, o); o += 4;
        if (objectCount > (objs->size - o) / (objectHeaderBytes + markerPayloadBytes)) {
            return EngineError::BufferTruncated;
        }

        std::unordered_set<std::uint32_t> seenIds;
        for (std::uint32_t i = 0; i < objectCount; ++i) {
            if (!requireBytes(o, objectHeaderBytes, objs->size)) return EngineError::BufferTruncated;
            const std::uint32_t id = readU32(objs->data, o); o += 4;
            const std::uint32_t layerId = readU32(objs->data, o); o += 4;
            const std::uint32_t kind = readU32(objs->data, o); o += 4;

            if (id == 0 || !seenIds.insert(id).second) return EngineError::InvalidPayloadSize;
            const auto layerIt = layerIndex.find(layerId);
            if (layerIt == layerIndex.end()) return EngineError::InvalidPayloadSize;
            MapLayer& layer = map.layers[layerIt->second];

            if (kind == static_cast<std::uint32_t>(MapObjectKind::Marker)) {
                if (!requireBytes(o, markerPayloadBytes, objs->size)) return EngineError::BufferTruncated;
                const float x = readF32(objs->data, o); o += 4;
                const float y = readF32(objs->data, o); o += 4;
                const std::uint32_t linkKind = readU32(objs->data, o); o += 4;
                const std::uint32_t linkId = readU32(objs->data, o); o += 4;
                if (linkKind > static_cast<std::uint32_t>(LinkKind::Quest)) return EngineError::InvalidPayloadSize;
                EntityLink link{static_cast<LinkKind>(linkKind), linkId};
                layer.objects.push_back(makeMarkerObject(id, layerId, x, y, link));
                continue;
            }

            if (kind != static_cast<std::uint32_t>(MapObjectKind::Zone)) {
                return EngineError::InvalidPayloadSize;
            }

            if (!requireBytes(o, 4, objs->size)) return EngineError::BufferTruncated;
            const std::uint32_t color = readU32(objs->data, o); o += 4;
            std::string name;
            if (!readString(*objs, o, name)) return EngineError::BufferTruncated;
            if (!requireBytes(o, 4, objs->size)) return EngineError::BufferTruncated;
            const std::uint32_t pointCount = readU32(objs->data, o); o += 4;
            if (pointCount < 3) return EngineError::InvalidPayloadSize;

            std::size_t pointBytes = 0;
            if (!tryMul(static_cast<std::size_t>(pointCount), zonePointBytes, pointBytes)) {
                return EngineError::InvalidPayloadSize;
            }
            if (!requireBytes(o, pointBytes, objs->size)) return EngineError::BufferTruncated;

            std::vector<Point2> points;
            points.reserve(pointCount);
            for (std::uint32_t k = 0; k < pointCount; ++k) {
                const float px = readF32(objs->data, o); o += 4;
                const float py = readF32(objs->data, o); o += 4;
                points.push_back(Point2{px, py});
            }

            MapObject obj = makeZoneObject(id, layerId, std::move(points));
            obj.zone()->name = std::move(name);
            obj.zone()->colorRGBA = color;
            layer.objects.push_back(std::move(obj));
        }
    }

    // NIDX
    {
        if (!requireBytes(0, 4, nidx->size)) return EngineError::BufferTruncated;
        out.nextId = readU32(nidx->data, 0);
        if (out.nextId == 0) return EngineError::InvalidPayloadSize;
    }

    return EngineError::Ok;
}

} // namespace atlas
