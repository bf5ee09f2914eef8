#include "atlas/persistence/map_snapshot.h"
#include "atlas/core/util.h"
#include "atlas/persistence/snapshot_internal.h"
#include <cstring>
#include <string>

namespace atlas {
using namespace snapshot::detail;

std::vector<std::uint8_t> buildMapSnapshotBytes(const MapSnapshotData& data) {
    const std::uint32_t version = snapshotVersionAmap;

    struct SectionBytes {
        std::uint32_t tag;
        std::vector<std::uint8_t> bytes;
    };

    std::vector<SectionBytes> sections;
    sections.reserve(4);

    auto appendU32 = [](std::vector<std::uint8_t>& out, std::uint32_t v) {
        const std::size_t o = out.size();
        out.resize(o + 4);
        writeU32LE(out.data(), o, v);
    };
    auto appendF32 = [](std::vector<std::uint8_t>& out, float v) {
        const std::size_t o = out.size();
        out.resize(o + 4);
        writeF32LE(out.data(), o, v);
    };
    auto appendString = [&](std::vector<std::uint8_t>& out, const std::string& s) {
        appendU32(out, static_cast<std::uint32_t>(s.size()));
        const std::size_t o = out.size();
        out.resize(o + s.size());
        if (!s.empty()) {
            std::memcpy(out.data() + o, s.data(), s.size());
        }
    };

    const MapDocument& map = data.map;

    // META
    {
        SectionBytes sec{TAG_META, {}};
        auto& out = sec.bytes;
        appendU32(out, map.id);
        appendU32(out, map.worldId);
        appendU32(out, map.gridSize.width);
        appendU32(out, map.gridSize.height);
        appendString(out, map.name);
        appendString(out, map.description);
        appendString(out, map.imageDataUrl);
        sections.push_back(std::move(sec));
    }

    // LAYR
    {
        SectionBytes sec{TAG_LAYR, {}};
        auto& out = sec.bytes;
        appendU32(out, static_cast<std::uint32_t>(map.layers.size()));
        for (const MapLayer& layer : map.layers) {
            appendU32(out, layer.id);
            appendU32(out, static_cast<std::uint32_t>(layer.type));
            appendU32(out, layer.isVisible ? kLayerFlagVisible : 0u);
            appendString(out, layer.name);
        }
        sections.push_back(std::move(sec));
    }

    // OBJS
    {
        SectionBytes sec{TAG_OBJS, {}};
        auto& out = sec.bytes;
        std::uint32_t objectCount = 0;
        for (const MapLayer& layer : map.layers) {
            objectCount += static_cast<std::uint32_t>(layer.objects.size());
        }
        appendU32(out, objectCount);

        for (const MapLayer& layer : map.layers) {
            for (const MapObject& obj : layer.objects) {
                appendU32(out, obj.id);
                appendU32(out, layer.id);
                appendU32(out, static_cast<std::uint32_t>(obj.kind()));
                if (const MarkerShape* marker = obj.marker()) {
                    appendF32(out, marker->x);
                    appendF32(out, marker->y);
                    appendU32(out, static_cast<std::uint32_t>(marker->link.kind));
                    appendU32(out, marker->link.id);
                } else if (const ZoneShape* zone = obj.zone()) {
                    appendU32(out, zone->colorRGBA);
                    appendString(out, zone->name);
                    appendU32(out, static_cast<std::uint32_t>(zone->points.size()));
                    for (const Point2& pt : zone->points) {
                        appendF32(out, pt.x);
                        appendF32(out, pt.y);
                    }
                }
            }
        }
        sections.push_back(std::move(sec));
    }

    // NIDX
    {
        SectionBytes sec{TAG_NIDX, {}};
        appendU32(sec.bytes, data.nextId);
        sections.push_back(std::move(sec));
    }

    const std::size_t headerBytes = snapshotHeaderBytesAmap;
    const std::size_t tableBytes = sections.size() * snapshotSectionEntryBytes;
    std::size_t totalBytes = headerBytes + tableBytes;
    for (const auto& sec : sections) totalBytes += sec.bytes.size();

    std::vector<std::uint8_t> bytes(totalBytes);
    writeU32LE(bytes.data(), 0, snapshotMagicAmap);
    writeU32LE(bytes.data(), 4, version);
    writeU32LE(bytes.data(), 8, static_cast<std::uint32_t>(sections.size()));
    writeU32LE(bytes.data(), 12, 0);

    std::size_t offset = headerBytes + tableBytes;
    for (std::size_t i = 0; i < sections.size(); ++i) {
        const auto& sec = sections[i];
        const std::size_t entry = headerBytes + i * snapshotSectionEntryBytes;
        const std::uint32_t size = static_cast<std::uint32_t>(sec.bytes.size());
        writeU32LE(bytes.data(), entry + 0, sec.tag);
        writeU32LE(bytes.data(), entry + 4, static_cast<std::uint32_t>(offset));
        writeU32LE(bytes.data(), entry + 8, size);
        writeU32LE(bytes.data(), entry + 12, crc32(sec.bytes.data(), sec.bytes.size()));
        if (size > 0) {
            std::memcpy(bytes.data() + offset, sec.bytes.data(), size);
        }
        offset += size;
    }

    return bytes;
}

} // namespace atlas
