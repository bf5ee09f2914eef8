#pragma once

#include "atlas/core/types.h"
#include "atlas/services/entity_store.h"
#include "atlas/services/modal_service.h"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

class MapEngine; // Forward declaration

// A placed marker waiting for the user to pick or create the entity it stands for.
struct PendingLink {
    std::uint32_t token{0};
    LinkKind kind{LinkKind::None};
    MapObject candidate;
};

// Draw first, attach second: a marker placed with add-location / add-quest is held
// here until the link dialog resolves. Only a confirmed link reaches the layer model.
class LinkingWorkflow {
public:
    using CandidateCallback = std::function<void(const std::vector<EntityRecord>&)>;

    explicit LinkingWorkflow(MapEngine& engine);

    bool hasPending() const noexcept { return pending_.has_value(); }
    const PendingLink* pending() const noexcept { return pending_ ? &*pending_ : nullptr; }

    // Holds the candidate and opens the matching link dialog. Fails while another
    // candidate is pending.
    bool begin(MapObject candidate, LinkKind kind);

    // Finalizes the pending candidate with entityId and commits it to its layer.
    bool confirm(std::uint32_t entityId);
    // Drops the pending candidate. Nothing is persisted.
    bool cancel();

    // Dialog result for the request issued under token. Stale tokens are ignored.
    void resolve(std::uint32_t token, const ModalResult& result);

    // Creates a new entity of the pending kind in the map's world and links it.
    // Blank names are rejected.
    bool createAndLink(const std::string& name, const std::string& description);

    // Lists entities of the pending kind whose name contains filter (case-insensitive).
    bool listCandidates(const std::string& filter, CandidateCallback done);

    // Forget the candidate without touching the document (map reload).
    void reset() noexcept { pending_.reset(); }

    static ModalType modalTypeFor(LinkKind kind) noexcept;
    static const char* modalTitleFor(LinkKind kind) noexcept;

private:
    EntityStore* storeFor(LinkKind kind) const;

    MapEngine& engine_;
    std::optional<PendingLink> pending_;
    std::uint32_t nextToken_{1};
};
