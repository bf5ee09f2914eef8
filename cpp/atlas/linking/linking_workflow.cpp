#include "atlas/linking/linking_workflow.h"
#include "atlas/core/logging.h"
#include "atlas/core/string_utils.h"
#include "atlas/engine.h"
#include <utility>

LinkingWorkflow::LinkingWorkflow(MapEngine& engine)
    : engine_(engine) {}

ModalType LinkingWorkflow::modalTypeFor(LinkKind kind) noexcept {
    return kind == LinkKind::Quest ? ModalType::LinkQuest : ModalType::LinkLocation;
}

const char* LinkingWorkflow::modalTitleFor(LinkKind kind) noexcept {
    return kind == LinkKind::Quest ? "Link a Quest" : "Link a Location";
}

EntityStore* LinkingWorkflow::storeFor(LinkKind kind) const {
    return engine_.entityStoreFor(kind);
}

bool LinkingWorkflow::begin(MapObject candidate, LinkKind kind) {
    if (pending_) {
        ATLAS_LOG_DEBUG("link already pending for marker %u, ignoring new placement", pending_->candidate.id);
        return false;
    }
    if (kind == LinkKind::None || candidate.kind() != MapObjectKind::Marker) return false;

    const std::uint32_t token = nextToken_++;
    pending_ = PendingLink{token, kind, std::move(candidate)};

    ModalRequest request;
    request.type = modalTypeFor(kind);
    request.title = modalTitleFor(kind);
    engine_.showModal(request, [this, token](const ModalResult& result) {
        resolve(token, result);
    });
    return true;
}

bool LinkingWorkflow::confirm(std::uint32_t entityId) {
    if (!pending_ || entityId == 0) return false;

    MapObject candidate = std::move(pending_->candidate);
    const LinkKind kind = pending_->kind;
    pending_.reset();

    if (MarkerShape* marker = candidate.marker()) {
        marker->link = EntityLink{kind, entityId};
    }
    return engine_.commitLinkedMarker(std::move(candidate));
}

bool LinkingWorkflow::cancel() {
    if (!pending_) return false;
    ATLAS_LOG_DEBUG("link cancelled, dropping marker %u", pending_->candidate.id);
    pending_.reset();
    return true;
}

void LinkingWorkflow::resolve(std::uint32_t token, const ModalResult& result) {
    if (!pending_ || pending_->token != token) {
        ATLAS_LOG_DEBUG("stale link result for token %u", token);
        return;
    }
    if (result.confirmed && result.entityId != 0) {
        confirm(result.entityId);
    } else {
        cancel();
    }
}

bool LinkingWorkflow::createAndLink(const std::string& name, const std::string& description) {
    if (!pending_) return false;
    if (atlas::isBlank(name)) return false;
    EntityStore* store = storeFor(pending_->kind);
    if (!store) return false;

    EntityDraft draft;
    draft.worldId = engine_.map().worldId;
    draft.name = name;
    draft.description = description;

    const std::uint32_t token = pending_->token;
    store->create(draft, [this, alive = engine_.lifetime(), token](StoreStatus status, std::uint32_t entityId) {
        if (alive.expired()) return;
        if (!pending_ || pending_->token != token) {
            ATLAS_LOG_DEBUG("entity %u created after link %u was closed", entityId, token);
            return;
        }
        if (status != StoreStatus::Ok || entityId == 0) {
            ATLAS_LOG_WARN("entity create failed (%s), link stays pending", storeStatusName(status));
            return;
        }
        confirm(entityId);
    });
    return true;
}

bool LinkingWorkflow::listCandidates(const std::string& filter, CandidateCallback done) {
    if (!pending_ || !done) return false;
    EntityStore* store = storeFor(pending_->kind);
    if (!store) return false;

    store->listForWorld(engine_.map().worldId,
        [filter, done = std::move(done)](StoreStatus status, const std::vector<EntityRecord>& records) {
            std::vector<EntityRecord> matches;
            if (status != StoreStatus::Ok) {
                ATLAS_LOG_WARN("entity list failed (%s)", storeStatusName(status));
                done(matches);
                return;
            }
            for (const EntityRecord& record : records) {
                if (atlas::containsIgnoreCase(record.name, filter)) {
                    matches.push_back(record);
                }
            }
            done(matches);
        });
    return true;
}
