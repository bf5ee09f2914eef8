#pragma once

#include "atlas/services/store_status.h"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

// A Location or Quest as seen by the map editor.
struct EntityRecord {
    std::uint32_t id{0};
    std::uint32_t worldId{0};
    std::string name;
    std::string description;
};

struct EntityDraft {
    std::uint32_t worldId{0};
    std::string name;
    std::string description;
};

class EntityStore {
public:
    using ListCallback = std::function<void(StoreStatus, const std::vector<EntityRecord>&)>;
    using CreateCallback = std::function<void(StoreStatus, std::uint32_t)>;
    using GetCallback = std::function<void(StoreStatus, const std::optional<EntityRecord>&)>;

    virtual ~EntityStore() = default;

    virtual void listForWorld(std::uint32_t worldId, ListCallback done) = 0;
    virtual void create(const EntityDraft& draft, CreateCallback done) = 0;
    virtual void getById(std::uint32_t id, GetCallback done) = 0;
};
