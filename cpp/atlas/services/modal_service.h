#pragma once

#include <cstdint>
#include <functional>
#include <string>

enum class ModalType : std::uint8_t {
    Alert = 0,
    Confirmation = 1,
    LinkLocation = 2,
    LinkQuest = 3,
};

struct ModalRequest {
    ModalType type{ModalType::Alert};
    std::string title;
    std::string message;
    bool isDanger{false};
};

// confirmed is false when the dialog was cancelled or dismissed.
// entityId is only meaningful for the link dialogs.
struct ModalResult {
    bool confirmed{false};
    std::uint32_t entityId{0};
};

// Dialogs are rendered by the host; the engine only issues requests and reacts to results.
class ModalService {
public:
    using ResultCallback = std::function<void(const ModalResult&)>;

    virtual ~ModalService() = default;

    virtual void showModal(const ModalRequest& request, ResultCallback onClose) = 0;
};
