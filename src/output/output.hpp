#pragma once

#include "platform/window_info.hpp"

#include <optional>
#include <string>

struct DeliveryOutcome {
    enum class Kind { Pasted, ClipboardOnly, NoClipboard };

    Kind kind = Kind::NoClipboard;
    std::string detail;
};

inline const char* to_string(DeliveryOutcome::Kind k) {
    switch (k) {
    case DeliveryOutcome::Kind::Pasted:        return "pasted";
    case DeliveryOutcome::Kind::ClipboardOnly: return "clipboard";
    case DeliveryOutcome::Kind::NoClipboard:   return "none";
    }
    return "unknown";
}

class OutputMethod {
public:
    virtual ~OutputMethod() = default;

    // Remember where the text should go. Called before recording starts.
    virtual void capture_target() {}

    virtual DeliveryOutcome deliver(const std::string& text) = 0;

    virtual std::optional<WindowInfo> target() const { return std::nullopt; }
};
