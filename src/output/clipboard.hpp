#pragma once

#include "platform/host_probe.hpp"

#include <expected>
#include <memory>
#include <string>
#include <vector>

// A command that takes text on stdin and owns the clipboard selection.
class ClipboardCapability {
public:
    virtual ~ClipboardCapability() = default;

    virtual std::string name() const = 0;
    virtual bool available(const HostProbe& probe) const = 0;
    virtual std::vector<std::string> command() const = 0;

    virtual std::expected<void, std::string> copy(const std::string& text);
};

class WlCopyClipboard : public ClipboardCapability {
public:
    std::string name() const override { return "wl-copy"; }
    bool available(const HostProbe& probe) const override;
    std::vector<std::string> command() const override { return {"wl-copy"}; }
};

class XclipClipboard : public ClipboardCapability {
public:
    std::string name() const override { return "xclip"; }
    bool available(const HostProbe& probe) const override;
    std::vector<std::string> command() const override {
        return {"xclip", "-selection", "clipboard"};
    }
};

class XselClipboard : public ClipboardCapability {
public:
    std::string name() const override { return "xsel"; }
    bool available(const HostProbe& probe) const override;
    std::vector<std::string> command() const override {
        return {"xsel", "--clipboard", "--input"};
    }
};

std::vector<std::unique_ptr<ClipboardCapability>> default_clipboards();
