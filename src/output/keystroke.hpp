#pragma once

#include "platform/host_probe.hpp"

#include <expected>
#include <memory>
#include <string>
#include <vector>

// Synthesizes the paste shortcut in whatever window has focus.
class KeystrokeCapability {
public:
    virtual ~KeystrokeCapability() = default;

    virtual std::string name() const = 0;
    virtual bool available(const HostProbe& probe) const = 0;

    // Ctrl+V, or Ctrl+Shift+V for terminal emulators.
    virtual std::vector<std::string> paste_command(bool terminal) const = 0;

    virtual std::expected<void, std::string> paste(bool terminal);
};

class WtypeKeystroke : public KeystrokeCapability {
public:
    std::string name() const override { return "wtype"; }
    bool available(const HostProbe& probe) const override;
    std::vector<std::string> paste_command(bool terminal) const override;
};

class XdotoolKeystroke : public KeystrokeCapability {
public:
    std::string name() const override { return "xdotool"; }
    bool available(const HostProbe& probe) const override;
    std::vector<std::string> paste_command(bool terminal) const override;
};

// Works on any display server but needs ydotoold running.
class YdotoolKeystroke : public KeystrokeCapability {
public:
    std::string name() const override { return "ydotool"; }
    bool available(const HostProbe& probe) const override;
    std::vector<std::string> paste_command(bool terminal) const override;
};

std::vector<std::unique_ptr<KeystrokeCapability>> default_keystrokes();
