#include "notify/desktop_notifier.hpp"

#include "platform/linux/subprocess.hpp"

#include <print>

DesktopNotifier::DesktopNotifier(const HostProbe& probe, bool enabled) {
    if (!enabled) return;

    bool graphical = !probe.env("DISPLAY").empty() || !probe.env("WAYLAND_DISPLAY").empty();
    if (!graphical) return;

    if (probe.has_command("notify-send")) method_ = Method::NotifySend;
    else if (probe.has_command("kdialog")) method_ = Method::Kdialog;
    else if (probe.has_command("zenity")) method_ = Method::Zenity;
    else if (probe.has_command("xmessage")) method_ = Method::Xmessage;
}

std::vector<std::string> DesktopNotifier::command(const std::string& title,
                                                  const std::string& message,
                                                  Urgency urgency) const {
    switch (method_) {
        case Method::NotifySend: {
            const char* level = urgency == Urgency::Critical ? "critical"
                              : urgency == Urgency::Low      ? "low"
                                                             : "normal";
            return {"notify-send", "-a", "conduit", "-u", level, title, message};
        }
        case Method::Kdialog:
            return {"kdialog", "--title", title, "--passivepopup", message, "5"};
        case Method::Zenity:
            return {"zenity", urgency == Urgency::Critical ? "--error" : "--info",
                    "--title=" + title, "--text=" + message, "--timeout=5"};
        case Method::Xmessage:
            return {"xmessage", "-timeout", "5", title + ": " + message};
        case Method::Log:
            break;
    }
    return {};
}

void DesktopNotifier::notify(const std::string& title, const std::string& message,
                             Urgency urgency) {
    if (method_ != Method::Log) {
        // Dialog-style tools block until dismissed, so never wait on them
        if (platform::spawn_detached(command(title, message, urgency))) return;
    }
    std::println(stderr, "[{}] {}", title, message);
}
