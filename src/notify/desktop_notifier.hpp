#pragma once

#include "notify/notifier.hpp"
#include "platform/host_probe.hpp"

#include <string>
#include <vector>

// Desktop notifications through the first available tool, chosen once at
// construction. Falls back to stderr when nothing is installed or when
// notifications are disabled.
class DesktopNotifier : public Notifier {
public:
    enum class Method { NotifySend, Kdialog, Zenity, Xmessage, Log };

    DesktopNotifier(const HostProbe& probe, bool enabled = true);

    void notify(const std::string& title, const std::string& message,
                Urgency urgency = Urgency::Normal) override;

    Method method() const { return method_; }

    // Command line for the selected method, empty for Method::Log.
    std::vector<std::string> command(const std::string& title, const std::string& message,
                                     Urgency urgency) const;

private:
    Method method_ = Method::Log;
};
