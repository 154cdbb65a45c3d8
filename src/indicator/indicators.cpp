#include "indicator/indicators.hpp"

#include <format>

static bool has_display(const HostProbe& probe) {
    return !probe.env("DISPLAY").empty() || !probe.env("WAYLAND_DISPLAY").empty();
}

bool YadIndicator::available(const HostProbe& probe) const {
    return has_display(probe) && probe.has_command("yad");
}

std::vector<std::string> YadIndicator::command(int max_seconds) const {
    return {
        "yad", "--notification",
        "--image=audio-input-microphone",
        std::format("--text=Recording (max {}s). Click to stop.", max_seconds),
        "--command=quit",
        "--no-middle",
    };
}

bool ZenityIndicator::available(const HostProbe& probe) const {
    return has_display(probe) && probe.has_command("zenity");
}

std::vector<std::string> ZenityIndicator::command(int max_seconds) const {
    return {
        "zenity", "--info",
        "--title=Speech Recording",
        std::format("--text=Recording in progress (max {}s).\nClick Stop when you are done.",
                    max_seconds),
        "--ok-label=Stop",
    };
}

bool KdialogIndicator::available(const HostProbe& probe) const {
    return has_display(probe) && probe.has_command("kdialog");
}

std::vector<std::string> KdialogIndicator::command(int max_seconds) const {
    return {
        "kdialog", "--title", "Speech Recording",
        "--msgbox", std::format("Recording in progress (max {}s). Click OK to stop.", max_seconds),
    };
}

std::vector<std::unique_ptr<IndicatorCapability>> default_indicators() {
    std::vector<std::unique_ptr<IndicatorCapability>> out;
    out.push_back(std::make_unique<YadIndicator>());
    out.push_back(std::make_unique<ZenityIndicator>());
    out.push_back(std::make_unique<KdialogIndicator>());
    return out;
}

const IndicatorCapability*
select_indicator(const HostProbe& probe,
                 const std::vector<std::unique_ptr<IndicatorCapability>>& candidates) {
    for (const auto& c : candidates) {
        if (c->available(probe)) return c.get();
    }
    return nullptr;
}
