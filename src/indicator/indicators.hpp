#pragma once

#include "indicator/indicator.hpp"

#include <memory>
#include <vector>

// Tray icon; clicking it quits yad.
class YadIndicator : public IndicatorCapability {
public:
    std::string name() const override { return "yad"; }
    bool available(const HostProbe& probe) const override;
    std::vector<std::string> command(int max_seconds) const override;
};

class ZenityIndicator : public IndicatorCapability {
public:
    std::string name() const override { return "zenity"; }
    bool available(const HostProbe& probe) const override;
    std::vector<std::string> command(int max_seconds) const override;
};

class KdialogIndicator : public IndicatorCapability {
public:
    std::string name() const override { return "kdialog"; }
    bool available(const HostProbe& probe) const override;
    std::vector<std::string> command(int max_seconds) const override;
};

std::vector<std::unique_ptr<IndicatorCapability>> default_indicators();

// First available candidate, nullptr if none. The returned pointer refers
// into `candidates`.
const IndicatorCapability*
select_indicator(const HostProbe& probe,
                 const std::vector<std::unique_ptr<IndicatorCapability>>& candidates);
