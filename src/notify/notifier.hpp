#pragma once

#include <string>

enum class Urgency { Low, Normal, Critical };

class Notifier {
public:
    virtual ~Notifier() = default;
    virtual void notify(const std::string& title, const std::string& message,
                        Urgency urgency = Urgency::Normal) = 0;
};
