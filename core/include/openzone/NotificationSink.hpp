#pragma once
#include <string>

namespace openzone {

enum class Severity { Info, Warning, Error };

// Operator-facing messages (status bar, toasts...).
class NotificationSink {
public:
    virtual ~NotificationSink() = default;
    virtual void notify(const std::string &title, const std::string &message,
                        Severity severity) = 0;
};

} // namespace openzone
