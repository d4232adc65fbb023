// Funding Arb Engine - Notification Port

#pragma once

#include <memory>
#include <string>

namespace fundarb {

class NotificationPort {
public:
    virtual ~NotificationPort() = default;

    // Returns false when delivery failed
    virtual bool send_message(const std::string& text) = 0;
};

using NotificationPtr = std::shared_ptr<NotificationPort>;

}  // namespace fundarb
