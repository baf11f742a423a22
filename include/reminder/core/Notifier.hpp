#pragma once

#include <QString>

namespace reminder {
namespace core {

// Fire-and-forget delivery of a user-visible notification.
class Notifier
{
public:
    virtual ~Notifier() = default;
    virtual void notify(const QString &title, const QString &body) = 0;
};

} // namespace core
} // namespace reminder
