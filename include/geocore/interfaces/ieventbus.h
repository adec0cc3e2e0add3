#pragma once

#include <QString>
#include <QStringList>
#include <QVariantMap>

#include <functional>

namespace geocore {

struct Event {
    QString topic;
    QString senderId;
    QVariantMap data;
    qint64 timestamp = 0;   // ms since epoch
};

using EventHandler = std::function<void(const Event&)>;
using EventFilter = std::function<bool(const Event&)>;

struct SubscriptionOptions {
    int priority = 0;               // higher runs first within one event
    bool receiveOwnEvents = false;
    EventFilter filter;             // optional, event is skipped when it returns false
};

/**
 * @brief Topic based publish/subscribe shared by all plugins
 *
 * Topics are slash separated ("plugin/com.example.a/state"). Patterns may
 * use '*' for one segment and '**' for any number of segments.
 * Events are delivered synchronously in the order they are published.
 */
class IEventBus
{
public:
    virtual ~IEventBus() = default;

    // Returns the number of handlers the event was delivered to
    virtual int publish(const QString& topic,
                        const QVariantMap& data = {},
                        const QString& senderId = {}) = 0;

    // Returns a subscription id, empty on failure
    virtual QString subscribe(const QString& pattern,
                              const QString& subscriberId,
                              EventHandler handler,
                              const SubscriptionOptions& options = {}) = 0;

    virtual bool unsubscribe(const QString& subscriptionId) = 0;
    virtual void unsubscribeAll(const QString& subscriberId) = 0;
    virtual bool setSubscriptionPaused(const QString& subscriptionId, bool paused) = 0;

    virtual int subscriberCount(const QString& topic) const = 0;
    virtual QStringList subscriptionsFor(const QString& subscriberId) const = 0;
    virtual bool matchesTopic(const QString& topic, const QString& pattern) const = 0;
};

} // namespace geocore
