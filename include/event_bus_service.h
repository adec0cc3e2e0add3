#pragma once

#include <geocore/interfaces/ieventbus.h>

#include <QObject>
#include <QHash>
#include <QMutex>
#include <QRegularExpression>

namespace geocore {

/**
 * @brief Event bus service implementation
 *
 * Provides:
 * - Publish/Subscribe with callback handlers
 * - Wildcard topic matching (* and **)
 * - Priority-based delivery ordering, subscription order within a priority
 * - Pausing a subscription without removing it
 * - Thread-safe operations
 *
 * Handlers run on the publishing thread, outside the internal lock, so a
 * handler may publish or subscribe itself.
 */
class EventBusService : public QObject, public IEventBus
{
    Q_OBJECT
    Q_PROPERTY(int totalSubscribers READ totalSubscribers NOTIFY subscribersChanged)

public:
    explicit EventBusService(QObject* parent = nullptr);
    ~EventBusService() override;

    // ===== Publish/Subscribe =====

    int publish(const QString& topic,
                const QVariantMap& data = {},
                const QString& senderId = {}) override;

    QString subscribe(const QString& pattern,
                      const QString& subscriberId,
                      EventHandler handler,
                      const SubscriptionOptions& options = {}) override;

    bool unsubscribe(const QString& subscriptionId) override;
    void unsubscribeAll(const QString& subscriberId) override;
    bool setSubscriptionPaused(const QString& subscriptionId, bool paused) override;

    // ===== Query =====

    int subscriberCount(const QString& topic) const override;
    QStringList subscriptionsFor(const QString& subscriberId) const override;
    bool matchesTopic(const QString& topic, const QString& pattern) const override;

    QStringList activeTopics() const;
    qint64 eventCount(const QString& topic) const;
    int totalSubscribers() const;

signals:
    void subscribersChanged();
    void subscriptionAdded(const QString& subscriptionId, const QString& pattern);
    void subscriptionRemoved(const QString& subscriptionId);
    void handlerFailed(const QString& subscriptionId, const QString& topic, const QString& message);

private:
    struct Subscription {
        QString id;
        QString pattern;
        QString subscriberId;
        SubscriptionOptions options;
        QRegularExpression regex;
        EventHandler handler;
        quint64 sequence = 0;
        bool paused = false;
    };

    QRegularExpression compilePattern(const QString& pattern) const;
    QList<Subscription> findMatchingSubscriptions(const QString& topic) const;

    mutable QMutex m_mutex;
    QHash<QString, Subscription> m_subscriptions;
    QHash<QString, QStringList> m_subscriberIndex;
    QHash<QString, qint64> m_eventCounts;
    quint64 m_nextSequence = 0;
};

} // namespace geocore
