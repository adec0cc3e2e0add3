#include "event_bus_service.h"

#include <QDateTime>
#include <QSet>
#include <QUuid>
#include <QDebug>

#include <algorithm>

namespace geocore {

EventBusService::EventBusService(QObject* parent)
    : QObject(parent)
{
}

EventBusService::~EventBusService() = default;

// =============================================================================
// Publish/Subscribe
// =============================================================================

int EventBusService::publish(const QString& topic,
                             const QVariantMap& data,
                             const QString& senderId)
{
    Event event;
    event.topic = topic;
    event.senderId = senderId;
    event.data = data;
    event.timestamp = QDateTime::currentMSecsSinceEpoch();

    QList<Subscription> matches;

    {
        QMutexLocker locker(&m_mutex);
        m_eventCounts[topic]++;
        matches = findMatchingSubscriptions(topic);
    }

    if (matches.isEmpty()) {
        return 0;
    }

    // Priority descending, then subscription order
    std::sort(matches.begin(), matches.end(),
              [](const Subscription& a, const Subscription& b) {
                  if (a.options.priority != b.options.priority) {
                      return a.options.priority > b.options.priority;
                  }
                  return a.sequence < b.sequence;
              });

    int notified = 0;

    for (const Subscription& sub : matches) {
        if (sub.paused) {
            continue;
        }
        if (!sub.options.receiveOwnEvents && !event.senderId.isEmpty()
            && sub.subscriberId == event.senderId) {
            continue;
        }
        if (sub.options.filter && !sub.options.filter(event)) {
            continue;
        }
        notified++;

        try {
            sub.handler(event);
        } catch (const std::exception& e) {
            qWarning() << "EventBus: Handler" << sub.id << "of" << sub.subscriberId
                       << "failed on" << topic << ":" << e.what();
            emit handlerFailed(sub.id, topic, QString::fromUtf8(e.what()));
        }
    }

    return notified;
}

QString EventBusService::subscribe(const QString& pattern,
                                   const QString& subscriberId,
                                   EventHandler handler,
                                   const SubscriptionOptions& options)
{
    if (!handler) {
        qWarning() << "EventBus: Cannot subscribe with null handler";
        return {};
    }
    if (pattern.isEmpty()) {
        qWarning() << "EventBus: Cannot subscribe to an empty pattern";
        return {};
    }

    Subscription sub;
    sub.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    sub.pattern = pattern;
    sub.subscriberId = subscriberId;
    sub.options = options;
    sub.regex = compilePattern(pattern);
    sub.handler = std::move(handler);

    {
        QMutexLocker locker(&m_mutex);
        sub.sequence = m_nextSequence++;
        m_subscriptions.insert(sub.id, sub);
        m_subscriberIndex[sub.subscriberId].append(sub.id);
    }

    qDebug() << "EventBus: Subscribed" << subscriberId << "to" << pattern
             << "id:" << sub.id;

    emit subscriptionAdded(sub.id, pattern);
    emit subscribersChanged();

    return sub.id;
}

bool EventBusService::unsubscribe(const QString& subscriptionId)
{
    {
        QMutexLocker locker(&m_mutex);

        auto it = m_subscriptions.find(subscriptionId);
        if (it == m_subscriptions.end()) {
            return false;
        }

        const QString subscriberId = it->subscriberId;
        m_subscriptions.erase(it);
        m_subscriberIndex[subscriberId].removeAll(subscriptionId);

        if (m_subscriberIndex[subscriberId].isEmpty()) {
            m_subscriberIndex.remove(subscriberId);
        }
    }

    qDebug() << "EventBus: Unsubscribed" << subscriptionId;

    emit subscriptionRemoved(subscriptionId);
    emit subscribersChanged();

    return true;
}

void EventBusService::unsubscribeAll(const QString& subscriberId)
{
    QStringList ids;

    {
        QMutexLocker locker(&m_mutex);
        ids = m_subscriberIndex.take(subscriberId);

        for (const QString& id : ids) {
            m_subscriptions.remove(id);
        }
    }

    for (const QString& id : ids) {
        emit subscriptionRemoved(id);
    }

    if (!ids.isEmpty()) {
        qDebug() << "EventBus: Unsubscribed all for" << subscriberId
                 << "(" << ids.size() << "subscriptions)";
        emit subscribersChanged();
    }
}

bool EventBusService::setSubscriptionPaused(const QString& subscriptionId, bool paused)
{
    QMutexLocker locker(&m_mutex);

    auto it = m_subscriptions.find(subscriptionId);
    if (it == m_subscriptions.end()) {
        return false;
    }
    it->paused = paused;
    return true;
}

// =============================================================================
// Query
// =============================================================================

int EventBusService::subscriberCount(const QString& topic) const
{
    QMutexLocker locker(&m_mutex);
    int count = 0;
    for (auto it = m_subscriptions.constBegin(); it != m_subscriptions.constEnd(); ++it) {
        if (!it->paused && it->regex.match(topic).hasMatch()) {
            count++;
        }
    }
    return count;
}

QStringList EventBusService::subscriptionsFor(const QString& subscriberId) const
{
    QMutexLocker locker(&m_mutex);
    return m_subscriberIndex.value(subscriberId);
}

bool EventBusService::matchesTopic(const QString& topic, const QString& pattern) const
{
    QRegularExpression regex = compilePattern(pattern);
    return regex.match(topic).hasMatch();
}

QStringList EventBusService::activeTopics() const
{
    QMutexLocker locker(&m_mutex);
    QSet<QString> patterns;
    for (auto it = m_subscriptions.constBegin(); it != m_subscriptions.constEnd(); ++it) {
        patterns.insert(it->pattern);
    }
    QStringList result = patterns.values();
    result.sort();
    return result;
}

qint64 EventBusService::eventCount(const QString& topic) const
{
    QMutexLocker locker(&m_mutex);
    return m_eventCounts.value(topic, 0);
}

int EventBusService::totalSubscribers() const
{
    QMutexLocker locker(&m_mutex);
    return m_subscriptions.size();
}

// =============================================================================
// Internal
// =============================================================================

QRegularExpression EventBusService::compilePattern(const QString& pattern) const
{
    QString regex = QRegularExpression::escape(pattern);
    regex.replace("\\*\\*", "<<DOUBLE_STAR>>");
    regex.replace("\\*", "[^/]+");
    regex.replace("<<DOUBLE_STAR>>", ".+");
    regex = "^" + regex + "$";
    return QRegularExpression(regex);
}

QList<EventBusService::Subscription> EventBusService::findMatchingSubscriptions(const QString& topic) const
{
    QList<Subscription> result;
    for (auto it = m_subscriptions.constBegin(); it != m_subscriptions.constEnd(); ++it) {
        if (it->regex.match(topic).hasMatch()) {
            result.append(*it);
        }
    }
    return result;
}

} // namespace geocore
