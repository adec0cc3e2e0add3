#pragma once

#include <QAtomicInt>
#include <QSharedPointer>
#include <QVector>

#include <algorithm>

namespace geocore {

/**
 * @brief Read side of a cooperative cancellation flag
 *
 * Copies share the same flag. A default-constructed token can never be
 * cancelled. A linked token observes several flags and reports
 * cancellation once any of them is set.
 */
class CancellationToken
{
public:
    CancellationToken() = default;

    bool isCancellationRequested() const
    {
        return std::any_of(m_flags.cbegin(), m_flags.cend(),
                           [](const QSharedPointer<QAtomicInt>& flag) {
                               return flag->loadAcquire() != 0;
                           });
    }

    bool canBeCancelled() const { return !m_flags.isEmpty(); }

    static CancellationToken linked(const CancellationToken& first, const CancellationToken& second)
    {
        CancellationToken token;
        token.m_flags = first.m_flags;
        for (const QSharedPointer<QAtomicInt>& flag : second.m_flags) {
            if (!token.m_flags.contains(flag)) {
                token.m_flags.append(flag);
            }
        }
        return token;
    }

private:
    friend class CancellationSource;
    explicit CancellationToken(const QSharedPointer<QAtomicInt>& flag) : m_flags{flag} {}

    QVector<QSharedPointer<QAtomicInt>> m_flags;
};

/**
 * @brief Owner side of a cooperative cancellation flag
 */
class CancellationSource
{
public:
    CancellationSource() : m_flag(QSharedPointer<QAtomicInt>::create(0)) {}

    void cancel() { m_flag->storeRelease(1); }
    bool isCancellationRequested() const { return m_flag->loadAcquire() != 0; }
    CancellationToken token() const { return CancellationToken(m_flag); }

private:
    QSharedPointer<QAtomicInt> m_flag;
};

} // namespace geocore
