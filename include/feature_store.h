#pragma once

#include "feature.h"

#include <QList>
#include <QSet>
#include <QSharedPointer>

#include <functional>
#include <iterator>
#include <optional>

namespace geocore {

/**
 * @brief Lazy, restartable filtered view over a FeatureStore
 *
 * Nothing is evaluated until iteration; every begin() starts a fresh pass.
 * A view reads the store's list directly, so neither the view nor its
 * iterators may outlive the store or be used across a mutation of it.
 * Iterators share the predicate and stay valid after the view itself is
 * gone. Concurrent iteration by several readers is safe.
 */
class FeatureView
{
public:
    using Predicate = std::function<bool(const Feature&)>;

    class const_iterator
    {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = FeaturePtr;
        using difference_type = std::ptrdiff_t;
        using pointer = const FeaturePtr*;
        using reference = const FeaturePtr&;

        const_iterator() = default;

        reference operator*() const { return *m_it; }
        pointer operator->() const { return &*m_it; }

        const_iterator& operator++()
        {
            ++m_it;
            skipRejected();
            return *this;
        }

        const_iterator operator++(int)
        {
            const_iterator previous = *this;
            ++(*this);
            return previous;
        }

        bool operator==(const const_iterator& other) const { return m_it == other.m_it; }
        bool operator!=(const const_iterator& other) const { return m_it != other.m_it; }

    private:
        friend class FeatureView;
        using Base = QList<FeaturePtr>::const_iterator;

        const_iterator(Base it, Base end, QSharedPointer<const Predicate> predicate)
            : m_it(it), m_end(end), m_predicate(std::move(predicate))
        {
            skipRejected();
        }

        void skipRejected()
        {
            while (m_it != m_end && !(*m_predicate)(**m_it)) {
                ++m_it;
            }
        }

        Base m_it;
        Base m_end;
        QSharedPointer<const Predicate> m_predicate;
    };

    FeatureView(const QList<FeaturePtr>* features, Predicate predicate);

    const_iterator begin() const;
    const_iterator end() const;

    QList<FeaturePtr> toList() const;
    int count() const;
    bool isEmpty() const { return begin() == end(); }
    FeaturePtr first() const;

private:
    const QList<FeaturePtr>* m_features;
    QSharedPointer<const Predicate> m_predicate;
};

/**
 * @brief Ordered in-memory collection of shared features
 *
 * Holds references, not ownership of the feature lifetime. The same Feature
 * instance may be held only once; identity is the pointer, not the id, so
 * several features with equal ids may coexist.
 *
 * Read operations may run concurrently. Mutation (add/remove/replace/clear)
 * needs external synchronization against every other operation.
 */
class FeatureStore
{
public:
    FeatureStore() = default;
    explicit FeatureStore(const QList<FeaturePtr>& features);

    int count() const { return static_cast<int>(m_features.size()); }
    bool isEmpty() const { return m_features.isEmpty(); }

    void add(FeaturePtr feature);
    bool remove(const FeaturePtr& feature);
    void clear();

    FeaturePtr at(int index) const;
    void replace(int index, FeaturePtr feature);

    // Union of all bounding boxes, recomputed on each call
    std::optional<Envelope> extent() const;

    // First feature whose id equals @p id (O(n)), or null
    FeaturePtr featureById(const AttributeValue& id) const;

    FeatureView featuresInExtent(const Envelope& envelope) const;
    FeatureView filterByAttribute(const QString& name, const AttributeValue& value) const;
    FeatureView filterByGeometryType(GeometryType type) const;
    FeatureView filter(FeatureView::Predicate predicate) const;

    QList<FeaturePtr> toList() const { return m_features; }

    QList<FeaturePtr>::const_iterator begin() const { return m_features.cbegin(); }
    QList<FeaturePtr>::const_iterator end() const { return m_features.cend(); }

private:
    void checkIndex(int index) const;

    QList<FeaturePtr> m_features;
    QSet<const Feature*> m_instances;
};

using FeatureStorePtr = QSharedPointer<FeatureStore>;

} // namespace geocore
