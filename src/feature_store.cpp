#include "feature_store.h"

#include <geocore/errors.h>

namespace geocore {

// =============================================================================
// FeatureView
// =============================================================================

FeatureView::FeatureView(const QList<FeaturePtr>* features, Predicate predicate)
    : m_features(features)
    , m_predicate(QSharedPointer<const Predicate>::create(std::move(predicate)))
{
}

FeatureView::const_iterator FeatureView::begin() const
{
    return const_iterator(m_features->cbegin(), m_features->cend(), m_predicate);
}

FeatureView::const_iterator FeatureView::end() const
{
    return const_iterator(m_features->cend(), m_features->cend(), m_predicate);
}

QList<FeaturePtr> FeatureView::toList() const
{
    QList<FeaturePtr> result;
    for (const FeaturePtr& feature : *this) {
        result.append(feature);
    }
    return result;
}

int FeatureView::count() const
{
    return static_cast<int>(std::distance(begin(), end()));
}

FeaturePtr FeatureView::first() const
{
    const_iterator it = begin();
    return it != end() ? *it : FeaturePtr();
}

// =============================================================================
// FeatureStore
// =============================================================================

FeatureStore::FeatureStore(const QList<FeaturePtr>& features)
{
    m_features.reserve(features.size());
    for (const FeaturePtr& feature : features) {
        add(feature);
    }
}

void FeatureStore::add(FeaturePtr feature)
{
    if (!feature) {
        throw Error(ErrorCode::InvalidArgument, QStringLiteral("Cannot add a null feature"));
    }
    if (m_instances.contains(feature.data())) {
        throw Error(ErrorCode::InvalidArgument,
                    QStringLiteral("Feature instance %1 is already in the store").arg(feature->id().toString()));
    }

    m_instances.insert(feature.data());
    m_features.append(std::move(feature));
}

bool FeatureStore::remove(const FeaturePtr& feature)
{
    if (!feature || !m_instances.contains(feature.data())) {
        return false;
    }

    for (auto it = m_features.begin(); it != m_features.end(); ++it) {
        if (it->data() == feature.data()) {
            m_features.erase(it);
            m_instances.remove(feature.data());
            return true;
        }
    }
    return false;
}

void FeatureStore::clear()
{
    m_features.clear();
    m_instances.clear();
}

FeaturePtr FeatureStore::at(int index) const
{
    checkIndex(index);
    return m_features.at(index);
}

void FeatureStore::replace(int index, FeaturePtr feature)
{
    checkIndex(index);
    if (!feature) {
        throw Error(ErrorCode::InvalidArgument, QStringLiteral("Cannot store a null feature"));
    }

    const Feature* previous = m_features.at(index).data();
    if (previous == feature.data()) {
        return;
    }
    if (m_instances.contains(feature.data())) {
        throw Error(ErrorCode::InvalidArgument,
                    QStringLiteral("Feature instance %1 is already in the store").arg(feature->id().toString()));
    }

    m_instances.remove(previous);
    m_instances.insert(feature.data());
    m_features[index] = std::move(feature);
}

std::optional<Envelope> FeatureStore::extent() const
{
    Envelope result;
    for (const FeaturePtr& feature : m_features) {
        if (auto box = feature->boundingBox()) {
            result.expandToInclude(*box);
        }
    }

    if (result.isNull()) {
        return std::nullopt;
    }
    return result;
}

FeaturePtr FeatureStore::featureById(const AttributeValue& id) const
{
    for (const FeaturePtr& feature : m_features) {
        if (feature->id() == id) {
            return feature;
        }
    }
    return FeaturePtr();
}

FeatureView FeatureStore::featuresInExtent(const Envelope& envelope) const
{
    return filter([envelope](const Feature& feature) {
        const auto box = feature.boundingBox();
        return box && envelope.intersects(*box);
    });
}

FeatureView FeatureStore::filterByAttribute(const QString& name, const AttributeValue& value) const
{
    return filter([name, value](const Feature& feature) {
        const AttributeTable& attributes = feature.attributes();
        return attributes.contains(name) && attributes.value(name) == value;
    });
}

FeatureView FeatureStore::filterByGeometryType(GeometryType type) const
{
    return filter([type](const Feature& feature) {
        return feature.hasGeometry() && feature.geometry()->geometryType() == type;
    });
}

FeatureView FeatureStore::filter(FeatureView::Predicate predicate) const
{
    if (!predicate) {
        throw Error(ErrorCode::InvalidArgument, QStringLiteral("Feature filter needs a predicate"));
    }
    return FeatureView(&m_features, std::move(predicate));
}

void FeatureStore::checkIndex(int index) const
{
    if (index < 0 || index >= m_features.size()) {
        throw Error(ErrorCode::InvalidArgument,
                    QStringLiteral("Feature index %1 out of range (count %2)")
                        .arg(index).arg(m_features.size()));
    }
}

} // namespace geocore
