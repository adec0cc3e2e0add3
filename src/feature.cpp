#include "feature.h"

#include <geocore/errors.h>

#include <QUuid>

#include <limits>

namespace geocore {

namespace {

AttributeValue checkedId(const AttributeValue& id)
{
    if (id.isNull()) {
        throw Error(ErrorCode::InvalidArgument, QStringLiteral("Feature id must not be null"));
    }
    return id;
}

} // namespace

QString geometryTypeName(GeometryType type)
{
    switch (type) {
    case GeometryType::Unknown:            return QStringLiteral("Unknown");
    case GeometryType::Point:              return QStringLiteral("Point");
    case GeometryType::LineString:         return QStringLiteral("LineString");
    case GeometryType::Polygon:            return QStringLiteral("Polygon");
    case GeometryType::MultiPoint:         return QStringLiteral("MultiPoint");
    case GeometryType::MultiLineString:    return QStringLiteral("MultiLineString");
    case GeometryType::MultiPolygon:       return QStringLiteral("MultiPolygon");
    case GeometryType::GeometryCollection: return QStringLiteral("GeometryCollection");
    }
    return QStringLiteral("Unknown");
}

Feature::Feature()
    : m_id(generateId())
{
}

Feature::Feature(const AttributeValue& id)
    : m_id(checkedId(id))
{
}

Feature::Feature(std::unique_ptr<IGeometry> geometry, AttributeTable attributes)
    : m_id(generateId())
    , m_geometry(std::move(geometry))
    , m_attributes(std::move(attributes))
{
}

Feature::Feature(const AttributeValue& id, std::unique_ptr<IGeometry> geometry, AttributeTable attributes)
    : m_id(checkedId(id))
    , m_geometry(std::move(geometry))
    , m_attributes(std::move(attributes))
{
}

AttributeValue Feature::generateId()
{
    return AttributeValue(QUuid::createUuid().toString(QUuid::WithoutBraces));
}

bool Feature::isValid() const
{
    return !m_geometry || m_geometry->isValid();
}

std::optional<Envelope> Feature::boundingBox() const
{
    if (!m_geometry) {
        return std::nullopt;
    }
    const Envelope envelope = m_geometry->envelope();
    if (envelope.isNull()) {
        return std::nullopt;
    }
    return envelope;
}

FeaturePtr Feature::copy() const
{
    return copyWithId(m_id);
}

FeaturePtr Feature::copyWithId(const AttributeValue& id) const
{
    auto result = FeaturePtr::create(id, m_geometry ? m_geometry->copy() : nullptr, m_attributes);
    result->m_style = m_style;
    return result;
}

double Feature::distance(const Feature& other) const
{
    if (!m_geometry || !other.m_geometry) {
        return std::numeric_limits<double>::max();
    }
    return m_geometry->distance(*other.m_geometry);
}

void Feature::transform(const ICoordinateTransformation& transformation)
{
    if (!m_geometry) {
        return;
    }

    std::unique_ptr<IGeometry> transformed = transformation.transform(*m_geometry);
    if (!transformed) {
        throw Error(ErrorCode::ExecutionError,
                    QStringLiteral("Transformation of feature %1 produced no geometry").arg(m_id.toString()));
    }
    m_geometry = std::move(transformed);
}

QString Feature::toString() const
{
    return QStringLiteral("Feature[Id=%1, Geometry=%2, Attributes=%3]")
        .arg(m_id.toString(),
             m_geometry ? geometryTypeName(m_geometry->geometryType()) : QStringLiteral("None"))
        .arg(m_attributes.count());
}

size_t qHash(const Feature& feature, size_t seed)
{
    return qHash(feature.id(), seed);
}

} // namespace geocore
