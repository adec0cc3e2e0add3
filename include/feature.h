#pragma once

#include "attribute_table.h"

#include <geocore/envelope.h>
#include <geocore/interfaces/igeometry.h>

#include <QSharedPointer>

#include <memory>
#include <optional>

namespace geocore {

class Feature;
using FeaturePtr = QSharedPointer<Feature>;

/**
 * @brief Single spatial entity: identity, optional geometry, attributes, optional style
 *
 * The id is immutable and is the only input to equality and hashing. The
 * geometry and the attribute table are owned by the feature; the style may
 * be shared with other features.
 *
 * @note copy() keeps the original id. Two copies compare equal and hash the
 *       same although they are independent objects. Use copyWithId() when the
 *       copy must become a new entity.
 */
class Feature
{
public:
    Feature();
    explicit Feature(const AttributeValue& id);
    explicit Feature(std::unique_ptr<IGeometry> geometry, AttributeTable attributes = {});
    Feature(const AttributeValue& id, std::unique_ptr<IGeometry> geometry, AttributeTable attributes = {});

    Feature(const Feature&) = delete;
    Feature& operator=(const Feature&) = delete;

    static AttributeValue generateId();

    const AttributeValue& id() const { return m_id; }

    bool hasGeometry() const { return m_geometry != nullptr; }
    const IGeometry* geometry() const { return m_geometry.get(); }
    IGeometry* geometry() { return m_geometry.get(); }
    void setGeometry(std::unique_ptr<IGeometry> geometry) { m_geometry = std::move(geometry); }
    std::unique_ptr<IGeometry> takeGeometry() { return std::move(m_geometry); }

    AttributeTable& attributes() { return m_attributes; }
    const AttributeTable& attributes() const { return m_attributes; }
    AttributeValue attribute(const QString& name) const { return m_attributes.value(name); }

    QSharedPointer<IStyle> style() const { return m_style; }
    void setStyle(QSharedPointer<IStyle> style) { m_style = std::move(style); }

    bool isValid() const;
    std::optional<Envelope> boundingBox() const;

    FeaturePtr copy() const;
    FeaturePtr copyWithId(const AttributeValue& id) const;

    // Geometry distance, or max double when either side has no geometry
    double distance(const Feature& other) const;

    void transform(const ICoordinateTransformation& transformation);

    QString toString() const;

    bool operator==(const Feature& other) const { return m_id == other.m_id; }
    bool operator!=(const Feature& other) const { return !(*this == other); }

private:
    const AttributeValue m_id;
    std::unique_ptr<IGeometry> m_geometry;
    AttributeTable m_attributes;
    QSharedPointer<IStyle> m_style;
};

size_t qHash(const Feature& feature, size_t seed = 0);

} // namespace geocore
