#pragma once

#include <geocore/envelope.h>

#include <QString>

#include <memory>

namespace geocore {

enum class GeometryType {
    Unknown,
    Point,
    LineString,
    Polygon,
    MultiPoint,
    MultiLineString,
    MultiPolygon,
    GeometryCollection
};

QString geometryTypeName(GeometryType type);

/**
 * @brief Geometry capability consumed by the feature model
 *
 * Implemented by an external geometry library. The core only needs the
 * envelope, an envelope intersection test, distance, deep copy and the
 * geometry kind.
 */
class IGeometry
{
public:
    virtual ~IGeometry() = default;

    virtual GeometryType geometryType() const = 0;
    virtual Envelope envelope() const = 0;
    virtual bool intersects(const Envelope& envelope) const = 0;
    virtual double distance(const IGeometry& other) const = 0;
    virtual std::unique_ptr<IGeometry> copy() const = 0;
    virtual bool isValid() const { return true; }
};

/**
 * @brief Coordinate transformation capability
 */
class ICoordinateTransformation
{
public:
    virtual ~ICoordinateTransformation() = default;

    virtual std::unique_ptr<IGeometry> transform(const IGeometry& geometry) const = 0;
};

/**
 * @brief Opaque rendering style, shared between features
 */
class IStyle
{
public:
    virtual ~IStyle() = default;
};

} // namespace geocore
