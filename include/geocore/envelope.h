#pragma once

#include <QMetaType>
#include <QString>

namespace geocore {

/**
 * @brief Axis-aligned bounding rectangle
 *
 * Unlike QRectF, a degenerate envelope (a single point) is a valid
 * envelope and intersects anything that touches it. Edges are inclusive.
 */
class Envelope
{
public:
    Envelope() = default;
    Envelope(double minX, double minY, double maxX, double maxY);

    static Envelope fromPoint(double x, double y) { return Envelope(x, y, x, y); }

    bool isNull() const { return m_null; }

    double minX() const { return m_minX; }
    double minY() const { return m_minY; }
    double maxX() const { return m_maxX; }
    double maxY() const { return m_maxY; }
    double width() const { return m_null ? 0.0 : m_maxX - m_minX; }
    double height() const { return m_null ? 0.0 : m_maxY - m_minY; }

    bool intersects(const Envelope& other) const;
    bool contains(double x, double y) const;

    void expandToInclude(const Envelope& other);
    Envelope united(const Envelope& other) const;

    bool operator==(const Envelope& other) const;
    bool operator!=(const Envelope& other) const { return !(*this == other); }

    QString toString() const;

private:
    double m_minX = 0.0;
    double m_minY = 0.0;
    double m_maxX = 0.0;
    double m_maxY = 0.0;
    bool m_null = true;
};

} // namespace geocore

Q_DECLARE_METATYPE(geocore::Envelope)
