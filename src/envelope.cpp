#include <geocore/envelope.h>

#include <algorithm>

namespace geocore {

Envelope::Envelope(double minX, double minY, double maxX, double maxY)
    : m_minX(std::min(minX, maxX))
    , m_minY(std::min(minY, maxY))
    , m_maxX(std::max(minX, maxX))
    , m_maxY(std::max(minY, maxY))
    , m_null(false)
{
}

bool Envelope::intersects(const Envelope& other) const
{
    if (m_null || other.m_null) {
        return false;
    }
    return other.m_minX <= m_maxX && other.m_maxX >= m_minX
        && other.m_minY <= m_maxY && other.m_maxY >= m_minY;
}

bool Envelope::contains(double x, double y) const
{
    return !m_null && x >= m_minX && x <= m_maxX && y >= m_minY && y <= m_maxY;
}

void Envelope::expandToInclude(const Envelope& other)
{
    if (other.m_null) {
        return;
    }
    if (m_null) {
        *this = other;
        return;
    }
    m_minX = std::min(m_minX, other.m_minX);
    m_minY = std::min(m_minY, other.m_minY);
    m_maxX = std::max(m_maxX, other.m_maxX);
    m_maxY = std::max(m_maxY, other.m_maxY);
}

Envelope Envelope::united(const Envelope& other) const
{
    Envelope result = *this;
    result.expandToInclude(other);
    return result;
}

bool Envelope::operator==(const Envelope& other) const
{
    if (m_null || other.m_null) {
        return m_null == other.m_null;
    }
    return m_minX == other.m_minX && m_minY == other.m_minY
        && m_maxX == other.m_maxX && m_maxY == other.m_maxY;
}

QString Envelope::toString() const
{
    if (m_null) {
        return QStringLiteral("Envelope[null]");
    }
    return QStringLiteral("Envelope[%1 %2, %3 %4]")
        .arg(m_minX).arg(m_minY).arg(m_maxX).arg(m_maxY);
}

} // namespace geocore
