#include <geocore/attribute_value.h>

#include <QHashFunctions>
#include <QLocale>

#include <cmath>
#include <limits>

namespace geocore {

QString attributeTypeName(AttributeType type)
{
    switch (type) {
    case AttributeType::Null:     return QStringLiteral("Null");
    case AttributeType::String:   return QStringLiteral("String");
    case AttributeType::Integer:  return QStringLiteral("Integer");
    case AttributeType::Real:     return QStringLiteral("Real");
    case AttributeType::Bool:     return QStringLiteral("Bool");
    case AttributeType::DateTime: return QStringLiteral("DateTime");
    case AttributeType::Bytes:    return QStringLiteral("Bytes");
    }
    return QStringLiteral("Unknown");
}

AttributeValue AttributeValue::fromVariant(const QVariant& variant)
{
    if (!variant.isValid()) {
        return {};
    }

    switch (variant.typeId()) {
    case QMetaType::Nullptr:
        return {};
    case QMetaType::Bool:
        return AttributeValue(variant.toBool());
    case QMetaType::Short:
    case QMetaType::UShort:
    case QMetaType::Int:
    case QMetaType::UInt:
    case QMetaType::Long:
    case QMetaType::LongLong:
    case QMetaType::ULong:
    case QMetaType::ULongLong:
        return AttributeValue(variant.toLongLong());
    case QMetaType::Float:
    case QMetaType::Double:
        return AttributeValue(variant.toDouble());
    case QMetaType::QString:
        return AttributeValue(variant.toString());
    case QMetaType::QDateTime:
        return AttributeValue(variant.toDateTime());
    case QMetaType::QDate:
        return AttributeValue(variant.toDate().startOfDay());
    case QMetaType::QByteArray:
        return AttributeValue(variant.toByteArray());
    default:
        break;
    }

    if (variant.canConvert<AttributeValue>()) {
        return variant.value<AttributeValue>();
    }
    return AttributeValue(variant.toString());
}

QVariant AttributeValue::toVariant() const
{
    switch (type()) {
    case AttributeType::Null:     return QVariant();
    case AttributeType::String:   return std::get<QString>(m_data);
    case AttributeType::Integer:  return std::get<qint64>(m_data);
    case AttributeType::Real:     return std::get<double>(m_data);
    case AttributeType::Bool:     return std::get<bool>(m_data);
    case AttributeType::DateTime: return std::get<QDateTime>(m_data);
    case AttributeType::Bytes:    return std::get<QByteArray>(m_data);
    }
    return QVariant();
}

QString AttributeValue::toString() const
{
    switch (type()) {
    case AttributeType::Null:
        return QString();
    case AttributeType::String:
        return std::get<QString>(m_data);
    case AttributeType::Integer:
        return QString::number(std::get<qint64>(m_data));
    case AttributeType::Real:
        return QString::number(std::get<double>(m_data), 'g', QLocale::FloatingPointShortest);
    case AttributeType::Bool:
        return std::get<bool>(m_data) ? QStringLiteral("true") : QStringLiteral("false");
    case AttributeType::DateTime:
        return std::get<QDateTime>(m_data).toString(Qt::ISODateWithMs);
    case AttributeType::Bytes:
        return QString::fromLatin1(std::get<QByteArray>(m_data).toBase64());
    }
    return QString();
}

qint64 AttributeValue::toInteger(bool* ok) const
{
    bool converted = true;
    qint64 result = 0;

    switch (type()) {
    case AttributeType::Integer:
        result = std::get<qint64>(m_data);
        break;
    case AttributeType::Real: {
        const double real = std::get<double>(m_data);
        // [-2^63, 2^63) is exactly representable as double
        const double lowest = static_cast<double>(std::numeric_limits<qint64>::min());
        converted = std::isfinite(real) && real >= lowest && real < -lowest;
        result = converted ? qRound64(real) : 0;
        break;
    }
    case AttributeType::Bool:
        result = std::get<bool>(m_data) ? 1 : 0;
        break;
    case AttributeType::String:
        result = std::get<QString>(m_data).trimmed().toLongLong(&converted);
        break;
    default:
        converted = false;
        break;
    }

    if (ok) {
        *ok = converted;
    }
    return converted ? result : 0;
}

double AttributeValue::toReal(bool* ok) const
{
    bool converted = true;
    double result = 0.0;

    switch (type()) {
    case AttributeType::Real:
        result = std::get<double>(m_data);
        break;
    case AttributeType::Integer:
        result = static_cast<double>(std::get<qint64>(m_data));
        break;
    case AttributeType::Bool:
        result = std::get<bool>(m_data) ? 1.0 : 0.0;
        break;
    case AttributeType::String:
        result = std::get<QString>(m_data).trimmed().toDouble(&converted);
        break;
    default:
        converted = false;
        break;
    }

    if (ok) {
        *ok = converted;
    }
    return converted ? result : 0.0;
}

bool AttributeValue::toBool(bool* ok) const
{
    bool converted = true;
    bool result = false;

    switch (type()) {
    case AttributeType::Bool:
        result = std::get<bool>(m_data);
        break;
    case AttributeType::Integer:
        result = std::get<qint64>(m_data) != 0;
        break;
    case AttributeType::Real:
        result = std::get<double>(m_data) != 0.0;
        break;
    case AttributeType::String: {
        const QString text = std::get<QString>(m_data).trimmed();
        if (text.compare(QLatin1String("true"), Qt::CaseInsensitive) == 0) {
            result = true;
        } else if (text.compare(QLatin1String("false"), Qt::CaseInsensitive) != 0) {
            converted = false;
        }
        break;
    }
    default:
        converted = false;
        break;
    }

    if (ok) {
        *ok = converted;
    }
    return converted && result;
}

QDateTime AttributeValue::toDateTime() const
{
    if (type() == AttributeType::DateTime) {
        return std::get<QDateTime>(m_data);
    }
    if (type() == AttributeType::String) {
        return QDateTime::fromString(std::get<QString>(m_data), Qt::ISODateWithMs);
    }
    return QDateTime();
}

QByteArray AttributeValue::toByteArray() const
{
    if (type() == AttributeType::Bytes) {
        return std::get<QByteArray>(m_data);
    }
    if (type() == AttributeType::String) {
        return std::get<QString>(m_data).toUtf8();
    }
    return QByteArray();
}

size_t qHash(const AttributeValue& value, size_t seed)
{
    const int tag = static_cast<int>(value.type());

    switch (value.type()) {
    case AttributeType::Null:
        return qHashMulti(seed, tag);
    case AttributeType::String:
        return qHashMulti(seed, tag, value.toString());
    case AttributeType::Integer:
        return qHashMulti(seed, tag, value.toInteger());
    case AttributeType::Real:
        return qHashMulti(seed, tag, value.toReal());
    case AttributeType::Bool:
        return qHashMulti(seed, tag, value.toBool() ? 1 : 0);
    case AttributeType::DateTime:
        return qHashMulti(seed, tag, value.toDateTime());
    case AttributeType::Bytes:
        return qHashMulti(seed, tag, value.toByteArray());
    }
    return seed;
}

} // namespace geocore
