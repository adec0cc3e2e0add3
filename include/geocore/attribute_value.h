#pragma once

#include <QByteArray>
#include <QDateTime>
#include <QMetaType>
#include <QString>
#include <QVariant>

#include <variant>

namespace geocore {

enum class AttributeType {
    Null,
    String,
    Integer,
    Real,
    Bool,
    DateTime,
    Bytes
};

QString attributeTypeName(AttributeType type);

/**
 * @brief Closed, dynamically typed attribute value
 *
 * Holds one of null, string, integer, real, bool, date-time or bytes.
 * Equality is type-sensitive: Integer 5 and Real 5.0 are different values.
 * The numeric accessors convert between numeric kinds and parse numeric
 * strings; a failed conversion sets *ok to false and returns the default.
 */
class AttributeValue
{
public:
    AttributeValue() = default;
    AttributeValue(const QString& value) : m_data(value) {}
    AttributeValue(const char* value) : m_data(QString::fromUtf8(value)) {}
    AttributeValue(int value) : m_data(static_cast<qint64>(value)) {}
    AttributeValue(qint64 value) : m_data(value) {}
    AttributeValue(double value) : m_data(value) {}
    AttributeValue(bool value) : m_data(value) {}
    AttributeValue(const QDateTime& value) : m_data(value) {}
    AttributeValue(const QByteArray& value) : m_data(value) {}

    static AttributeValue fromVariant(const QVariant& variant);
    QVariant toVariant() const;

    AttributeType type() const { return static_cast<AttributeType>(m_data.index()); }
    bool isNull() const { return type() == AttributeType::Null; }

    QString toString() const;
    qint64 toInteger(bool* ok = nullptr) const;
    double toReal(bool* ok = nullptr) const;
    bool toBool(bool* ok = nullptr) const;
    QDateTime toDateTime() const;
    QByteArray toByteArray() const;

    bool operator==(const AttributeValue& other) const { return m_data == other.m_data; }
    bool operator!=(const AttributeValue& other) const { return !(*this == other); }

private:
    using Storage = std::variant<std::monostate, QString, qint64, double, bool, QDateTime, QByteArray>;
    Storage m_data;
};

size_t qHash(const AttributeValue& value, size_t seed = 0);

} // namespace geocore

Q_DECLARE_METATYPE(geocore::AttributeValue)
