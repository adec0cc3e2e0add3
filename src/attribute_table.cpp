#include "attribute_table.h"

#include <geocore/errors.h>

namespace geocore {

AttributeTable AttributeTable::create(std::initializer_list<Entry> entries)
{
    AttributeTable table;
    for (const Entry& entry : entries) {
        table.add(entry.first, entry.second);
    }
    return table;
}

void AttributeTable::add(const QString& name, const AttributeValue& value)
{
    if (name.isEmpty()) {
        throw Error(ErrorCode::InvalidArgument, QStringLiteral("Attribute name must not be empty"));
    }

    if (!m_values.contains(name)) {
        m_names.append(name);
    }
    m_values.insert(name, value);
}

bool AttributeTable::remove(const QString& name)
{
    if (!m_values.remove(name)) {
        return false;
    }
    m_names.removeOne(name);
    return true;
}

void AttributeTable::clear()
{
    m_names.clear();
    m_values.clear();
}

AttributeValue AttributeTable::value(const QString& name) const
{
    return m_values.value(name);
}

AttributeValue AttributeTable::value(const QString& name, const AttributeValue& defaultValue) const
{
    auto it = m_values.constFind(name);
    return it != m_values.constEnd() ? it.value() : defaultValue;
}

AttributeValue AttributeTable::valueAt(int index) const
{
    checkIndex(index);
    return m_values.value(m_names.at(index));
}

void AttributeTable::setValueAt(int index, const AttributeValue& value)
{
    checkIndex(index);
    m_values.insert(m_names.at(index), value);
}

QString AttributeTable::nameAt(int index) const
{
    checkIndex(index);
    return m_names.at(index);
}

QString AttributeTable::stringValue(const QString& name, const QString& defaultValue) const
{
    auto it = m_values.constFind(name);
    if (it == m_values.constEnd() || it->isNull()) {
        return defaultValue;
    }
    return it->toString();
}

qint64 AttributeTable::integerValue(const QString& name, qint64 defaultValue) const
{
    bool ok = false;
    const qint64 result = value(name).toInteger(&ok);
    return ok ? result : defaultValue;
}

double AttributeTable::realValue(const QString& name, double defaultValue) const
{
    bool ok = false;
    const double result = value(name).toReal(&ok);
    return ok ? result : defaultValue;
}

bool AttributeTable::boolValue(const QString& name, bool defaultValue) const
{
    bool ok = false;
    const bool result = value(name).toBool(&ok);
    return ok ? result : defaultValue;
}

QDateTime AttributeTable::dateTimeValue(const QString& name) const
{
    return value(name).toDateTime();
}

QList<AttributeValue> AttributeTable::values() const
{
    QList<AttributeValue> result;
    result.reserve(m_names.size());
    for (const QString& name : m_names) {
        result.append(m_values.value(name));
    }
    return result;
}

QList<AttributeTable::Entry> AttributeTable::entries() const
{
    QList<Entry> result;
    result.reserve(m_names.size());
    for (const QString& name : m_names) {
        result.append({name, m_values.value(name)});
    }
    return result;
}

QString AttributeTable::toString() const
{
    QStringList pairs;
    for (const QString& name : m_names) {
        pairs.append(QStringLiteral("%1=%2").arg(name, m_values.value(name).toString()));
    }
    return QStringLiteral("AttributeTable[%1]").arg(pairs.join(QStringLiteral(", ")));
}

bool AttributeTable::operator==(const AttributeTable& other) const
{
    return m_names == other.m_names && m_values == other.m_values;
}

void AttributeTable::checkIndex(int index) const
{
    if (index < 0 || index >= m_names.size()) {
        throw Error(ErrorCode::InvalidArgument,
                    QStringLiteral("Attribute index %1 out of range (count %2)")
                        .arg(index).arg(m_names.size()));
    }
}

} // namespace geocore
