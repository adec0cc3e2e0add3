#pragma once

#include <geocore/attribute_value.h>

#include <QHash>
#include <QList>
#include <QPair>
#include <QStringList>

#include <initializer_list>

namespace geocore {

/**
 * @brief Ordered attribute dictionary owned by a single Feature
 *
 * Names are unique and case-sensitive. Insertion order is kept for
 * enumeration and index access; re-adding an existing name replaces the
 * value in place. Reading a missing name yields a null value, not an error.
 */
class AttributeTable
{
public:
    using Entry = QPair<QString, AttributeValue>;

    AttributeTable() = default;

    static AttributeTable create(std::initializer_list<Entry> entries);

    int count() const { return static_cast<int>(m_names.size()); }
    bool isEmpty() const { return m_names.isEmpty(); }

    bool contains(const QString& name) const { return m_values.contains(name); }

    void add(const QString& name, const AttributeValue& value);
    void setValue(const QString& name, const AttributeValue& value) { add(name, value); }
    bool remove(const QString& name);
    void clear();

    AttributeValue value(const QString& name) const;
    AttributeValue value(const QString& name, const AttributeValue& defaultValue) const;

    // Index access; throws Error(InvalidArgument) when out of range
    AttributeValue valueAt(int index) const;
    void setValueAt(int index, const AttributeValue& value);
    QString nameAt(int index) const;

    QString stringValue(const QString& name, const QString& defaultValue = {}) const;
    qint64 integerValue(const QString& name, qint64 defaultValue = 0) const;
    double realValue(const QString& name, double defaultValue = 0.0) const;
    bool boolValue(const QString& name, bool defaultValue = false) const;
    QDateTime dateTimeValue(const QString& name) const;

    QStringList names() const { return m_names; }
    QList<AttributeValue> values() const;
    QList<Entry> entries() const;

    QString toString() const;

    bool operator==(const AttributeTable& other) const;
    bool operator!=(const AttributeTable& other) const { return !(*this == other); }

private:
    void checkIndex(int index) const;

    QStringList m_names;
    QHash<QString, AttributeValue> m_values;
};

} // namespace geocore
