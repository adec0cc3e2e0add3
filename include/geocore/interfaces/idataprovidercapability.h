#pragma once

#include <geocore/attribute_value.h>
#include <geocore/envelope.h>

#include <QFlags>
#include <QList>
#include <QSharedPointer>
#include <QStringList>
#include <QVariantMap>

#include <optional>

namespace geocore {

class FeatureStore;
using FeatureStorePtr = QSharedPointer<FeatureStore>;

enum class DataProviderCapability {
    Read           = 0x01,
    Write          = 0x02,
    Create         = 0x04,
    Delete         = 0x08,
    SpatialIndex   = 0x10,
    AttributeIndex = 0x20,
    Transaction    = 0x40,
    BulkInsert     = 0x80
};
Q_DECLARE_FLAGS(DataProviderCapabilities, DataProviderCapability)

enum class DataSourceType {
    Unknown,
    File,
    Database,
    WebService,
    Memory
};

struct FieldMetadata {
    QString name;
    AttributeType type = AttributeType::Null;
    std::optional<int> length;
    std::optional<int> precision;
    bool nullable = true;
    bool primaryKey = false;
    bool indexed = false;
};

struct DataSourceMetadata {
    QString name;
    QString description;
    DataSourceType type = DataSourceType::Unknown;
    std::optional<Envelope> extent;
    QString spatialReference;
    std::optional<qint64> featureCount;
    QList<FieldMetadata> fields;
    QVariantMap properties;
};

/**
 * @brief Access to an external data source format
 *
 * Callers check capabilities() before attempting an operation.
 * testConnection() and metadata() must leave the data source untouched.
 * Both may block on I/O; the host calls them from a worker thread.
 */
class IDataProviderCapability
{
public:
    virtual ~IDataProviderCapability() = default;

    virtual QStringList supportedExtensions() const = 0;
    virtual DataProviderCapabilities capabilities() const = 0;

    virtual bool testConnection(const QString& connection) = 0;
    virtual std::optional<DataSourceMetadata> metadata(const QString& connection) = 0;

    // Reads the source into a new store; null when nothing could be read
    virtual FeatureStorePtr openFeatureStore(const QString& connection, const QVariantMap& options) = 0;
};

} // namespace geocore

Q_DECLARE_OPERATORS_FOR_FLAGS(geocore::DataProviderCapabilities)
