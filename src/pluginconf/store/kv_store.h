#pragma once

#include <QJsonObject>
#include <QString>

namespace pluginconf {

/// Status and body reported by the store for a completed call.
/// Bodies follow the etcd v2 shape: {"node": {key, value, createdIndex,
/// modifiedIndex}} for single keys, {"node": {key, dir, nodes}, "count": n}
/// for directories, {"errorCode", "message", "cause"} for 404/412.
struct StoreResponse {
    int status = 0;
    QJsonObject body;
};

/// Hierarchical key-value store with per-key modified indexes.
///
/// Every method returns false only when the store itself could not serve
/// the call (error holds the reason). A missing key or a failed compare is
/// a successful call with a 404 or 412 response.
class KvStore {
public:
    virtual ~KvStore() = default;

    /// Reads one key, or with dir == true lists the direct children of key.
    virtual bool get(const QString& key, bool dir, StoreResponse& out, QString& error) = 0;

    /// Unconditional write. 201 when the key was created, 200 otherwise.
    virtual bool set(const QString& key,
                     const QJsonObject& value,
                     StoreResponse& out,
                     QString& error) = 0;

    /// Write only if the key's current modifiedIndex equals expectedIndex.
    /// 412 "Compare failed" when it does not, 404 when the key is gone.
    virtual bool atomicSet(const QString& key,
                           const QJsonObject& value,
                           qint64 expectedIndex,
                           StoreResponse& out,
                           QString& error) = 0;

    virtual bool remove(const QString& key, StoreResponse& out, QString& error) = 0;

    /// Reserves a fresh, never reused id (zero-padded store revision).
    virtual bool allocateId(QString& id, QString& error) = 0;
};

} // namespace pluginconf
