#pragma once

#include <QMap>
#include <QMutex>

#include "kv_store.h"

namespace pluginconf {

class MemoryKvStore : public KvStore {
public:
    struct Node {
        QJsonObject value;
        qint64 createdIndex = 0;
        qint64 modifiedIndex = 0;
    };

    bool get(const QString& key, bool dir, StoreResponse& out, QString& error) override;
    bool set(const QString& key,
             const QJsonObject& value,
             StoreResponse& out,
             QString& error) override;
    bool atomicSet(const QString& key,
                   const QJsonObject& value,
                   qint64 expectedIndex,
                   StoreResponse& out,
                   QString& error) override;
    bool remove(const QString& key, StoreResponse& out, QString& error) override;
    bool allocateId(QString& id, QString& error) override;

    qint64 revision() const;

    static QString normalizeKey(const QString& key);

protected:
    /// Called under the store lock after every mutation; node == nullptr
    /// means the key was removed. Returning false rolls the mutation back.
    virtual bool persistNode(const QString& key, const Node* node, QString& error);
    virtual bool persistRevision(qint64 revision, QString& error);

    void restore(const QMap<QString, Node>& nodes, qint64 revision);

private:
    bool writeLocked(const QString& key,
                     const QJsonObject& value,
                     const char* action,
                     StoreResponse& out,
                     QString& error);

    mutable QMutex m_mutex;
    QMap<QString, Node> m_nodes;
    qint64 m_revision = 0;
};

} // namespace pluginconf
