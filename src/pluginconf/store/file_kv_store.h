#pragma once

#include <QString>

#include "memory_kv_store.h"

namespace pluginconf {

/// MemoryKvStore that mirrors every mutation to disk:
///   <root>/revision.json           {"revision": n}
///   <root>/nodes/<key>.json        {"value", "createdIndex", "modifiedIndex"}
/// Key segments are percent-encoded, dots included.
class FileKvStore : public MemoryKvStore {
public:
    explicit FileKvStore(const QString& rootDir);

    /// Loads the persisted state. Must be called before use.
    bool open(QString& error);

    QString rootDir() const { return m_rootDir; }

protected:
    bool persistNode(const QString& key, const Node* node, QString& error) override;
    bool persistRevision(qint64 revision, QString& error) override;

private:
    QString nodePath(const QString& key) const;
    QString keyFromRelativePath(const QString& relativePath) const;

    QString m_rootDir;
};

} // namespace pluginconf
