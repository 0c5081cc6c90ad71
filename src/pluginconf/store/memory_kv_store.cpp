#include "memory_kv_store.h"

#include <QJsonArray>
#include <QMutexLocker>

namespace pluginconf {

namespace {

QJsonObject nodeToJson(const QString& key, const MemoryKvStore::Node& node) {
    QJsonObject out;
    out["key"] = key;
    out["value"] = node.value;
    out["createdIndex"] = node.createdIndex;
    out["modifiedIndex"] = node.modifiedIndex;
    return out;
}

StoreResponse keyNotFound(const QString& key, qint64 revision) {
    StoreResponse out;
    out.status = 404;
    out.body = QJsonObject{{"errorCode", 100},
                           {"message", "Key not found"},
                           {"cause", key},
                           {"index", revision}};
    return out;
}

} // namespace

QString MemoryKvStore::normalizeKey(const QString& key) {
    QString normalized = key.trimmed();
    while (normalized.endsWith('/')) {
        normalized.chop(1);
    }
    if (!normalized.startsWith('/')) {
        normalized.prepend('/');
    }
    return normalized;
}

qint64 MemoryKvStore::revision() const {
    QMutexLocker locker(&m_mutex);
    return m_revision;
}

bool MemoryKvStore::persistNode(const QString& key, const Node* node, QString& error) {
    Q_UNUSED(key);
    Q_UNUSED(node);
    error.clear();
    return true;
}

bool MemoryKvStore::persistRevision(qint64 revision, QString& error) {
    Q_UNUSED(revision);
    error.clear();
    return true;
}

void MemoryKvStore::restore(const QMap<QString, Node>& nodes, qint64 revision) {
    QMutexLocker locker(&m_mutex);
    m_nodes = nodes;
    m_revision = revision;
}

bool MemoryKvStore::get(const QString& key, bool dir, StoreResponse& out, QString& error) {
    const QString k = normalizeKey(key);
    QMutexLocker locker(&m_mutex);

    if (!dir) {
        auto it = m_nodes.constFind(k);
        if (it == m_nodes.constEnd()) {
            out = keyNotFound(k, m_revision);
            error.clear();
            return true;
        }
        out.status = 200;
        out.body = QJsonObject{{"action", "get"}, {"node", nodeToJson(k, it.value())}};
        error.clear();
        return true;
    }

    const QString prefix = k + "/";
    QJsonArray nodes;
    for (auto it = m_nodes.lowerBound(prefix); it != m_nodes.end(); ++it) {
        if (!it.key().startsWith(prefix)) {
            break;
        }
        if (it.key().indexOf('/', prefix.size()) >= 0) {
            continue;
        }
        nodes.append(nodeToJson(it.key(), it.value()));
    }

    out.status = 200;
    out.body = QJsonObject{
        {"action", "get"},
        {"node", QJsonObject{{"key", k}, {"dir", true}, {"nodes", nodes}}},
        {"count", nodes.size()}};
    error.clear();
    return true;
}

bool MemoryKvStore::writeLocked(const QString& key,
                                const QJsonObject& value,
                                const char* action,
                                StoreResponse& out,
                                QString& error) {
    const qint64 next = m_revision + 1;
    if (!persistRevision(next, error)) {
        return false;
    }
    m_revision = next;

    auto it = m_nodes.find(key);
    const bool existed = it != m_nodes.end();
    const Node previous = existed ? it.value() : Node();

    Node node;
    node.value = value;
    node.createdIndex = existed ? previous.createdIndex : next;
    node.modifiedIndex = next;
    m_nodes.insert(key, node);

    if (!persistNode(key, &node, error)) {
        if (existed) {
            m_nodes.insert(key, previous);
        } else {
            m_nodes.remove(key);
        }
        return false;
    }

    out.status = existed ? 200 : 201;
    out.body = QJsonObject{{"action", action}, {"node", nodeToJson(key, node)}};
    if (existed) {
        out.body["prevNode"] = nodeToJson(key, previous);
    }
    error.clear();
    return true;
}

bool MemoryKvStore::set(const QString& key,
                        const QJsonObject& value,
                        StoreResponse& out,
                        QString& error) {
    const QString k = normalizeKey(key);
    QMutexLocker locker(&m_mutex);
    return writeLocked(k, value, "set", out, error);
}

bool MemoryKvStore::atomicSet(const QString& key,
                              const QJsonObject& value,
                              qint64 expectedIndex,
                              StoreResponse& out,
                              QString& error) {
    const QString k = normalizeKey(key);
    QMutexLocker locker(&m_mutex);

    auto it = m_nodes.constFind(k);
    if (it == m_nodes.constEnd()) {
        out = keyNotFound(k, m_revision);
        error.clear();
        return true;
    }

    if (it.value().modifiedIndex != expectedIndex) {
        out.status = 412;
        out.body = QJsonObject{
            {"errorCode", 101},
            {"message", "Compare failed"},
            {"cause", QString("[%1 != %2]").arg(expectedIndex).arg(it.value().modifiedIndex)},
            {"index", m_revision}};
        error.clear();
        return true;
    }

    return writeLocked(k, value, "compareAndSwap", out, error);
}

bool MemoryKvStore::remove(const QString& key, StoreResponse& out, QString& error) {
    const QString k = normalizeKey(key);
    QMutexLocker locker(&m_mutex);

    auto it = m_nodes.find(k);
    if (it == m_nodes.end()) {
        out = keyNotFound(k, m_revision);
        error.clear();
        return true;
    }

    const qint64 next = m_revision + 1;
    if (!persistRevision(next, error)) {
        return false;
    }
    m_revision = next;

    const Node previous = it.value();
    m_nodes.erase(it);
    if (!persistNode(k, nullptr, error)) {
        m_nodes.insert(k, previous);
        return false;
    }

    out.status = 200;
    out.body = QJsonObject{
        {"action", "delete"},
        {"node", QJsonObject{{"key", k},
                             {"createdIndex", previous.createdIndex},
                             {"modifiedIndex", next}}},
        {"prevNode", nodeToJson(k, previous)}};
    error.clear();
    return true;
}

bool MemoryKvStore::allocateId(QString& id, QString& error) {
    QMutexLocker locker(&m_mutex);
    const qint64 next = m_revision + 1;
    if (!persistRevision(next, error)) {
        return false;
    }
    m_revision = next;
    id = QString("%1").arg(next, 20, 10, QChar('0'));
    error.clear();
    return true;
}

} // namespace pluginconf
