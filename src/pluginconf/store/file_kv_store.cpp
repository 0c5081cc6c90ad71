#include "file_kv_store.h"

#include <QDebug>
#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QSaveFile>
#include <QUrl>

namespace pluginconf {

namespace {

constexpr const char* kNodesDir = "/nodes";
constexpr const char* kRevisionFile = "/revision.json";
constexpr const char* kNodeSuffix = ".json";

bool writeJsonFile(const QString& path, const QJsonObject& obj, QString& error) {
    if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
        error = "cannot create directory for: " + path;
        return false;
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        error = "cannot write file: " + path;
        return false;
    }
    const QByteArray data = QJsonDocument(obj).toJson(QJsonDocument::Compact);
    if (file.write(data) != data.size() || !file.commit()) {
        error = "cannot write file: " + path;
        return false;
    }
    return true;
}

bool readJsonFile(const QString& path, QJsonObject& out, QString& error) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        error = "cannot open file: " + path;
        return false;
    }

    QJsonParseError parseErr;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseErr);
    if (parseErr.error != QJsonParseError::NoError) {
        error = "JSON parse error in " + path + ": " + parseErr.errorString();
        return false;
    }
    if (!doc.isObject()) {
        error = "store file must contain a JSON object: " + path;
        return false;
    }
    out = doc.object();
    return true;
}

} // namespace

FileKvStore::FileKvStore(const QString& rootDir)
    : m_rootDir(QDir(rootDir).absolutePath()) {}

QString FileKvStore::nodePath(const QString& key) const {
    QStringList encoded;
    for (const QString& segment : key.split('/', Qt::SkipEmptyParts)) {
        encoded.append(QString::fromLatin1(QUrl::toPercentEncoding(segment, QByteArray(), ".")));
    }
    return m_rootDir + kNodesDir + "/" + encoded.join('/') + kNodeSuffix;
}

QString FileKvStore::keyFromRelativePath(const QString& relativePath) const {
    QString path = relativePath;
    path.chop(static_cast<int>(qstrlen(kNodeSuffix)));

    QStringList decoded;
    for (const QString& segment : path.split('/', Qt::SkipEmptyParts)) {
        decoded.append(QUrl::fromPercentEncoding(segment.toLatin1()));
    }
    return "/" + decoded.join('/');
}

bool FileKvStore::open(QString& error) {
    const QString nodesDir = m_rootDir + kNodesDir;
    if (!QDir().mkpath(nodesDir)) {
        error = "cannot create store directory: " + nodesDir;
        return false;
    }

    qint64 revision = 0;
    const QString revisionPath = m_rootDir + kRevisionFile;
    if (QFileInfo::exists(revisionPath)) {
        QJsonObject obj;
        if (!readJsonFile(revisionPath, obj, error)) {
            return false;
        }
        revision = static_cast<qint64>(obj.value("revision").toDouble());
    }

    QMap<QString, Node> nodes;
    const QDir root(nodesDir);
    QDirIterator it(nodesDir, {QString("*") + kNodeSuffix}, QDir::Files,
                    QDirIterator::Subdirectories);
    while (it.hasNext()) {
        const QString filePath = it.next();
        QJsonObject obj;
        if (!readJsonFile(filePath, obj, error)) {
            return false;
        }
        if (!obj.value("value").isObject()) {
            error = "store node has no object value: " + filePath;
            return false;
        }

        Node node;
        node.value = obj.value("value").toObject();
        node.createdIndex = static_cast<qint64>(obj.value("createdIndex").toDouble());
        node.modifiedIndex = static_cast<qint64>(obj.value("modifiedIndex").toDouble());
        revision = qMax(revision, node.modifiedIndex);

        nodes.insert(keyFromRelativePath(root.relativeFilePath(filePath)), node);
    }

    restore(nodes, revision);
    qInfo("FileKvStore: loaded %lld keys from %s (revision %lld)",
          static_cast<long long>(nodes.size()),
          qUtf8Printable(m_rootDir),
          static_cast<long long>(revision));
    error.clear();
    return true;
}

bool FileKvStore::persistNode(const QString& key, const Node* node, QString& error) {
    const QString path = nodePath(key);
    if (!node) {
        if (QFile::exists(path) && !QFile::remove(path)) {
            error = "cannot remove file: " + path;
            return false;
        }
        error.clear();
        return true;
    }

    const QJsonObject obj{{"value", node->value},
                          {"createdIndex", node->createdIndex},
                          {"modifiedIndex", node->modifiedIndex}};
    if (!writeJsonFile(path, obj, error)) {
        return false;
    }
    error.clear();
    return true;
}

bool FileKvStore::persistRevision(qint64 revision, QString& error) {
    if (!writeJsonFile(m_rootDir + kRevisionFile, QJsonObject{{"revision", revision}}, error)) {
        return false;
    }
    error.clear();
    return true;
}

} // namespace pluginconf
