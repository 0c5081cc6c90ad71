#pragma once

#include <QObject>
#include <QString>
#include <QVector>

#include "route_snapshot.h"

class QTimer;

namespace pluginconf {

class KvStore;

/// Route snapshot kept in memory and refreshed from the routes directory
/// of the store, on demand or on a timer.
class StoreRouteSnapshot : public QObject, public RouteSnapshotProvider {
    Q_OBJECT
public:
    explicit StoreRouteSnapshot(KvStore* store,
                                const QString& routesKey = "/routes",
                                QObject* parent = nullptr);

    bool list(QVector<RouteEntry>& routes, qint64& version, QString& error) override;

    /// Re-reads the routes directory. On failure the last good snapshot
    /// is kept.
    bool refresh(QString& error);

    void start(int intervalMs);
    void stop();

    bool isReady() const { return m_ready; }
    qint64 version() const { return m_version; }

signals:
    void routesChanged(qint64 version);

private:
    KvStore* m_store = nullptr;
    QString m_routesKey;
    QTimer* m_timer = nullptr;
    QVector<RouteEntry> m_routes;
    qint64 m_version = 0;
    bool m_ready = false;
};

} // namespace pluginconf
