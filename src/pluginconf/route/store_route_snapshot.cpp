#include "store_route_snapshot.h"

#include <QDebug>
#include <QJsonArray>
#include <QTimer>

#include "pluginconf/store/kv_store.h"

namespace pluginconf {

StoreRouteSnapshot::StoreRouteSnapshot(KvStore* store, const QString& routesKey, QObject* parent)
    : QObject(parent), m_store(store), m_routesKey(routesKey) {
    m_timer = new QTimer(this);
    connect(m_timer, &QTimer::timeout, this, [this]() {
        QString error;
        if (!refresh(error)) {
            qWarning("StoreRouteSnapshot: refresh failed: %s", qUtf8Printable(error));
        }
    });
}

bool StoreRouteSnapshot::list(QVector<RouteEntry>& routes, qint64& version, QString& error) {
    if (!m_ready) {
        error = "route snapshot is not available";
        return false;
    }
    routes = m_routes;
    version = m_version;
    error.clear();
    return true;
}

bool StoreRouteSnapshot::refresh(QString& error) {
    StoreResponse res;
    if (!m_store->get(m_routesKey, true, res, error)) {
        return false;
    }
    if (res.status != 200) {
        error = QString("failed to list routes: status %1").arg(res.status);
        return false;
    }

    QVector<RouteEntry> routes;
    const QJsonArray nodes = res.body.value("node").toObject().value("nodes").toArray();
    for (const QJsonValue& node : nodes) {
        const QJsonValue value = node.toObject().value("value");
        if (!value.isObject()) {
            continue;
        }
        routes.append(RouteEntry::fromJson(value.toObject()));
    }

    if (!m_ready || routes != m_routes) {
        m_routes = routes;
        ++m_version;
        m_ready = true;
        qDebug("StoreRouteSnapshot: %lld routes, version %lld",
               static_cast<long long>(m_routes.size()),
               static_cast<long long>(m_version));
        emit routesChanged(m_version);
    }

    error.clear();
    return true;
}

void StoreRouteSnapshot::start(int intervalMs) {
    m_timer->start(intervalMs);
}

void StoreRouteSnapshot::stop() {
    m_timer->stop();
}

} // namespace pluginconf
