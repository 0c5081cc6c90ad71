#include <gtest/gtest.h>

#include <QDir>
#include <QEventLoop>
#include <QFile>
#include <QHttpServer>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTcpServer>
#include <QTemporaryDir>
#include <QTimer>
#include <QUrl>

#include "pluginconf_server/http/admin_router.h"
#include "pluginconf_server/server_manager.h"

using namespace pluginconf_server;

namespace {

bool writeFile(const QString& path, const QByteArray& content) {
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    return file.write(content) == content.size();
}

bool sendRequest(const QString& method, const QUrl& url, const QByteArray& body, int& statusCode,
                 QByteArray& responseBody, QString& error) {
    QNetworkAccessManager manager;
    QNetworkRequest req(url);
    req.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");

    QNetworkReply* reply = nullptr;
    if (method == "GET") {
        reply = manager.get(req);
    } else if (method == "POST") {
        reply = manager.post(req, body);
    } else if (method == "PUT") {
        reply = manager.put(req, body);
    } else if (method == "PATCH" || method == "DELETE") {
        reply = manager.sendCustomRequest(req, method.toLatin1(), body);
    } else {
        error = "unsupported method";
        return false;
    }

    QEventLoop loop;
    QTimer timeout;
    timeout.setSingleShot(true);

    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timeout, &QTimer::timeout, &loop, &QEventLoop::quit);

    timeout.start(3000);
    loop.exec();
    if (!timeout.isActive()) {
        reply->abort();
        error = "request timeout";
        reply->deleteLater();
        return false;
    }
    timeout.stop();

    statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    responseBody = reply->readAll();
    if (reply->error() != QNetworkReply::NoError && statusCode == 0) {
        error = reply->errorString();
        reply->deleteLater();
        return false;
    }

    reply->deleteLater();
    error.clear();
    return true;
}

QJsonObject parseObject(const QByteArray& body) {
    return QJsonDocument::fromJson(body).object();
}

} // namespace

class AdminRouterTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(tmp.isValid());
        root = tmp.path();
        ASSERT_TRUE(QDir().mkpath(root + "/plugins"));
        ASSERT_TRUE(writeFile(root + "/plugins/x.schema.json",
                              R"({"a":{"type":"int"},"b":{"type":"int"},"enable":{"type":"bool"}})"));

        ServerConfig cfg;
        cfg.adminApiVersion = "v3";
        manager = std::make_unique<ServerManager>(root, cfg);
        QString error;
        ASSERT_TRUE(manager->initialize(error)) << qPrintable(error);
    }

    bool request(const QString& method, const QString& path, const QByteArray& body,
                 int& status, QJsonObject& response) {
        QByteArray raw;
        QString error;
        if (!sendRequest(method, QUrl(base + path), body, status, raw, error)) {
            ADD_FAILURE() << qPrintable(error);
            return false;
        }
        response = parseObject(raw);
        return true;
    }

    void addRoute(const QString& id, const QString& pluginConfigId) {
        pluginconf::StoreResponse res;
        QString error;
        ASSERT_TRUE(manager->store()->set(
            "/routes/" + id, QJsonObject{{"id", id}, {"plugin_config_id", pluginConfigId}}, res,
            error));
        ASSERT_TRUE(manager->routeSnapshot()->refresh(error));
    }

    QTemporaryDir tmp;
    QString root;
    QString base;
    std::unique_ptr<ServerManager> manager;
};

TEST_F(AdminRouterTest, ParseJsonBody) {
    QJsonValue value;
    QString error;

    ASSERT_TRUE(AdminRouter::parseJsonBody("", value, error));
    EXPECT_TRUE(value.isUndefined());
    ASSERT_TRUE(AdminRouter::parseJsonBody(" false ", value, error));
    EXPECT_TRUE(value.isBool());
    ASSERT_TRUE(AdminRouter::parseJsonBody(R"({"a":1})", value, error));
    EXPECT_TRUE(value.isObject());

    EXPECT_FALSE(AdminRouter::parseJsonBody("{broken", value, error));
    EXPECT_EQ(error, "invalid request body");
    EXPECT_FALSE(AdminRouter::parseJsonBody("1, 2", value, error));
}

TEST_F(AdminRouterTest, LifecycleViaHttp) {
    QHttpServer server;
    AdminRouter router(manager->controller());
    router.registerRoutes(server);

    QTcpServer tcpServer;
    if (!tcpServer.listen(QHostAddress::AnyIPv4, 0)) {
        GTEST_SKIP() << "Cannot listen in current environment";
    }
    if (!server.bind(&tcpServer)) {
        GTEST_SKIP() << "Cannot bind QHttpServer in current environment";
    }
    base = QString("http://127.0.0.1:%1/apisix/admin/plugin_configs").arg(tcpServer.serverPort());

    int status = 0;
    QJsonObject obj;

    ASSERT_TRUE(request("PUT", "/1", R"({"plugins":{"x":{"a":0,"b":2}}})", status, obj));
    EXPECT_EQ(status, 201);

    ASSERT_TRUE(request("GET", "/1", QByteArray(), status, obj));
    EXPECT_EQ(status, 200);
    EXPECT_EQ(obj["key"].toString(), "/plugin_configs/1");
    EXPECT_EQ(obj["value"].toObject()["id"].toString(), "1");

    ASSERT_TRUE(request("PATCH", "/1", R"({"plugins":{"x":{"a":1}}})", status, obj));
    EXPECT_EQ(status, 200);

    ASSERT_TRUE(request("PATCH", "/1/plugins/x", R"({"enable":false})", status, obj));
    EXPECT_EQ(status, 200);
    EXPECT_EQ(obj["node"].toObject()["value"].toObject()["plugins"].toObject()["x"].toObject(),
              (QJsonObject{{"a", 1}, {"b", 2}, {"enable", false}}));

    ASSERT_TRUE(request("PATCH", "/1/plugins/nonexistent/deep", "1", status, obj));
    EXPECT_EQ(status, 400);
    EXPECT_EQ(obj["error_msg"].toString(), "invalid sub-path: /plugins/nonexistent");

    ASSERT_TRUE(request("POST", "", R"({"plugins":{}})", status, obj));
    EXPECT_EQ(status, 201);

    ASSERT_TRUE(request("GET", "", QByteArray(), status, obj));
    EXPECT_EQ(status, 200);
    EXPECT_EQ(obj["total"].toInt(), 2);
    EXPECT_EQ(obj["list"].toArray().size(), 2);

    addRoute("r1", "1");
    ASSERT_TRUE(request("DELETE", "/1", QByteArray(), status, obj));
    EXPECT_EQ(status, 400);
    EXPECT_EQ(obj["error_msg"].toString(),
              "can not delete this plugin config, route [r1] is still using it now");

    addRoute("r1", "other");
    ASSERT_TRUE(request("DELETE", "/1", QByteArray(), status, obj));
    EXPECT_EQ(status, 200);

    ASSERT_TRUE(request("GET", "/1", QByteArray(), status, obj));
    EXPECT_EQ(status, 404);
}

TEST_F(AdminRouterTest, ErrorsViaHttp) {
    QHttpServer server;
    AdminRouter router(manager->controller());
    router.registerRoutes(server);

    QTcpServer tcpServer;
    if (!tcpServer.listen(QHostAddress::AnyIPv4, 0)) {
        GTEST_SKIP() << "Cannot listen in current environment";
    }
    if (!server.bind(&tcpServer)) {
        GTEST_SKIP() << "Cannot bind QHttpServer in current environment";
    }
    base = QString("http://127.0.0.1:%1/apisix/admin/plugin_configs").arg(tcpServer.serverPort());

    int status = 0;
    QJsonObject obj;

    ASSERT_TRUE(request("PUT", "/1", "{broken", status, obj));
    EXPECT_EQ(status, 400);
    EXPECT_EQ(obj["error_msg"].toString(), "invalid request body");

    ASSERT_TRUE(request("PUT", "/2", R"({"id":"3","plugins":{}})", status, obj));
    EXPECT_EQ(status, 400);
    EXPECT_EQ(obj["error_msg"].toString(), "wrong id");

    ASSERT_TRUE(request("PUT", "", R"({"plugins":{}})", status, obj));
    EXPECT_EQ(status, 400);
    EXPECT_EQ(obj["error_msg"].toString(), "missing id");

    ASSERT_TRUE(request("PUT", "/1", R"({"plugins":{"unknown":{}}})", status, obj));
    EXPECT_EQ(status, 400);
    EXPECT_EQ(obj["error_msg"].toString(), "unknown plugin [unknown]");

    ASSERT_TRUE(request("PATCH", "/missing", R"({"name":"n"})", status, obj));
    EXPECT_EQ(status, 404);
    EXPECT_EQ(obj["message"].toString(), "Key not found");

    ASSERT_TRUE(request("GET", "?page_size=1", QByteArray(), status, obj));
    EXPECT_EQ(status, 400);

    ASSERT_TRUE(request("GET", "/1/extra", QByteArray(), status, obj));
    EXPECT_EQ(status, 404);
}
