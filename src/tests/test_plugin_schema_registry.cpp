#include <gtest/gtest.h>

#include <QFile>
#include <QJsonArray>
#include <QTemporaryDir>

#include "helpers/fake_collaborators.h"
#include "pluginconf/schema/plugin_schema_registry.h"

using namespace pluginconf;

namespace {

bool writeFile(const QString& path, const QByteArray& content) {
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    return file.write(content) == content.size();
}

} // namespace

TEST(PluginSchemaRegistryTest, LoadFromDirectorySkipsInvalidFiles) {
    QTemporaryDir tmp;
    ASSERT_TRUE(tmp.isValid());

    ASSERT_TRUE(writeFile(tmp.path() + "/key-auth.schema.json",
                          R"({"key":{"type":"string","required":true}})"));
    ASSERT_TRUE(writeFile(tmp.path() + "/broken.schema.json", "{not json"));
    ASSERT_TRUE(writeFile(tmp.path() + "/bad type.schema.json", "{}"));
    ASSERT_TRUE(writeFile(tmp.path() + "/odd.schema.json", R"({"k":{"type":"tuple"}})"));
    ASSERT_TRUE(writeFile(tmp.path() + "/readme.txt", "ignored"));

    PluginSchemaRegistry registry;
    const auto stats = registry.loadFromDirectory(tmp.path());
    EXPECT_EQ(stats.loaded, 1);
    EXPECT_EQ(stats.invalid, 3);
    EXPECT_EQ(registry.pluginNames(), QStringList{"key-auth"});
}

TEST(PluginSchemaRegistryTest, MissingDirectoryLoadsNothing) {
    PluginSchemaRegistry registry;
    const auto stats = registry.loadFromDirectory("/nonexistent/pluginconf/plugins");
    EXPECT_EQ(stats.loaded, 0);
    EXPECT_EQ(stats.invalid, 0);
}

TEST(PluginSchemaRegistryTest, CheckPluginsFillsDefaults) {
    const PluginSchemaRegistry registry = makeTestRegistry();
    QJsonObject plugins{{"limit-count", QJsonObject{{"count", 3}}}, {"x", QJsonObject()}};

    QString error;
    ASSERT_TRUE(registry.checkPlugins(plugins, error)) << qPrintable(error);
    EXPECT_EQ(plugins["limit-count"].toObject()["time_window"].toInt(), 60);
    EXPECT_EQ(plugins["x"].toObject(), QJsonObject());
}

TEST(PluginSchemaRegistryTest, CheckPluginsErrors) {
    const PluginSchemaRegistry registry = makeTestRegistry();
    QString error;

    QJsonObject unknown{{"nope", QJsonObject()}};
    EXPECT_FALSE(registry.checkPlugins(unknown, error));
    EXPECT_EQ(error, "unknown plugin [nope]");

    QJsonObject notObject{{"x", QJsonArray{1, 2}}};
    EXPECT_FALSE(registry.checkPlugins(notObject, error));
    EXPECT_EQ(error, "invalid plugin conf [1,2] for plugin [x]");

    QJsonObject missingRequired{{"limit-count", QJsonObject()}};
    EXPECT_FALSE(registry.checkPlugins(missingRequired, error));
    EXPECT_EQ(error,
              "failed to check the configuration of plugin limit-count err: count: required "
              "field missing");
    EXPECT_EQ(missingRequired, (QJsonObject{{"limit-count", QJsonObject()}}));
}

TEST(PluginSchemaRegistryTest, MetaFieldsCheckedSeparately) {
    const PluginSchemaRegistry registry = makeTestRegistry();
    QString error;

    QJsonObject ok{{"x", QJsonObject{{"a", 1},
                                     {"_meta", QJsonObject{{"disable", true},
                                                           {"priority", 10},
                                                           {"filter", QJsonArray()}}}}}};
    ASSERT_TRUE(registry.checkPlugins(ok, error)) << qPrintable(error);
    EXPECT_TRUE(ok["x"].toObject()["_meta"].toObject()["disable"].toBool());

    QJsonObject badMeta{{"x", QJsonObject{{"_meta", QJsonObject{{"disable", "yes"}}}}}};
    EXPECT_FALSE(registry.checkPlugins(badMeta, error));
    EXPECT_EQ(error,
              "failed to check the configuration of plugin x err: _meta.disable: expected boolean");

    QJsonObject unknownMeta{{"x", QJsonObject{{"_meta", QJsonObject{{"color", 1}}}}}};
    EXPECT_FALSE(registry.checkPlugins(unknownMeta, error));
}
