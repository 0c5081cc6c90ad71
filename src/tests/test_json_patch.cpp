#include <gtest/gtest.h>

#include <QJsonArray>
#include <QJsonObject>

#include "pluginconf/document/json_patch.h"

using namespace pluginconf;

namespace {

QJsonObject sampleDoc() {
    return QJsonObject{{"id", "1"},
                       {"plugins", QJsonObject{{"x", QJsonObject{{"a", 0}, {"b", 2}}}}},
                       {"labels", QJsonObject{{"env", "prod"}}},
                       {"list", QJsonArray{QJsonObject{{"k", 1}}, 2}}};
}

} // namespace

TEST(JsonPatchTest, MergeKeepsSiblingKeys) {
    const QJsonObject merged = JsonPatch::merge(
        sampleDoc(), QJsonObject{{"plugins", QJsonObject{{"x", QJsonObject{{"a", 1}}}}}});

    EXPECT_EQ(merged["plugins"].toObject()["x"].toObject(), (QJsonObject{{"a", 1}, {"b", 2}}));
    EXPECT_EQ(merged["id"].toString(), "1");
    EXPECT_EQ(merged["labels"].toObject()["env"].toString(), "prod");
}

TEST(JsonPatchTest, MergeOverwritesNonObjects) {
    const QJsonObject merged =
        JsonPatch::merge(sampleDoc(), QJsonObject{{"labels", "flat"}, {"list", QJsonArray{3}}});
    EXPECT_EQ(merged["labels"].toString(), "flat");
    EXPECT_EQ(merged["list"].toArray(), QJsonArray{3});

    const QJsonObject objOverScalar =
        JsonPatch::merge(QJsonObject{{"k", 1}}, QJsonObject{{"k", QJsonObject{{"n", 2}}}});
    EXPECT_EQ(objOverScalar["k"].toObject()["n"].toInt(), 2);
}

TEST(JsonPatchTest, MergeNullSetsNull) {
    const QJsonObject merged =
        JsonPatch::merge(sampleDoc(), QJsonObject{{"labels", QJsonValue::Null}});
    ASSERT_TRUE(merged.contains("labels"));
    EXPECT_TRUE(merged["labels"].isNull());
}

TEST(JsonPatchTest, PatchOverlaysObjectAtPath) {
    QJsonObject doc = sampleDoc();
    QString error;
    ASSERT_TRUE(JsonPatch::patch(doc, "plugins/x", QJsonObject{{"enable", false}}, error));
    EXPECT_TRUE(error.isEmpty());
    EXPECT_EQ(doc["plugins"].toObject()["x"].toObject(),
              (QJsonObject{{"a", 0}, {"b", 2}, {"enable", false}}));
}

TEST(JsonPatchTest, PatchSetsScalarAndCreatesLeaf) {
    QJsonObject doc = sampleDoc();
    QString error;
    ASSERT_TRUE(JsonPatch::patch(doc, "/plugins/x/a", 5, error));
    ASSERT_TRUE(JsonPatch::patch(doc, "labels/team", "core", error));
    ASSERT_TRUE(JsonPatch::patch(doc, "desc", "new", error));

    EXPECT_EQ(doc["plugins"].toObject()["x"].toObject()["a"].toInt(), 5);
    EXPECT_EQ(doc["labels"].toObject(), (QJsonObject{{"env", "prod"}, {"team", "core"}}));
    EXPECT_EQ(doc["desc"].toString(), "new");
}

TEST(JsonPatchTest, PatchReplacesNonObjectTarget) {
    QJsonObject doc = sampleDoc();
    QString error;
    ASSERT_TRUE(JsonPatch::patch(doc, "labels", "flat", error));
    EXPECT_EQ(doc["labels"].toString(), "flat");
}

TEST(JsonPatchTest, PatchAddressesArrayElements) {
    QJsonObject doc = sampleDoc();
    QString error;
    ASSERT_TRUE(JsonPatch::patch(doc, "list/0/k", 9, error));
    ASSERT_TRUE(JsonPatch::patch(doc, "list/1", "two", error));

    const QJsonArray list = doc["list"].toArray();
    EXPECT_EQ(list[0].toObject()["k"].toInt(), 9);
    EXPECT_EQ(list[1].toString(), "two");

    EXPECT_FALSE(JsonPatch::patch(doc, "list/2", 1, error));
    EXPECT_EQ(error, "invalid sub-path: /list/2");
    EXPECT_FALSE(JsonPatch::patch(doc, "list/first/k", 1, error));
}

TEST(JsonPatchTest, PatchInvalidIntermediateLeavesDocUntouched) {
    const QJsonObject original = sampleDoc();
    QJsonObject doc = original;
    QString error;

    EXPECT_FALSE(JsonPatch::patch(doc, "plugins/nonexistent/deep", QJsonObject{{"a", 1}}, error));
    EXPECT_EQ(error, "invalid sub-path: /plugins/nonexistent");
    EXPECT_EQ(doc, original);

    EXPECT_FALSE(JsonPatch::patch(doc, "id/deeper", 1, error));
    EXPECT_EQ(error, "invalid sub-path: /id");
    EXPECT_EQ(doc, original);
}

TEST(JsonPatchTest, PatchRootReplacesDocument) {
    QJsonObject doc = sampleDoc();
    QString error;
    ASSERT_TRUE(JsonPatch::patch(doc, "/", QJsonObject{{"plugins", QJsonObject()}}, error));
    EXPECT_EQ(doc, (QJsonObject{{"plugins", QJsonObject()}}));

    EXPECT_FALSE(JsonPatch::patch(doc, "/", 3, error));
    EXPECT_EQ(error, "invalid sub-path: /");
}

TEST(JsonPatchTest, PathIgnoresEmptySegmentsAndKeepsDots) {
    QJsonObject doc{{"plugins", QJsonObject{{"x", QJsonObject{{"a", 1}}}}},
                    {"labels", QJsonObject()}};
    QString error;

    ASSERT_TRUE(JsonPatch::patch(doc, "/plugins//x/", QJsonObject{{"b", 2}}, error));
    EXPECT_EQ(doc["plugins"].toObject()["x"].toObject(), (QJsonObject{{"a", 1}, {"b", 2}}));

    ASSERT_TRUE(JsonPatch::patch(doc, "labels/a.b", "v", error));
    EXPECT_EQ(doc["labels"].toObject(), (QJsonObject{{"a.b", "v"}}));

    ASSERT_TRUE(JsonPatch::patch(doc, "", QJsonObject{{"plugins", QJsonObject()}}, error));
    EXPECT_EQ(doc, (QJsonObject{{"plugins", QJsonObject()}}));
}
