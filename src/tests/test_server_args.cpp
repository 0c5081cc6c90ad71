#include <gtest/gtest.h>

#include "pluginconf_server/config/server_args.h"

using namespace pluginconf_server;

TEST(ServerArgsTest, DefaultValues) {
    const auto args = ServerArgs::parse({"pluginconf_server"});
    EXPECT_EQ(args.dataRoot, ".");
    EXPECT_EQ(args.port, 9180);
    EXPECT_EQ(args.host, "127.0.0.1");
    EXPECT_EQ(args.logLevel, "info");
    EXPECT_TRUE(args.error.isEmpty());
    EXPECT_FALSE(args.hasPort);
    EXPECT_FALSE(args.hasHost);
    EXPECT_FALSE(args.hasLogLevel);
}

TEST(ServerArgsTest, AllOptions) {
    const auto args = ServerArgs::parse({
        "pluginconf_server",
        "--data-root=/tmp/data",
        "--port=9090",
        "--host=0.0.0.0",
        "--log-level=debug"
    });

    EXPECT_EQ(args.dataRoot, "/tmp/data");
    EXPECT_EQ(args.port, 9090);
    EXPECT_EQ(args.host, "0.0.0.0");
    EXPECT_EQ(args.logLevel, "debug");
    EXPECT_TRUE(args.hasPort);
    EXPECT_TRUE(args.hasHost);
    EXPECT_TRUE(args.hasLogLevel);
    EXPECT_TRUE(args.error.isEmpty());
}

TEST(ServerArgsTest, HelpAndVersion) {
    EXPECT_TRUE(ServerArgs::parse({"pluginconf_server", "-h"}).help);
    EXPECT_TRUE(ServerArgs::parse({"pluginconf_server", "--version"}).version);
}

TEST(ServerArgsTest, InvalidValues) {
    EXPECT_FALSE(ServerArgs::parse({"pluginconf_server", "--port=70000"}).error.isEmpty());
    EXPECT_FALSE(ServerArgs::parse({"pluginconf_server", "--port=abc"}).error.isEmpty());
    EXPECT_FALSE(ServerArgs::parse({"pluginconf_server", "--log-level=trace"}).error.isEmpty());
    EXPECT_FALSE(ServerArgs::parse({"pluginconf_server", "--data-root="}).error.isEmpty());
    EXPECT_FALSE(ServerArgs::parse({"pluginconf_server", "--host="}).error.isEmpty());
}

TEST(ServerArgsTest, UnknownOption) {
    const auto args = ServerArgs::parse({"pluginconf_server", "--webui-dir=/www"});
    EXPECT_EQ(args.error, "unknown option: --webui-dir=/www");
}
