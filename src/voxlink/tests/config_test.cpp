#include "voxlink/config.h"
#include "voxlink/remote/http_node.h"
#include "voxlink/voxlink.h"
#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>
#include <string>

using namespace voxlink;

class ConfigTest : public testing::Test
{
  protected:
    std::string path;

    void
    SetUp () override
    {
        path = testing::TempDir () + "voxlink_config_test.json";
    }

    void
    TearDown () override
    {
        std::remove (path.c_str ());
        vx_cfg = nullptr;
    }

    void
    write (const std::string &content)
    {
        std::ofstream f (path);
        f << content;
    }
};

TEST_F (ConfigTest, LoadsValues)
{
    write (R"({ "VX_ID": 1234, "CONNECT_TIMEOUT": 2.5, "SELF_DEAF": false })");

    ASSERT_EQ (load_config (path), 0);
    EXPECT_EQ (get_vx_id (), dpp::snowflake (1234));
    EXPECT_DOUBLE_EQ (get_connect_timeout (), 2.5);
    EXPECT_FALSE (get_self_deaf ());
    EXPECT_EQ (get_config_value<std::string> ("MISSING", "fallback"),
               "fallback");
}

TEST_F (ConfigTest, DefaultsWhenUnset)
{
    write ("{}");

    ASSERT_EQ (load_config (path), 0);
    EXPECT_DOUBLE_EQ (get_connect_timeout (), VOXLINK_DEFAULT_CONNECT_TIMEOUT);
    EXPECT_TRUE (get_self_deaf ());
}

TEST_F (ConfigTest, MissingFile)
{
    EXPECT_EQ (load_config (path + ".missing"), -1);
}

TEST_F (ConfigTest, InvalidJson)
{
    write ("{ not json");

    EXPECT_EQ (load_config (path), -2);
    EXPECT_TRUE (vx_cfg.is_null ());
}

TEST (NodeConfigTest, ParsesEntry)
{
    const remote::node_config_t cfg = remote::node_config_from_json (
        { { "HOST", "lava.local" },
          { "PORT", 443 },
          { "SECURE", true },
          { "PASSWORD", "pw" },
          { "SESSION_ID", "vx" } });

    EXPECT_EQ (cfg.identifier, "lava.local:443");
    EXPECT_EQ (cfg.port, 443);
    EXPECT_TRUE (cfg.secure);
    EXPECT_EQ (cfg.password, "pw");
    EXPECT_EQ (cfg.session_id, "vx");

    remote::HttpNode node (nullptr, cfg);
    EXPECT_EQ (node.get_base_url (), "https://lava.local:443");
    EXPECT_EQ (node.get_identifier (), "lava.local:443");
}

TEST (NodeConfigTest, RequiresHost)
{
    EXPECT_THROW (remote::node_config_from_json ({ { "PORT", 2333 } }),
                  voxlink::exception);
    EXPECT_THROW (remote::node_config_from_json ("nope"), voxlink::exception);
}
