#include "mocks.h"
#include "voxlink/player.h"
#include "voxlink/remote/pool.h"
#include <gtest/gtest.h>
#include <memory>

using namespace voxlink;
using voxlink::tests::MockNode;
using voxlink::tests::MockVoiceClient;

TEST (PoolTest, EmptyPoolHasNoNode)
{
    remote::Pool pool;

    EXPECT_EQ (pool.get_node (), nullptr);
    EXPECT_EQ (pool.size (), 0u);
}

TEST (PoolTest, RejectsDuplicateIdentifier)
{
    remote::Pool pool;

    pool.add_node (std::make_unique<MockNode> ("a"));

    EXPECT_THROW (pool.add_node (std::make_unique<MockNode> ("a")),
                  voxlink::exception);
    EXPECT_THROW (pool.add_node (nullptr), voxlink::exception);
    EXPECT_EQ (pool.size (), 1u);
}

TEST (PoolTest, PicksLeastLoadedNode)
{
    remote::Pool pool;
    testing::NiceMock<MockVoiceClient> client;

    remote::Node *a = pool.add_node (std::make_unique<MockNode> ("a"));
    remote::Node *b = pool.add_node (std::make_unique<MockNode> ("b"));

    // ties go to the first added
    EXPECT_EQ (pool.get_node (), a);

    auto p1 = std::make_shared<player::Player> (a, &client, 1, 11);
    ASSERT_TRUE (a->add_player (1, p1));

    EXPECT_EQ (pool.get_node (), b);

    auto p2 = std::make_shared<player::Player> (b, &client, 2, 22);
    auto p3 = std::make_shared<player::Player> (b, &client, 3, 33);
    ASSERT_TRUE (b->add_player (2, p2));
    ASSERT_TRUE (b->add_player (3, p3));

    EXPECT_EQ (pool.get_node (), a);
    EXPECT_EQ (pool.get_node ("b"), b);
    EXPECT_EQ (pool.get_node ("c"), nullptr);
}

TEST (NodeRegistryTest, OnePlayerPerGuild)
{
    MockNode node;
    testing::NiceMock<MockVoiceClient> client;

    auto p1 = std::make_shared<player::Player> (&node, &client, 1, 11);
    auto p2 = std::make_shared<player::Player> (&node, &client, 1, 12);

    EXPECT_TRUE (node.add_player (1, p1));
    EXPECT_FALSE (node.add_player (1, p2));
    EXPECT_EQ (node.get_player (1), p1);

    EXPECT_EQ (node.remove_player (1), p1);
    EXPECT_EQ (node.remove_player (1), nullptr);
    EXPECT_EQ (node.player_count (), 0u);
}
