#include "mocks.h"
#include "voxlink/player.h"
#include "voxlink/remote/pool.h"
#include <gtest/gtest.h>
#include <memory>

using namespace voxlink;
using voxlink::tests::IsVoicePush;
using voxlink::tests::MockNode;
using voxlink::tests::MockVoiceClient;
using testing::_;
using testing::NiceMock;

namespace
{
constexpr uint64_t VX_ID = 1;
constexpr uint64_t OTHER_USER = 2;
constexpr uint64_t GUILD = 100;
constexpr uint64_t CHANNEL = 200;

class ManagerTest : public testing::Test
{
  protected:
    remote::Pool pool;
    MockNode *node = nullptr;
    NiceMock<MockVoiceClient> client;
    std::unique_ptr<player::Manager> manager;

    void
    SetUp () override
    {
        node = static_cast<MockNode *> (
            pool.add_node (std::make_unique<NiceMock<MockNode> > ("n1")));

        manager = std::make_unique<player::Manager> (&pool, &client, VX_ID);
    }
};
} // namespace

TEST_F (ManagerTest, CreateReturnsExistingPlayer)
{
    auto p1 = manager->create_player (GUILD, CHANNEL);
    auto p2 = manager->create_player (GUILD, CHANNEL + 1);

    EXPECT_EQ (p1, p2);
    EXPECT_EQ (p1->get_node (), node);
    EXPECT_EQ (manager->player_count (), 1u);
    EXPECT_EQ (manager->get_player (GUILD), p1);
    EXPECT_EQ (manager->get_player (GUILD + 1), nullptr);
}

TEST_F (ManagerTest, EmptyPoolCantCreate)
{
    remote::Pool empty;
    player::Manager m (&empty, &client, VX_ID);

    EXPECT_THROW (m.create_player (GUILD, CHANNEL), voxlink::exception);
}

TEST_F (ManagerTest, ExplicitNodeWins)
{
    NiceMock<MockNode> other ("other");

    auto p = manager->create_player (GUILD, CHANNEL, &other);
    EXPECT_EQ (p->get_node (), &other);
}

TEST_F (ManagerTest, RoutesOwnVoiceEventsToPlayer)
{
    auto p = manager->create_player (GUILD, CHANNEL);

    EXPECT_CALL (*node, update_player (dpp::snowflake (GUILD), IsVoicePush (),
                                       _))
        .Times (1);

    EXPECT_CALL (client, change_voice_state (_, dpp::snowflake (CHANNEL), _,
                                             _))
        .WillOnce ([this] (auto &&...) {
            // someone else's state is ignored
            manager->handle_voice_state (GUILD, OTHER_USER, CHANNEL, "x");
            manager->handle_voice_server (GUILD, "tkn", "ep");
            manager->handle_voice_state (GUILD, VX_ID, CHANNEL, "sess");
        });

    p->connect (1.0);

    EXPECT_EQ (p->get_state (), player::CONNECTION_CONNECTED);
}

TEST_F (ManagerTest, OtherUsersCantCompleteHandshake)
{
    auto p = manager->create_player (GUILD, CHANNEL);

    EXPECT_CALL (*node, update_player (_, _, _)).Times (0);

    manager->handle_voice_server (GUILD, "tkn", "ep");
    manager->handle_voice_state (GUILD, OTHER_USER, CHANNEL, "sess");

    EXPECT_THROW (p->connect (0.02), player::channel_timeout);
}

TEST_F (ManagerTest, EventsWithoutPlayerAreIgnored)
{
    EXPECT_NO_THROW (
        manager->handle_voice_state (GUILD, VX_ID, CHANNEL, "sess"));
    EXPECT_NO_THROW (manager->handle_voice_server (GUILD, "tkn", "ep"));
    EXPECT_EQ (manager->player_count (), 0u);
}

TEST_F (ManagerTest, LeavingChannelDropsPlayer)
{
    auto p = manager->create_player (GUILD, CHANNEL);

    ON_CALL (client, change_voice_state (_, dpp::snowflake (CHANNEL), _, _))
        .WillByDefault ([this] (auto &&...) {
            manager->handle_voice_state (GUILD, VX_ID, CHANNEL, "sess");
            manager->handle_voice_server (GUILD, "tkn", "ep");
        });

    p->connect (1.0);
    ASSERT_EQ (node->player_count (), 1u);

    EXPECT_CALL (*node, destroy_player (dpp::snowflake (GUILD))).Times (1);

    manager->handle_voice_state (GUILD, VX_ID, 0, "sess");

    EXPECT_EQ (p->get_state (), player::CONNECTION_INVALIDATED);
    EXPECT_EQ (manager->get_player (GUILD), nullptr);
    EXPECT_EQ (node->player_count (), 0u);

    // a fresh player takes the slot
    auto p2 = manager->create_player (GUILD, CHANNEL);
    EXPECT_NE (p2, p);
}

TEST_F (ManagerTest, InvalidatedPlayerIsReplaced)
{
    auto p = manager->create_player (GUILD, CHANNEL);
    p->disconnect ();

    auto p2 = manager->create_player (GUILD, CHANNEL);

    EXPECT_NE (p, p2);
    EXPECT_EQ (p2->get_state (), player::CONNECTION_DISCONNECTED);
}

TEST_F (ManagerTest, DeletePlayer)
{
    manager->create_player (GUILD, CHANNEL);

    EXPECT_TRUE (manager->delete_player (GUILD));
    EXPECT_FALSE (manager->delete_player (GUILD));
    EXPECT_EQ (manager->player_count (), 0u);
}
