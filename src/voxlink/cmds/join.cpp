#include "voxlink/cmds/join.h"
#include "voxlink/cmds.h"
#include "voxlink/voxlink.h"

namespace voxlink
{
namespace command
{
namespace join
{
dpp::slashcommand
get_register_obj (const dpp::snowflake &vx_id)
{
    return dpp::slashcommand ("join", "Join [your voice channel]", vx_id);
}

std::shared_ptr<player::Player>
join_voice (const dpp::slashcommand_t &event, std::string &out)
{
    player::Manager *player_manager = get_player_manager_ptr ();
    if (!player_manager)
        {
            out = "I'm shutting down";
            return nullptr;
        }

    const dpp::snowflake guild_id = event.command.guild_id;

    dpp::channel *usc = get_voice_channel (guild_id, event.command.usr.id);
    if (!usc)
        {
            out = "Join a voice channel first you dummy";
            return nullptr;
        }

    auto guild_player = player_manager->get_player (guild_id);

    if (guild_player
        && guild_player->get_state () == player::CONNECTION_CONNECTED)
        {
            if (guild_player->get_channel_id () == usc->id)
                return guild_player;

            out = "I'm already in a voice channel";
            return nullptr;
        }

    // a player bound to another channel can't be moved, start over
    if (guild_player && guild_player->get_channel_id () != usc->id)
        {
            guild_player->disconnect ();
            player_manager->delete_player (guild_id);
        }

    guild_player = player_manager->create_player (guild_id, usc->id);

    try
        {
            guild_player->connect (get_connect_timeout (), false,
                                   get_self_deaf ());
        }
    catch (const player::channel_timeout &e)
        {
            out = e.what ();
            return nullptr;
        }

    return guild_player;
}

int
run (const dpp::slashcommand_t &event, std::string &out)
{
    auto guild_player = join_voice (event, out);
    if (!guild_player)
        return 1;

    out = "Joined <#" + guild_player->get_channel_id ().str () + ">";
    return 0;
}

void
slash_run (const dpp::slashcommand_t &event)
{
    dispatch_run (event, run);
}
} // join

namespace leave
{
dpp::slashcommand
get_register_obj (const dpp::snowflake &vx_id)
{
    return dpp::slashcommand ("leave", "Leave [your voice channel]", vx_id);
}

int
run (const dpp::slashcommand_t &event, std::string &out)
{
    player::Manager *player_manager = get_player_manager_ptr ();
    if (!player_manager)
        return -1;

    const dpp::snowflake guild_id = event.command.guild_id;

    auto guild_player = player_manager->get_player (guild_id);
    if (!guild_player
        || guild_player->get_state () == player::CONNECTION_INVALIDATED)
        {
            out = "I'm not in a voice channel";
            return 1;
        }

    dpp::channel *usc = get_voice_channel (guild_id, event.command.usr.id);
    if (!usc || usc->id != guild_player->get_channel_id ())
        {
            out = "You're not in my voice channel";
            return 1;
        }

    guild_player->disconnect ();
    player_manager->delete_player (guild_id);

    out = "Left";
    return 0;
}

void
slash_run (const dpp::slashcommand_t &event)
{
    dispatch_run (event, run);
}
} // leave
} // command
} // voxlink
