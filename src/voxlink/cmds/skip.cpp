#include "voxlink/cmds/skip.h"
#include "voxlink/cmds.h"
#include "voxlink/voxlink.h"

namespace voxlink::command::skip
{
dpp::slashcommand
get_register_obj (const dpp::snowflake &vx_id)
{
    return dpp::slashcommand ("skip", "Skip [currently playing] track", vx_id);
}

int
run (const dpp::slashcommand_t &event, std::string &out)
{
    auto guild_player = cmd_pre_get_player (event.command.guild_id, out);
    if (!guild_player)
        return 1;

    const auto skipped = guild_player->skip ();

    if (!skipped.has_value ())
        {
            out = "I'm not playing anything";
            return 1;
        }

    out = "Skipped **" + track::get_title (*skipped) + "**";
    return 0;
}

void
slash_run (const dpp::slashcommand_t &event)
{
    dispatch_run (event, run);
}

} // voxlink::command::skip
