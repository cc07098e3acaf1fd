#include "voxlink/cmds/pause.h"
#include "voxlink/cmds.h"
#include "voxlink/voxlink.h"

namespace voxlink::command
{

static int
set_paused (const dpp::slashcommand_t &event, std::string &out, bool value)
{
    auto guild_player = cmd_pre_get_player (event.command.guild_id, out);
    if (!guild_player)
        return 1;

    if (!guild_player->get_current ().has_value ())
        {
            out = "I'm not playing anything";
            return 1;
        }

    if (guild_player->is_paused () == value)
        {
            out = value ? "Already paused" : "Not paused";
            return 1;
        }

    guild_player->pause (value);

    out = value ? "Paused" : "Resumed";
    return 0;
}

namespace pause
{
dpp::slashcommand
get_register_obj (const dpp::snowflake &vx_id)
{
    return dpp::slashcommand ("pause", "Pause [currently playing] track",
                              vx_id);
}

int
run (const dpp::slashcommand_t &event, std::string &out)
{
    return set_paused (event, out, true);
}

void
slash_run (const dpp::slashcommand_t &event)
{
    dispatch_run (event, run);
}
} // pause

namespace resume
{
dpp::slashcommand
get_register_obj (const dpp::snowflake &vx_id)
{
    return dpp::slashcommand ("resume", "Resume [paused] track", vx_id);
}

int
run (const dpp::slashcommand_t &event, std::string &out)
{
    return set_paused (event, out, false);
}

void
slash_run (const dpp::slashcommand_t &event)
{
    dispatch_run (event, run);
}
} // resume

} // voxlink::command
