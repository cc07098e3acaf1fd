#include "voxlink/cmds/seek.h"
#include "voxlink/cmds.h"
#include "voxlink/voxlink.h"
#include <cstdint>

namespace voxlink::command::seek
{
dpp::slashcommand
get_register_obj (const dpp::snowflake &vx_id)
{
    return dpp::slashcommand ("seek", "Seek [currently playing] track", vx_id)
        .add_option (dpp::command_option (dpp::co_integer, "position",
                                          "Position [to seek to] in ms", true)
                         .set_min_value (0));
}

int
run (const dpp::slashcommand_t &event, std::string &out)
{
    auto guild_player = cmd_pre_get_player (event.command.guild_id, out);
    if (!guild_player)
        return 1;

    int64_t position = -1;
    get_inter_param (event, "position", &position);

    if (position < 0)
        {
            out = "Invalid `position` argument";
            return 1;
        }

    const auto current = guild_player->get_current ();
    if (!current.has_value ())
        {
            out = "I'm not playing anything";
            return 1;
        }

    if (!current->is_seekable)
        {
            out = "This track can't be seeked";
            return 1;
        }

    guild_player->seek (position);

    out = "Seeking to " + std::to_string (position) + " ms";
    return 0;
}

void
slash_run (const dpp::slashcommand_t &event)
{
    dispatch_run (event, run);
}

} // voxlink::command::seek
