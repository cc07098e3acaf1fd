#include "voxlink/slash.h"
#include "voxlink/cmds.h"
#include "voxlink/cmds/join.h"
#include "voxlink/cmds/pause.h"
#include "voxlink/cmds/play.h"
#include "voxlink/cmds/seek.h"
#include "voxlink/cmds/skip.h"
#include "voxlink/cmds/volume.h"

namespace voxlink::command
{
inline constexpr const command_handlers_map_t command_handlers
    = { { "join", join::slash_run },     { "leave", leave::slash_run },
        { "play", play::slash_run },     { "pause", pause::slash_run },
        { "resume", resume::slash_run }, { "seek", seek::slash_run },
        { "volume", volume::slash_run }, { "skip", skip::slash_run },
        { NULL, NULL } };

std::vector<dpp::slashcommand>
get_all (const dpp::snowflake &vx_id)
{
    std::vector<dpp::slashcommand> slash_commands ({
        join::get_register_obj (vx_id),
        leave::get_register_obj (vx_id),
        play::get_register_obj (vx_id),
        pause::get_register_obj (vx_id),
        resume::get_register_obj (vx_id),
        seek::get_register_obj (vx_id),
        volume::get_register_obj (vx_id),
        skip::get_register_obj (vx_id),
    });
    return slash_commands;
}

const command_handler_t *
get_slash_command_handlers ()
{
    return command_handlers;
}
} // voxlink::command
