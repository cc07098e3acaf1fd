#include "voxlink/cmds/volume.h"
#include "voxlink/cmds.h"
#include "voxlink/voxlink.h"
#include <algorithm>

#define VOLUME_MIN_STR "0"
#define VOLUME_MAX_STR "1000"

namespace voxlink::command::volume
{
dpp::slashcommand
get_register_obj (const dpp::snowflake &vx_id)
{
    return dpp::slashcommand ("volume", "Set [playback] volume", vx_id)
        .add_option (dpp::command_option (dpp::co_integer, "percentage",
                                          "Volume percentage [to set]. "
                                          "<" VOLUME_MIN_STR
                                          "-" VOLUME_MAX_STR ">",
                                          true)
                         .set_min_value (VOXLINK_MIN_VOLUME)
                         .set_max_value (VOXLINK_MAX_VOLUME));
}

int
run (const dpp::slashcommand_t &event, std::string &out)
{
    auto guild_player = cmd_pre_get_player (event.command.guild_id, out);
    if (!guild_player)
        return 1;

    int64_t v_arg = VOXLINK_DEFAULT_VOLUME;
    get_inter_param (event, "percentage", &v_arg);

    // out of range values get clamped
    guild_player->set_volume ((int)std::clamp<int64_t> (
        v_arg, VOXLINK_MIN_VOLUME, VOXLINK_MAX_VOLUME));

    out = "Volume set to " + std::to_string (guild_player->get_volume ())
          + "%";
    return 0;
}

void
slash_run (const dpp::slashcommand_t &event)
{
    dispatch_run (event, run);
}

} // voxlink::command::volume
