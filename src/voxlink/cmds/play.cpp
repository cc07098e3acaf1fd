#include "voxlink/cmds/play.h"
#include "voxlink/cmds.h"
#include "voxlink/cmds/join.h"
#include "voxlink/remote/http_node.h"
#include "voxlink/voxlink.h"

namespace voxlink::command::play
{
dpp::slashcommand
get_register_obj (const dpp::snowflake &vx_id)
{
    return dpp::slashcommand ("play", "Play [a track]", vx_id)
        .add_option (dpp::command_option (dpp::co_string, "query",
                                          "Url or search query", true)
                         .set_max_length (500));
}

static bool
is_url (const std::string &query)
{
    return query.rfind ("https://", 0) == 0 || query.rfind ("http://", 0) == 0;
}

int
run (const dpp::slashcommand_t &event, std::string &out)
{
    std::string query;
    get_inter_param (event, "query", &query);

    if (query.empty ())
        {
            out = "Provide something to play";
            return 1;
        }

    auto guild_player = join::join_voice (event, out);
    if (!guild_player)
        return 1;

    auto *node = dynamic_cast<remote::HttpNode *> (guild_player->get_node ());
    if (!node)
        {
            out = "`[ERROR]` This node can't search tracks";
            return 1;
        }

    const load_result_t result
        = node->load_tracks (is_url (query) ? query : "ytsearch:" + query);

    switch (result.type)
        {
        case LOAD_ERROR:
            out = "`[ERROR]` " + result.error_message;
            return 1;
        case LOAD_EMPTY:
            out = "Can't find anything";
            return 1;
        default:
            break;
        }

    if (result.tracks.empty ())
        {
            out = "Can't find anything";
            return 1;
        }

    const track_t playing = guild_player->play (result.tracks.front ());

    out = "Playing **" + track::get_title (playing) + "**";

    if (result.type == LOAD_PLAYLIST && result.tracks.size () > 1)
        out += " (first of " + std::to_string (result.tracks.size ())
               + " playlist tracks)";

    return 0;
}

void
slash_run (const dpp::slashcommand_t &event)
{
    dispatch_run (event, run);
}

} // voxlink::command::play
