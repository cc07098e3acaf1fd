#include "voxlink/cmds.h"
#include "voxlink/thread_manager.h"
#include "voxlink/voxlink.h"
#include <thread>

namespace voxlink::command
{

handle_command_status_e
handle_command (const handle_command_params_t &params)
{
    void (*handler) (const dpp::slashcommand_t &) = nullptr;

    for (const command_handler_t *i = params.command_handlers_map;
         i->name != NULL; i++)
        {
            if (params.command_name != i->name)
                continue;

            handler = i->handler;
            break;
        }

    if (!handler)
        return HANDLE_SLASH_COMMAND_NO_HANDLER;

    handler (params.event);

    return HANDLE_SLASH_COMMAND_SUCCESS;
}

void
dispatch_run (const dpp::slashcommand_t &event, command_run_t run)
{
    event.thinking ();

    std::thread t ([event, run] () {
        thread_manager::DoneSetter tmds;

        const std::string out = run_guarded (
            event.command.get_command_name (),
            [&event, run] (std::string &o) { run (event, o); });

        event.edit_response (out);
    });

    thread_manager::dispatch (t);
}

std::shared_ptr<player::Player>
cmd_pre_get_player (const dpp::snowflake &guild_id, std::string &out)
{
    player::Manager *player_manager = get_player_manager_ptr ();
    if (!player_manager)
        {
            out = "I'm shutting down";
            return nullptr;
        }

    auto guild_player = player_manager->get_player (guild_id);

    if (!guild_player
        || guild_player->get_state () != player::CONNECTION_CONNECTED)
        {
            out = "I'm not connected, use `/join` first";
            return nullptr;
        }

    return guild_player;
}

} // voxlink::command
