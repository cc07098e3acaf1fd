#ifndef VOXLINK_COMMAND_H
#define VOXLINK_COMMAND_H

#include "voxlink/player.h"
#include <dpp/dpp.h>
#include <functional>
#include <memory>
#include <string>

namespace voxlink::command
{
struct command_handler_t
{
    const char *name;
    void (*const handler) (const dpp::slashcommand_t &);
};

using command_handlers_map_t = command_handler_t[];

/**
 * @brief Command body producing the reply text in `out`
 */
using command_run_t = int (*) (const dpp::slashcommand_t &, std::string &);

struct handle_command_params_t
{
    const std::string &command_name;
    const command_handler_t *const command_handlers_map;
    const dpp::slashcommand_t &event;
};

enum handle_command_status_e
{
    HANDLE_SLASH_COMMAND_SUCCESS,
    HANDLE_SLASH_COMMAND_NO_HANDLER,
};

handle_command_status_e handle_command (const handle_command_params_t &params);

/**
 * @brief Run a command body and return its reply text. voxlink::exception
 * text is shown to the user, other errors are logged and answered
 * generically, an empty reply becomes "Done".
 */
std::string run_guarded (const std::string &command_name,
                         const std::function<void (std::string &)> &body);

/**
 * @brief Defer the reply and run `run` on a worker thread, the reply is
 * edited with its output. Use for anything calling Player::connect or a
 * remote node so the shard thread keeps delivering voice events.
 */
void dispatch_run (const dpp::slashcommand_t &event, command_run_t run);

/**
 * @brief Get the connected player of guild_id
 *
 * @param out Set to the reply text when no usable player exists
 * @return std::shared_ptr<player::Player> nullptr when none
 */
std::shared_ptr<player::Player>
cmd_pre_get_player (const dpp::snowflake &guild_id, std::string &out);

} // voxlink::command

#endif // VOXLINK_COMMAND_H
