#ifndef VOXLINK_COMMAND_JOIN_H
#define VOXLINK_COMMAND_JOIN_H

#include "voxlink/player.h"
#include <dpp/dpp.h>
#include <memory>
#include <string>

namespace voxlink::command::join
{
dpp::slashcommand get_register_obj (const dpp::snowflake &vx_id);

int run (const dpp::slashcommand_t &event, std::string &out);

void slash_run (const dpp::slashcommand_t &event);

/**
 * @brief Connect a player to the voice channel of the command's author,
 * reusing the guild's connected player when it's in that channel already.
 * Blocks until connected, call from a worker thread.
 *
 * @param out Set to the reply text on failure
 * @return std::shared_ptr<player::Player> nullptr on failure
 */
std::shared_ptr<player::Player> join_voice (const dpp::slashcommand_t &event,
                                            std::string &out);
} // voxlink::command::join

namespace voxlink::command::leave
{
dpp::slashcommand get_register_obj (const dpp::snowflake &vx_id);

int run (const dpp::slashcommand_t &event, std::string &out);

void slash_run (const dpp::slashcommand_t &event);
} // voxlink::command::leave

#endif // VOXLINK_COMMAND_JOIN_H
