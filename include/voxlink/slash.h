#ifndef VOXLINK_SLASH_H
#define VOXLINK_SLASH_H

#include "voxlink/cmds.h"
#include <dpp/dpp.h>
#include <vector>

namespace voxlink
{
namespace command
{
/**
 * @brief Get all application command object to register
 *
 * @param vx_id
 * @return std::vector<dpp::slashcommand>
 */
std::vector<dpp::slashcommand> get_all (const dpp::snowflake &vx_id);

/**
 * @brief Get slash command handlers map
 */
const command_handler_t *get_slash_command_handlers ();
} // command
} // voxlink

#endif // VOXLINK_SLASH_H
