#ifndef VOXLINK_COMMAND_PAUSE_H
#define VOXLINK_COMMAND_PAUSE_H

#include <dpp/dpp.h>
#include <string>

namespace voxlink::command::pause
{
dpp::slashcommand get_register_obj (const dpp::snowflake &vx_id);

int run (const dpp::slashcommand_t &event, std::string &out);

void slash_run (const dpp::slashcommand_t &event);
} // voxlink::command::pause

namespace voxlink::command::resume
{
dpp::slashcommand get_register_obj (const dpp::snowflake &vx_id);

int run (const dpp::slashcommand_t &event, std::string &out);

void slash_run (const dpp::slashcommand_t &event);
} // voxlink::command::resume

#endif // VOXLINK_COMMAND_PAUSE_H
