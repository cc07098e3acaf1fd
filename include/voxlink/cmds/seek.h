#ifndef VOXLINK_COMMAND_SEEK_H
#define VOXLINK_COMMAND_SEEK_H

#include <dpp/dpp.h>
#include <string>

namespace voxlink::command::seek
{
dpp::slashcommand get_register_obj (const dpp::snowflake &vx_id);

int run (const dpp::slashcommand_t &event, std::string &out);

void slash_run (const dpp::slashcommand_t &event);
} // voxlink::command::seek

#endif // VOXLINK_COMMAND_SEEK_H
