#ifndef VOXLINK_COMMAND_VOLUME_H
#define VOXLINK_COMMAND_VOLUME_H

#include <dpp/dpp.h>
#include <string>

namespace voxlink::command::volume
{
dpp::slashcommand get_register_obj (const dpp::snowflake &vx_id);

int run (const dpp::slashcommand_t &event, std::string &out);

void slash_run (const dpp::slashcommand_t &event);
} // voxlink::command::volume

#endif // VOXLINK_COMMAND_VOLUME_H
