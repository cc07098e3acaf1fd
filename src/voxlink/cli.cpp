#include "voxlink/slash.h"
#include "voxlink/voxlink.h"
#include <iostream>
#include <regex>
#include <sstream>

namespace voxlink
{

static void
print_usage ()
{
    fprintf (stderr, "Usage:\n\tvoxlink reg <guild_id|\"g\">\n\tvoxlink "
                     "rm-reg <guild_id|\"g\">\n");
}

static void
command_bulk_callback (const dpp::confirmation_callback_t &e)
{
    if (e.is_error ())
        {
            dpp::error_info ev = e.get_error ();

            std::cerr << "[cli ERROR] " << ev.code << ": " << ev.message
                      << '\n';

            for (const dpp::error_detail &d : ev.errors)
                std::cerr << "\t" << d.object << '.' << d.field << ": "
                          << d.reason << " (" << d.code << ")\n";
        }
    else
        fprintf (stderr, "[cli] Done\n");

    set_running_state (false);
}

static int
reg (dpp::cluster &client, const dpp::snowflake &vx_id, int argc,
     const char *argv[], bool rm)
{
    if (argc < 3)
        {
            fprintf (stderr,
                     "Provide guild_id or \"g\" to register globally\n");
            set_running_state (false);
            return 1;
        }

    const std::string target (argv[2]);
    const std::vector<dpp::slashcommand> cmds
        = rm ? std::vector<dpp::slashcommand>{} : command::get_all (vx_id);

    // bulk create replaces the whole set, an empty one removes all
    client.me.id = vx_id;

    if (target == "g")
        {
            fprintf (stderr, "%s commands globally...\n",
                     rm ? "Deleting" : "Registering");

            client.global_bulk_command_create (cmds, command_bulk_callback);
            return 0;
        }

    if (!std::regex_match (target, std::regex ("^\\d{17,20}$")))
        {
            fprintf (stderr, "Provide valid guild_id\n");
            set_running_state (false);
            return 1;
        }

    uint64_t gid = 0;
    std::istringstream iss (target);
    iss >> gid;

    if (iss.fail ())
        {
            fprintf (stderr, "Invalid guild_id, too large\n");
            set_running_state (false);
            return 1;
        }

    fprintf (stderr, "%s commands in %s...\n",
             rm ? "Deleting" : "Registering", target.c_str ());

    client.guild_bulk_command_create (cmds, dpp::snowflake (gid),
                                      command_bulk_callback);
    return 0;
}

int
cli (dpp::cluster &client, dpp::snowflake vx_id, int argc, const char *argv[])
{
    const std::string a1 (argv[1]);

    if (a1 == "reg")
        return reg (client, vx_id, argc, argv, false);

    if (a1 == "rm-reg")
        return reg (client, vx_id, argc, argv, true);

    print_usage ();
    set_running_state (false);
    return 1;
}

} // voxlink
