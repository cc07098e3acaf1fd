/*
    Global program states goes here
*/

#include "voxlink/voxlink.h"
#include "voxlink/config.h"
#include <atomic>
#include <fstream>
#include <mutex>

namespace voxlink
{
nlohmann::json vx_cfg; // EXTERN_VARIABLE

// use this mutex for every state stored here
std::mutex main_mutex;

std::atomic<bool> running = false;
bool debug = false;

dpp::snowflake
get_vx_id ()
{
    return get_config_value<uint64_t> ("VX_ID", 0);
}

std::string
get_vx_token ()
{
    return get_config_value<std::string> ("VX_TKN", "");
}

double
get_connect_timeout ()
{
    const double v = get_config_value<double> (
        "CONNECT_TIMEOUT", VOXLINK_DEFAULT_CONNECT_TIMEOUT);

    return v > 0.0 ? v : VOXLINK_DEFAULT_CONNECT_TIMEOUT;
}

bool
get_self_deaf ()
{
    return get_config_value<bool> ("SELF_DEAF", true);
}

int
load_config (const std::string &config_file)
{
    std::ifstream scs (config_file);
    if (!scs.is_open ())
        {
            fprintf (stderr, "[ERROR] No config file exist: %s\n",
                     config_file.c_str ());
            return -1;
        }

    try
        {
            scs >> vx_cfg;
        }
    catch (const nlohmann::json::exception &e)
        {
            fprintf (stderr, "[ERROR] Invalid config file %s: %s\n",
                     config_file.c_str (), e.what ());
            vx_cfg = nullptr;
            return -2;
        }

    return 0;
}

bool
get_running_state ()
{
    std::lock_guard lk (main_mutex);
    return running;
}

int
set_running_state (const bool state)
{
    std::lock_guard lk (main_mutex);
    running = state;
    return 0;
}

bool
get_debug_state ()
{
    std::lock_guard lk (main_mutex);
    return debug;
}

int
set_debug_state (const bool state)
{
    std::lock_guard lk (main_mutex);
    debug = state;

    fprintf (stderr, "[INFO] Debug mode %s\n", debug ? "enabled" : "disabled");

    return 0;
}

dpp::channel *
get_voice_channel (const dpp::snowflake &guild_id,
                   const dpp::snowflake &user_id)
{
    dpp::guild *g = dpp::find_guild (guild_id);
    if (!g)
        return NULL;

    for (auto &fc : g->channels)
        {
            auto gc = dpp::find_channel (fc);
            if (!gc || (!gc->is_voice_channel () && !gc->is_stage_channel ()))
                continue;

            std::map<dpp::snowflake, dpp::voicestate> vm
                = gc->get_voice_members ();

            if (vm.find (user_id) != vm.end ())
                return gc;
        }

    return NULL;
}

exception::exception (const std::string &_message, int _code)
    : message (_message), c (_code)
{
}

const char *
exception::what () const noexcept
{
    return message.c_str ();
}

int
exception::code () const noexcept
{
    return c;
}

not_implemented::not_implemented (const std::string &_message)
    : exception (_message)
{
}

} // voxlink
