#ifndef VOXLINK_H
#define VOXLINK_H

#include <dpp/dpp.h>
#include <dpp/json.h>
#include <exception>
#include <stdio.h>
#include <string>
#include <vector>

namespace voxlink
{
namespace player
{
class Manager;
} // player

namespace remote
{
class Pool;
} // remote

extern nlohmann::json vx_cfg;

// Main
int run (int argc, const char *argv[]);

/**
 * @brief Load config file into `vx_cfg`
 *
 * @param config_file
 * @return int 0 on success, -1 when the file can't be opened, -2 on invalid
 * json
 */
int load_config (const std::string &config_file);

/**
 * @brief Get current running state
 */
bool get_running_state ();

/**
 * @brief Set current running state, setting to false will cause program to
 * perform clean up and exit
 *
 * @return int 0 on success
 */
int set_running_state (const bool state);

/**
 * @brief Get current debug state
 */
bool get_debug_state ();

/**
 * @brief Set current debug state, setting to true will enable verbose logging
 *
 * @return int 0 on success
 */
int set_debug_state (const bool state);

/**
 * @brief Get config value of key
 *
 * @param key
 * @param default_value
 *
 * @return T
 */
template <typename T>
T
get_config_value (const std::string &key, const T &default_value)
{
    if (vx_cfg.is_null ())
        {
            fprintf (stderr, "[ERROR] Config isn't populated\n");
            return default_value;
        }

    if (!vx_cfg.is_object ())
        {
            fprintf (stderr, "[ERROR] Invalid config, config isn't object\n");
            return default_value;
        }

    return vx_cfg.value (key, default_value);
}

/**
 * @brief Get default `connect` timeout in seconds
 */
double get_connect_timeout ();

/**
 * @brief Whether to join voice channels self deafened
 */
bool get_self_deaf ();

/**
 * @brief Get bot user id
 */
dpp::snowflake get_vx_id ();

/**
 * @brief Get bot token
 */
std::string get_vx_token ();

/**
 * @brief Get player manager ptr, returns nullptr if program exiting
 */
player::Manager *get_player_manager_ptr ();

/**
 * @brief Get node pool ptr, returns nullptr if program exiting
 */
remote::Pool *get_pool_ptr ();

template <typename T, typename E>
void
get_inter_param (const E &event, std::string param_name, T *param)
{
    auto p = event.get_parameter (param_name);
    if (p.index ())
        *param = std::get<T> (p);
}

/**
 * @brief Get the voice channel a user is currently in
 *
 * @param guild_id
 * @param user_id
 * @return dpp::channel* nullptr if user isn't in any cached voice channel
 */
dpp::channel *get_voice_channel (const dpp::snowflake &guild_id,
                                 const dpp::snowflake &user_id);

int cli (dpp::cluster &client, dpp::snowflake vx_id, int argc,
         const char *argv[]);

class exception : public std::exception
{
  private:
    std::string message;
    int c;

  public:
    exception (const std::string &_message, int _code = 0);

    virtual const char *what () const noexcept;

    virtual int code () const noexcept;
};

/**
 * @brief Thrown by operations the remote protocol doesn't define yet
 */
class not_implemented : public exception
{
  public:
    not_implemented (const std::string &_message);
};

}

#endif // VOXLINK_H
