#include "voxlink/events.h"
#include "voxlink/player.h"
#include "voxlink/remote/http_node.h"
#include "voxlink/remote/pool.h"
#include "voxlink/thread_manager.h"
#include "voxlink/voice_client.h"
#include "voxlink/voxlink.h"
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <thread>
#include <unistd.h>

#define STR_SIZE(x) (sizeof (x) / sizeof (x[0])) - 1

namespace voxlink
{
// defined with the rest of the program state in voxlink.cpp
extern std::atomic<bool> running;

// ================================================================================

player::Manager *player_manager_ptr = nullptr;
remote::Pool *pool_ptr = nullptr;

// ================================================================================

player::Manager *
get_player_manager_ptr ()
{
    if (!get_running_state ())
        return nullptr;

    return player_manager_ptr;
}

remote::Pool *
get_pool_ptr ()
{
    if (!get_running_state ())
        return nullptr;

    return pool_ptr;
}

/**
 * @brief Add every entry of the NODES config array to pool
 *
 * @return int Number of nodes added
 */
static int
load_config_nodes (dpp::cluster *client, remote::Pool &pool)
{
    auto i_a = vx_cfg.find ("NODES");

    if (i_a == vx_cfg.end () || !i_a->is_array ())
        return 0;

    int added = 0;

    for (const nlohmann::json &entry : *i_a)
        {
            try
                {
                    pool.add_node (std::make_unique<remote::HttpNode> (
                        client, remote::node_config_from_json (entry)));
                    added++;
                }
            catch (const exception &e)
                {
                    fprintf (stderr, "[ERROR] Skipping node entry: %s\n",
                             e.what ());
                }
        }

    return added;
}

// ================================================================================

std::atomic<int> _sigint_count = 0;

void
on_sigint ([[maybe_unused]] int code)
{
    _sigint_count++;

    static const char exit_msg[] = "Received SIGINT, exiting...\n";

    // printf isn't signal safe, use write
    write (STDERR_FILENO, exit_msg, STR_SIZE (exit_msg));

    if (_sigint_count >= 3)
        {
            static const char force_exit_msg[]
                = "Understood, force exiting...\n";

            write (STDERR_FILENO, force_exit_msg, STR_SIZE (force_exit_msg));

            _exit (255);
        }

    running = false;
}

auto dpp_cout_logger = dpp::utility::cout_logger ();

int
run (int argc, const char *argv[])
{
    signal (SIGINT, on_sigint);
    set_running_state (true);

    const char *env_config = getenv ("VOXLINK_CONFIG");

    int config_status = load_config (
        env_config && *env_config ? env_config : VOXLINK_DEFAULT_CONFIG_FILE);

    if (config_status != 0)
        return config_status;

    set_debug_state (get_config_value<bool> ("DEBUG", false));

    const std::string vx_token = get_vx_token ();
    if (vx_token.empty ())
        {
            fprintf (stderr, "[ERROR] No token provided\n");
            return -1;
        }

    if (!get_vx_id ())
        {
            fprintf (stderr, "[ERROR] No bot user Id provided\n");
            return -1;
        }

    if (argc > 1)
        {
            dpp::cluster client (vx_token, dpp::i_default_intents);

            int ret = cli (client, get_vx_id (), argc, argv);

            while (get_running_state ())
                std::this_thread::sleep_for (std::chrono::seconds (1));

            return ret;
        }

    dpp::cluster client (vx_token, dpp::i_default_intents);

    remote::Pool pool;
    if (load_config_nodes (&client, pool) == 0)
        {
            fprintf (stderr, "[ERROR] No remote node configured, add at "
                             "least one entry to NODES\n");
            return -1;
        }

    voice::DppVoiceClient voice_client (&client);
    player::Manager player_manager (&pool, &voice_client, get_vx_id ());

    pool_ptr = &pool;
    player_manager_ptr = &player_manager;

    client.on_log ([] (const dpp::log_t &event) {
        if (!get_debug_state ())
            return;

        dpp_cout_logger (event);
    });

    events::load_events (&client);

    client.start (true);

    while (get_running_state ())
        {
            std::this_thread::sleep_for (std::chrono::milliseconds (750));

            thread_manager::join_done ();
        }

    client.shutdown ();

    thread_manager::join_all ();

    player_manager_ptr = nullptr;
    pool_ptr = nullptr;

    return 0;
}

} // voxlink
