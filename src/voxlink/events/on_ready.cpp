#include "voxlink/events.h"
#include "voxlink/remote/http_node.h"
#include "voxlink/remote/pool.h"
#include "voxlink/thread_manager.h"
#include "voxlink/voxlink.h"
#include <atomic>
#include <iostream>
#include <thread>

namespace voxlink::events
{
// on_ready fires once per shard, sessions only need it once
static std::atomic<bool> sessions_ensured = false;

static void
ensure_node_sessions ()
{
    remote::Pool *pool = get_pool_ptr ();
    if (!pool)
        return;

    for (remote::Node *n : pool->get_nodes ())
        {
            auto *hn = dynamic_cast<remote::HttpNode *> (n);
            if (!hn)
                continue;

            try
                {
                    hn->ensure_session ();

                    fprintf (stderr, "[READY] Node %s: %s\n",
                             hn->get_identifier ().c_str (),
                             hn->get_base_url ().c_str ());
                }
            catch (const remote::remote_session_error &e)
                {
                    fprintf (stderr,
                             "[events::on_ready ERROR] Node %s session: %s\n",
                             hn->get_identifier ().c_str (), e.what ());
                }
        }
}

void
on_ready (dpp::cluster *client)
{
    client->on_ready ([client] (const dpp::ready_t &event) {
        dpp::user me = client->me;

        fprintf (stderr, "[READY] Shard: %u\n", event.shard_id);
        std::cerr << "Logged in as " << me.username << " (" << me.id << ")\n";

        if (sessions_ensured.exchange (true))
            return;

        std::thread t ([] () {
            thread_manager::DoneSetter tmds;

            ensure_node_sessions ();
        });

        thread_manager::dispatch (t);
    });
}
} // voxlink::events
