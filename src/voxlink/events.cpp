#include "voxlink/events.h"

namespace voxlink::events
{
int
load_events (dpp::cluster *client)
{
    on_ready (client);
    on_slashcommand (client);
    on_voice_state_update (client);
    on_voice_server_update (client);

    return 0;
}

} // voxlink::events
