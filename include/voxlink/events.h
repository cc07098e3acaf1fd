#ifndef VOXLINK_EVENTS_H
#define VOXLINK_EVENTS_H

#include <dpp/dpp.h>

namespace voxlink::events
{
/**
 * @brief Attach every event handler to client
 *
 * @return int 0
 */
int load_events (dpp::cluster *client);

void on_ready (dpp::cluster *client);

void on_slashcommand (dpp::cluster *client);

/**
 * @brief Membership events, forwarded to the player manager inline so they
 * keep arrival order
 */
void on_voice_state_update (dpp::cluster *client);

/**
 * @brief Credentials events, same ordering rule as on_voice_state_update
 */
void on_voice_server_update (dpp::cluster *client);
} // voxlink::events

#endif // VOXLINK_EVENTS_H
