#include "voxlink/player.h"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <sstream>

namespace voxlink
{
namespace player
{

invalid_channel_state::invalid_channel_state (const std::string &_message)
    : exception (_message)
{
}

channel_timeout::channel_timeout (const std::string &_message)
    : exception (_message)
{
}

const char *
get_connection_state_name (connection_state_t state)
{
    switch (state)
        {
        case CONNECTION_DISCONNECTED:
            return "disconnected";
        case CONNECTION_AWAITING:
            return "awaiting";
        case CONNECTION_CONNECTED:
            return "connected";
        case CONNECTION_INVALIDATED:
            return "invalidated";
        }

    return "unknown";
}

static std::string
get_channel_display (const dpp::snowflake &channel_id)
{
    dpp::channel *c = dpp::find_channel (channel_id);

    if (c && !c->name.empty ())
        return c->name + " (" + channel_id.str () + ")";

    return channel_id.str ();
}

Player::Player (remote::Node *node, voice::VoiceSessionClient *client,
                const dpp::snowflake &guild_id,
                const dpp::snowflake &channel_id)
    : guild_id (guild_id), channel_id (channel_id), node (node),
      client (client), state (CONNECTION_DISCONNECTED), registered (false),
      connected (false), paused (false), volume (VOXLINK_DEFAULT_VOLUME)
{
    if (!node || !client)
        throw exception ("Player needs a node and a voice client");
}

Player::~Player () = default;

void
Player::handle_voice_state (const dpp::snowflake &channel_id,
                            const std::string &session_id)
{
    std::lock_guard lk (this->t_mutex);

    if (this->state == CONNECTION_INVALIDATED)
        {
            if (get_debug_state ())
                std::cerr << "[Player::handle_voice_state] Ignoring event for "
                             "invalidated player: "
                          << this->guild_id << '\n';
            return;
        }

    if (this->voice_state.apply_membership (channel_id, session_id)
        == voice::MEMBERSHIP_LOST)
        {
            if (get_debug_state ())
                std::cerr << "[Player::handle_voice_state] Left voice channel: "
                          << this->guild_id << '\n';

            this->destroy ();
            return;
        }

    this->connected = true;
    this->channel_id = channel_id;

    this->dispatch_voice_update ();
}

void
Player::handle_voice_server (const std::string &token,
                             const std::string &endpoint)
{
    std::lock_guard lk (this->t_mutex);

    if (this->state == CONNECTION_INVALIDATED)
        return;

    this->voice_state.apply_credentials (token, endpoint);

    this->dispatch_voice_update ();
}

void
Player::dispatch_voice_update ()
{
    if (!this->registered)
        {
            // pushed once connect () registers the player
            if (get_debug_state () && this->voice_state.has_pending ())
                std::cerr << "[Player::dispatch_voice_update] Not registered "
                             "yet, holding voice session: "
                          << this->guild_id << '\n';
            return;
        }

    std::optional<voice::voice_state_t> vs = this->voice_state.take_pending ();

    if (!vs.has_value ())
        return;

    try
        {
            this->node->push_voice_session (this->guild_id, *vs);
        }
    catch (const remote::remote_session_error &e)
        {
            std::cerr << "[Player::dispatch_voice_update ERROR] Voice session "
                         "rejected for "
                      << this->guild_id << ", disconnecting: " << e.what ()
                      << '\n';

            this->destroy ();
            this->client->change_voice_state (this->guild_id, 0);
            return;
        }

    if (get_debug_state ())
        std::cerr << "[Player::dispatch_voice_update] Voice session accepted: "
                  << this->guild_id << '\n';

    this->state = CONNECTION_CONNECTED;
    this->connection_signal.set ();
}

int
Player::invalidate ()
{
    this->connected = false;
    this->state = CONNECTION_INVALIDATED;
    this->connection_signal.clear ();

    return this->client->cleanup (this->guild_id);
}

void
Player::destroy ()
{
    const int cleanup_status = this->invalidate ();

    std::shared_ptr<Player> removed;

    if (this->registered)
        {
            removed = this->node->remove_player (this->guild_id);
            this->registered = false;
        }

    if (removed)
        {
            try
                {
                    this->node->destroy_player (this->guild_id);
                }
            catch (const remote::remote_session_error &e)
                {
                    // local side is gone already
                    std::cerr << "[Player::destroy WARN] Failed to destroy "
                                 "remote player "
                              << this->guild_id << ": " << e.what () << '\n';
                }
        }

    if (cleanup_status < 0)
        throw exception ("Voice client cleanup failed for guild "
                             + this->guild_id.str (),
                         cleanup_status);
}

void
Player::require_session (const char *caller) const
{
    if (this->state == CONNECTION_INVALIDATED)
        throw invalid_channel_state (std::string (caller)
                                     + ": player was invalidated, create a "
                                       "new one");

    if (!this->registered || !this->guild_id)
        throw invalid_channel_state (std::string (caller)
                                     + ": player has no guild session, "
                                       "connect first");
}

void
Player::connect (double timeout, bool reconnect, bool self_deaf,
                 bool self_mute)
{
    dpp::snowflake target_channel;

    {
        std::lock_guard lk (this->t_mutex);

        if (this->state == CONNECTION_INVALIDATED)
            throw invalid_channel_state (
                "Player was invalidated and can't connect again, create a "
                "new one");

        if (!this->channel_id || !this->guild_id)
            throw invalid_channel_state (
                "Player tried to connect without a valid channel");

        if (!this->registered)
            {
                if (!this->node->add_player (this->guild_id,
                                             shared_from_this ()))
                    throw invalid_channel_state (
                        "Another player is already registered for guild "
                        + this->guild_id.str ());

                this->registered = true;
            }

        if (!this->connection_signal.is_set ())
            this->state = CONNECTION_AWAITING;

        if (get_debug_state ())
            std::cerr << "[Player::connect] " << this->guild_id << " -> "
                      << this->channel_id << " on "
                      << this->node->get_identifier ()
                      << " (reconnect=" << reconnect << ")\n";

        // events might have completed the voice session before registering
        this->dispatch_voice_update ();

        target_channel = this->channel_id;
    }

    this->client->change_voice_state (this->guild_id, target_channel,
                                      self_deaf, self_mute);

    {
        std::lock_guard lk (this->t_mutex);

        // events handled during the join request can end the session
        if (this->state == CONNECTION_INVALIDATED)
            throw channel_timeout ("Lost voice channel "
                                   + get_channel_display (target_channel)
                                   + " while connecting");
    }

    const auto wait_ms = std::chrono::milliseconds (
        (int64_t)std::llround (std::max (timeout, 0.0) * 1000.0));

    const util::wait_status_e status
        = this->connection_signal.wait_for (wait_ms);

    if (status == util::WAIT_RAISED)
        return;

    {
        std::lock_guard lk (this->t_mutex);

        // a push still running at the deadline might have succeeded
        if (this->state == CONNECTION_CONNECTED)
            return;

        if (this->state == CONNECTION_AWAITING)
            this->state = CONNECTION_DISCONNECTED;
    }

    std::ostringstream msg;
    msg << "Unable to connect to " << get_channel_display (target_channel)
        << " as it exceeded the timeout of " << timeout << " seconds.";

    if (status == util::WAIT_CANCELLED && get_debug_state ())
        std::cerr << "[Player::connect] Wait cancelled: " << this->guild_id
                  << '\n';

    throw channel_timeout (msg.str ());
}

void
Player::cancel_connect ()
{
    this->connection_signal.cancel ();
}

void
Player::disconnect ()
{
    std::lock_guard lk (this->t_mutex);

    if (!this->guild_id)
        throw invalid_channel_state ("Player has no guild to disconnect from");

    this->destroy ();
    this->client->change_voice_state (this->guild_id, 0);
}

dpp::snowflake
Player::get_guild_id () const
{
    return this->guild_id;
}

dpp::snowflake
Player::get_channel_id () const
{
    std::lock_guard lk (this->t_mutex);
    return this->channel_id;
}

remote::Node *
Player::get_node () const
{
    return this->node;
}

connection_state_t
Player::get_state () const
{
    std::lock_guard lk (this->t_mutex);
    return this->state;
}

bool
Player::is_connected () const
{
    std::lock_guard lk (this->t_mutex);
    return this->channel_id && this->connected;
}

} // player
} // voxlink
