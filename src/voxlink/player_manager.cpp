#include "voxlink/player.h"
#include <iostream>
#include <memory>

namespace voxlink::player
{

Manager::Manager (remote::Pool *pool, voice::VoiceSessionClient *client,
                  const dpp::snowflake &vx_id)
    : pool (pool), client (client), vx_id (vx_id)
{
}

Manager::~Manager () = default;

std::shared_ptr<Player>
Manager::create_player (const dpp::snowflake &guild_id,
                        const dpp::snowflake &channel_id, remote::Node *node)
{
    std::lock_guard lk (this->ps_m);

    auto l = players.find (guild_id);
    if (l != players.end ())
        {
            if (l->second->get_state () != CONNECTION_INVALIDATED)
                return l->second;

            players.erase (l);
        }

    if (!node)
        node = this->pool ? this->pool->get_node () : nullptr;

    if (!node)
        throw exception ("No remote node available to create player for "
                         + guild_id.str ());

    std::shared_ptr<Player> v
        = std::make_shared<Player> (node, this->client, guild_id, channel_id);

    players.insert (std::pair (guild_id, v));

    if (get_debug_state ())
        std::cerr << "[Manager::create_player] " << guild_id << " on "
                  << node->get_identifier () << '\n';

    return v;
}

std::shared_ptr<Player>
Manager::get_player (const dpp::snowflake &guild_id)
{
    std::lock_guard lk (this->ps_m);

    auto l = players.find (guild_id);
    if (l != players.end ())
        return l->second;

    return NULL;
}

bool
Manager::delete_player (const dpp::snowflake &guild_id)
{
    std::lock_guard lk (this->ps_m);

    auto l = players.find (guild_id);
    if (l == players.end ())
        return false;

    players.erase (l);
    return true;
}

size_t
Manager::player_count ()
{
    std::lock_guard lk (this->ps_m);
    return players.size ();
}

void
Manager::drop_if_invalidated (const dpp::snowflake &guild_id,
                              const std::shared_ptr<Player> &guild_player)
{
    if (guild_player->get_state () != CONNECTION_INVALIDATED)
        return;

    std::lock_guard lk (this->ps_m);

    auto l = players.find (guild_id);

    // a new player might have taken the slot already
    if (l != players.end () && l->second == guild_player)
        players.erase (l);
}

void
Manager::handle_voice_state (const dpp::snowflake &guild_id,
                             const dpp::snowflake &user_id,
                             const dpp::snowflake &channel_id,
                             const std::string &session_id)
{
    // other users' voice states aren't ours to track
    if (user_id != this->vx_id)
        return;

    auto guild_player = get_player (guild_id);
    if (!guild_player)
        {
            if (get_debug_state ())
                std::cerr << "[Manager::handle_voice_state] No player for "
                          << guild_id << '\n';
            return;
        }

    try
        {
            guild_player->handle_voice_state (channel_id, session_id);
        }
    catch (const exception &e)
        {
            std::cerr << "[Manager::handle_voice_state ERROR] " << guild_id
                      << ": " << e.what () << '\n';
        }

    this->drop_if_invalidated (guild_id, guild_player);
}

void
Manager::handle_voice_server (const dpp::snowflake &guild_id,
                              const std::string &token,
                              const std::string &endpoint)
{
    auto guild_player = get_player (guild_id);
    if (!guild_player)
        {
            if (get_debug_state ())
                std::cerr << "[Manager::handle_voice_server] No player for "
                          << guild_id << '\n';
            return;
        }

    try
        {
            guild_player->handle_voice_server (token, endpoint);
        }
    catch (const exception &e)
        {
            std::cerr << "[Manager::handle_voice_server ERROR] " << guild_id
                      << ": " << e.what () << '\n';
        }

    this->drop_if_invalidated (guild_id, guild_player);
}

void
Manager::handle_on_voice_state_update (const dpp::voice_state_update_t &event)
{
    this->handle_voice_state (event.state.guild_id, event.state.user_id,
                              event.state.channel_id, event.state.session_id);
}

void
Manager::handle_on_voice_server_update (const dpp::voice_server_update_t &event)
{
    this->handle_voice_server (event.guild_id, event.token, event.endpoint);
}

} // voxlink::player
