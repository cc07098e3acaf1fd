#include "voxlink/remote/node.h"
#include "voxlink/player.h"
#include <iostream>

namespace voxlink::remote
{

remote_session_error::remote_session_error (const std::string &_message,
                                            int _status)
    : exception (_message, _status)
{
}

Node::Node (const std::string &identifier) : identifier (identifier) {}

Node::~Node () = default;

const std::string &
Node::get_identifier () const
{
    return this->identifier;
}

bool
Node::add_player (const dpp::snowflake &guild_id,
                  std::shared_ptr<player::Player> guild_player)
{
    std::lock_guard lk (this->ps_m);

    auto [it, inserted] = this->players.emplace (guild_id, guild_player);

    if (get_debug_state ())
        std::cerr << "[Node::add_player] " << this->identifier << ' '
                  << guild_id << (inserted ? " registered" : " exists")
                  << '\n';

    return inserted;
}

std::shared_ptr<player::Player>
Node::remove_player (const dpp::snowflake &guild_id)
{
    std::lock_guard lk (this->ps_m);

    auto l = this->players.find (guild_id);
    if (l == this->players.end ())
        return nullptr;

    auto guild_player = l->second;
    this->players.erase (l);

    if (get_debug_state ())
        std::cerr << "[Node::remove_player] " << this->identifier << ' '
                  << guild_id << '\n';

    return guild_player;
}

std::shared_ptr<player::Player>
Node::get_player (const dpp::snowflake &guild_id)
{
    std::lock_guard lk (this->ps_m);

    auto l = this->players.find (guild_id);
    if (l != this->players.end ())
        return l->second;

    return nullptr;
}

size_t
Node::player_count ()
{
    std::lock_guard lk (this->ps_m);
    return this->players.size ();
}

void
Node::push_voice_session (const dpp::snowflake &guild_id,
                          const voice::voice_state_t &state)
{
    player_update_t update;
    update.voice = state;

    if (get_debug_state ())
        std::cerr << "[Node::push_voice_session] " << this->identifier << ' '
                  << guild_id << " endpoint=" << state.endpoint.value_or ("")
                  << " token=" << (state.token ? "<set>" : "<empty>")
                  << '\n';

    this->update_player (guild_id, update);
}

} // voxlink::remote
