#ifndef VOXLINK_REMOTE_NODE_H
#define VOXLINK_REMOTE_NODE_H

#include "voxlink/remote/request.h"
#include "voxlink/track.h"
#include "voxlink/voice_state.h"
#include "voxlink/voxlink.h"
#include <dpp/dpp.h>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace voxlink::player
{
class Player;
} // voxlink::player

namespace voxlink::remote
{

/**
 * @brief Failure reported by a remote node, code () is the http status or 0
 * when the request never got a response
 */
class remote_session_error : public exception
{
  public:
    remote_session_error (const std::string &_message, int _status = 0);
};

/**
 * @brief Remote audio node control API, also the registry of players
 * currently holding a session on it.
 */
class Node
{
    std::string identifier;

    // ps: players
    std::mutex ps_m;
    std::map<dpp::snowflake, std::shared_ptr<player::Player> > players;

  public:
    Node (const std::string &identifier);
    virtual ~Node ();

    const std::string &get_identifier () const;

    /**
     * @brief Register player under guild_id
     *
     * @return true
     * @return false Another player is already registered for guild_id
     */
    bool add_player (const dpp::snowflake &guild_id,
                     std::shared_ptr<player::Player> guild_player);

    /**
     * @brief Remove and return registered player, nullptr if none exist
     */
    std::shared_ptr<player::Player>
    remove_player (const dpp::snowflake &guild_id);

    /**
     * @brief Get registered player, nullptr if none exist
     */
    std::shared_ptr<player::Player>
    get_player (const dpp::snowflake &guild_id);

    size_t player_count ();

    /**
     * @brief Push a complete voice session descriptor for guild_id
     *
     * @throw remote_session_error
     */
    void push_voice_session (const dpp::snowflake &guild_id,
                             const voice::voice_state_t &state);

    /**
     * @brief Apply a partial update to the remote player of guild_id
     *
     * @param replace Whether a new track should replace the one currently
     * playing
     * @return std::optional<track_t> Track the remote player reports as
     * current after the update
     * @throw remote_session_error
     */
    virtual std::optional<track_t>
    update_player (const dpp::snowflake &guild_id,
                   const player_update_t &update, bool replace = false)
        = 0;

    /**
     * @brief Destroy the remote player of guild_id
     *
     * @throw remote_session_error
     */
    virtual void destroy_player (const dpp::snowflake &guild_id) = 0;
};

} // voxlink::remote

#endif // VOXLINK_REMOTE_NODE_H
