#ifndef VOXLINK_PLAYER_H
#define VOXLINK_PLAYER_H

#include "voxlink/config.h"
#include "voxlink/remote/node.h"
#include "voxlink/remote/pool.h"
#include "voxlink/track.h"
#include "voxlink/util/completion_signal.h"
#include "voxlink/voice_client.h"
#include "voxlink/voice_state.h"
#include "voxlink/voxlink.h"
#include <cstdint>
#include <dpp/dpp.h>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace voxlink
{
namespace player
{

enum connection_state_t
{
    CONNECTION_DISCONNECTED,
    // join requested, waiting for the remote node to accept the voice
    // session
    CONNECTION_AWAITING,
    CONNECTION_CONNECTED,
    // terminal, the player must not be reused
    CONNECTION_INVALIDATED,
};

const char *get_connection_state_name (connection_state_t state);

/**
 * @brief Operation needs a bound channel or a live guild session the player
 * doesn't have
 */
class invalid_channel_state : public exception
{
  public:
    invalid_channel_state (const std::string &_message);
};

/**
 * @brief The voice handshake wasn't confirmed in time, or the wait got
 * cancelled
 */
class channel_timeout : public exception
{
  public:
    channel_timeout (const std::string &_message);
};

struct play_options_t
{
    /**
     * @brief Whether to replace the currently playing track
     */
    bool replace = true;

    /**
     * @brief Start position in ms
     */
    int64_t start = 0;

    /**
     * @brief End position in ms, plays until the end when unset
     */
    std::optional<int64_t> end;

    /**
     * @brief Volume to set, keeps current volume when unset
     */
    std::optional<int> volume;

    /**
     * @brief Pause state to set, keeps current state when unset
     */
    std::optional<bool> paused;
};

/**
 * @brief Clamp volume to the range accepted by remote nodes
 */
int clamp_volume (int value);

class Player : public std::enable_shared_from_this<Player>
{
    /**
     * @brief Guild Id this player belongs to.
     *
     */
    dpp::snowflake guild_id;

    /**
     * @brief Voice channel Id this player is bound to.
     *
     */
    dpp::snowflake channel_id;

    remote::Node *node;
    voice::VoiceSessionClient *client;

    /**
     * @brief Thread safety mutex, held through every state change and remote
     * call of this player. connect () releases it while waiting.
     */
    mutable std::mutex t_mutex;

    voice::Accumulator voice_state;
    util::CompletionSignal connection_signal;

    connection_state_t state;

    // registered in node's player registry
    bool registered;

    // set by membership events, cleared on invalidate
    bool connected;

    std::optional<track_t> current;
    std::optional<track_t> original;
    std::optional<track_t> previous;

    bool paused;
    int volume;

    // methods below must be called with t_mutex locked

    void dispatch_voice_update ();

    /**
     * @return int Voice client cleanup status
     */
    int invalidate ();

    void destroy ();

    void require_session (const char *caller) const;

  public:
    /**
     * @brief Construct player, use std::make_shared, connect () registers
     * the player with shared_from_this ()
     *
     * @param node Node hosting the remote session, must outlive the player
     * @param client Voice transport, must outlive the player
     * @param guild_id
     * @param channel_id Voice channel to join, 0 if none bound yet
     */
    Player (remote::Node *node, voice::VoiceSessionClient *client,
            const dpp::snowflake &guild_id, const dpp::snowflake &channel_id);
    ~Player ();

    /**
     * @brief Handle our own voice state update
     *
     * @param channel_id 0 when the voice channel was left
     * @param session_id
     * @throw voxlink::exception Voice client cleanup failed
     */
    void handle_voice_state (const dpp::snowflake &channel_id,
                             const std::string &session_id);

    /**
     * @brief Handle voice server update of this guild
     *
     * @throw voxlink::exception Leave request after a rejected voice session
     * couldn't be sent
     */
    void handle_voice_server (const std::string &token,
                              const std::string &endpoint);

    /**
     * @brief Join the bound channel and wait until the remote node accepted
     * the voice session
     *
     * @param timeout In seconds
     * @param reconnect Accepted for the transport's reconnect flow, doesn't
     * change behavior
     * @param self_deaf
     * @param self_mute
     * @throw invalid_channel_state No channel bound, player invalidated or
     * another player registered for the guild
     * @throw channel_timeout Timed out, cancelled, or the voice channel was
     * lost while the join request was handled
     */
    void connect (double timeout = VOXLINK_DEFAULT_CONNECT_TIMEOUT,
                  bool reconnect = false, bool self_deaf = false,
                  bool self_mute = false);

    /**
     * @brief Wake a pending connect (), which then fails with
     * channel_timeout
     */
    void cancel_connect ();

    /**
     * @brief Invalidate, remove the player from its node, destroy the remote
     * session and leave the voice channel
     */
    void disconnect ();

    /**
     * @brief Play track
     *
     * @return track_t Track now current
     * @throw remote::remote_session_error Local state is rolled back first,
     * same for any other exception escaping the node
     */
    track_t play (const track_t &track, const play_options_t &options = {});

    /**
     * @throw remote::remote_session_error
     */
    void pause (bool value);

    /**
     * @brief Seek current track, does nothing when no track is current
     *
     * @param position In ms
     * @throw remote::remote_session_error
     */
    void seek (int64_t position = 0);

    /**
     * @brief Set volume, clamped to 0-1000
     *
     * @throw remote::remote_session_error
     */
    void set_volume (int value = VOXLINK_DEFAULT_VOLUME);

    /**
     * @brief Stop the current track
     *
     * @param force Accepted and ignored, there is no queue to skip through
     * @return std::optional<track_t> Track that was current
     * @throw remote::remote_session_error
     */
    std::optional<track_t> skip (bool force = true);

    /**
     * @brief Alias of skip ()
     */
    std::optional<track_t> stop (bool force = true);

    /**
     * @throw voxlink::not_implemented
     */
    void set_filter ();

    dpp::snowflake get_guild_id () const;
    dpp::snowflake get_channel_id () const;
    remote::Node *get_node () const;
    connection_state_t get_state () const;

    bool is_connected () const;
    bool is_playing () const;
    bool is_paused () const;
    int get_volume () const;

    std::optional<track_t> get_current () const;
    std::optional<track_t> get_original () const;
    std::optional<track_t> get_previous () const;
};

/**
 * @brief Voice protocol table of the host transport, one player per guild
 */
class Manager
{
    remote::Pool *pool;
    voice::VoiceSessionClient *client;

    // our own user id, other users' voice states are ignored
    dpp::snowflake vx_id;

    // ps: players
    std::mutex ps_m;
    std::map<dpp::snowflake, std::shared_ptr<Player> > players;

    void drop_if_invalidated (const dpp::snowflake &guild_id,
                              const std::shared_ptr<Player> &guild_player);

  public:
    Manager (remote::Pool *pool, voice::VoiceSessionClient *client,
             const dpp::snowflake &vx_id);
    ~Manager ();

    /**
     * @brief Create a player object if not exist and return player.
     * An invalidated player is replaced.
     *
     * @param guild_id
     * @param channel_id
     * @param node Node to use, the least loaded node of the pool if nullptr
     * @return std::shared_ptr<Player>
     * @throw voxlink::exception No node available
     */
    std::shared_ptr<Player> create_player (const dpp::snowflake &guild_id,
                                           const dpp::snowflake &channel_id,
                                           remote::Node *node = nullptr);

    /**
     * @brief Get the player object, return nullptr if not exist
     */
    std::shared_ptr<Player> get_player (const dpp::snowflake &guild_id);

    /**
     * @brief Return false if guild doesn't have player in the first place
     */
    bool delete_player (const dpp::snowflake &guild_id);

    size_t player_count ();

    void handle_voice_state (const dpp::snowflake &guild_id,
                             const dpp::snowflake &user_id,
                             const dpp::snowflake &channel_id,
                             const std::string &session_id);

    void handle_voice_server (const dpp::snowflake &guild_id,
                              const std::string &token,
                              const std::string &endpoint);

    void handle_on_voice_state_update (const dpp::voice_state_update_t &event);

    void
    handle_on_voice_server_update (const dpp::voice_server_update_t &event);
};

using player_manager_ptr_t = Manager *;

} // player
} // voxlink

#endif // VOXLINK_PLAYER_H
