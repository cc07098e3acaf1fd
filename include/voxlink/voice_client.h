#ifndef VOXLINK_VOICE_CLIENT_H
#define VOXLINK_VOICE_CLIENT_H

#include <dpp/dpp.h>

namespace voxlink::voice
{

enum cleanup_status_e
{
    CLEANUP_FAILED = -1,
    CLEANUP_DONE = 0,
    CLEANUP_NOTHING = 1,
};

/**
 * @brief Voice gateway transport as seen by a player: sends join/leave
 * requests, results arrive later as voice state/server events.
 */
class VoiceSessionClient
{
  public:
    virtual ~VoiceSessionClient ();

    /**
     * @brief Request to join channel_id, or leave when channel_id is 0.
     * Doesn't wait for the result.
     *
     * @throw voxlink::exception The request can't be sent
     */
    virtual void change_voice_state (const dpp::snowflake &guild_id,
                                     const dpp::snowflake &channel_id,
                                     bool self_deaf = false,
                                     bool self_mute = false)
        = 0;

    /**
     * @brief Drop whatever local voice connection state the transport keeps
     * for guild_id
     *
     * @return int cleanup_status_e
     */
    virtual int cleanup (const dpp::snowflake &guild_id) = 0;
};

/**
 * @brief Sends voice state updates through the guild's shard
 */
class DppVoiceClient : public VoiceSessionClient
{
    dpp::cluster *cluster;

    dpp::discord_client *get_shard (const dpp::snowflake &guild_id) const;

  public:
    DppVoiceClient (dpp::cluster *cluster);

    void change_voice_state (const dpp::snowflake &guild_id,
                             const dpp::snowflake &channel_id,
                             bool self_deaf = false,
                             bool self_mute = false) override;

    int cleanup (const dpp::snowflake &guild_id) override;
};

} // voxlink::voice

#endif // VOXLINK_VOICE_CLIENT_H
