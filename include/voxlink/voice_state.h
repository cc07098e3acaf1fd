#ifndef VOXLINK_VOICE_STATE_H
#define VOXLINK_VOICE_STATE_H

#include <dpp/dpp.h>
#include <optional>
#include <string>

namespace voxlink::voice
{

/**
 * @brief Composite voice session descriptor, fields are filled independently
 * by the membership and credentials events.
 */
struct voice_state_t
{
    std::optional<std::string> session_id;
    std::optional<std::string> token;
    std::optional<std::string> endpoint;

    bool is_complete () const;
};

enum membership_status_e
{
    // channel and session id stored
    MEMBERSHIP_UPDATED,
    // event reported no channel
    MEMBERSHIP_LOST,
};

/**
 * @brief Merges voice state and voice server events into one voice_state_t.
 *
 * Not thread safe, the owning player serializes access.
 */
class Accumulator
{
    voice_state_t state;

    // a field changed since the last take_pending ()
    bool dirty;

  public:
    Accumulator ();

    /**
     * @brief Apply a membership (voice state update) event
     *
     * @param channel_id 0 means the channel was left
     * @param session_id
     * @return membership_status_e MEMBERSHIP_LOST if channel_id is 0, nothing
     * is stored in that case
     */
    membership_status_e apply_membership (const dpp::snowflake &channel_id,
                                          const std::string &session_id);

    /**
     * @brief Apply a credentials (voice server update) event, overwriting
     * both fields
     */
    void apply_credentials (const std::string &token,
                            const std::string &endpoint);

    bool is_complete () const;

    /**
     * @brief Whether a complete descriptor is waiting to be pushed
     */
    bool has_pending () const;

    /**
     * @brief Take the complete descriptor for a push, clearing the pending
     * state. Returns nullopt when has_pending () is false.
     */
    std::optional<voice_state_t> take_pending ();

    const voice_state_t &get_state () const;
};

} // voxlink::voice

#endif // VOXLINK_VOICE_STATE_H
