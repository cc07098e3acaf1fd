#ifndef VOXLINK_REMOTE_REQUEST_H
#define VOXLINK_REMOTE_REQUEST_H

#include "voxlink/voice_state.h"
#include <dpp/json.h>
#include <cstdint>
#include <optional>
#include <string>

namespace voxlink::remote
{

/**
 * @brief Partial player update, only fields with a value are sent.
 */
struct player_update_t
{
    // set_track with nullopt clears the remote track
    bool set_track = false;
    std::optional<std::string> encoded_track;

    std::optional<int64_t> position;

    // set_end_time with nullopt clears the end time
    bool set_end_time = false;
    std::optional<int64_t> end_time;

    std::optional<int> volume;
    std::optional<bool> paused;
    std::optional<voice::voice_state_t> voice;
};

/**
 * @brief Build the json body of a player update
 *
 * @throw voxlink::exception when `voice` is set but incomplete
 */
nlohmann::json to_json (const player_update_t &update);

} // voxlink::remote

#endif // VOXLINK_REMOTE_REQUEST_H
