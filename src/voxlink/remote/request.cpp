#include "voxlink/remote/request.h"
#include "voxlink/voxlink.h"

namespace voxlink::remote
{

nlohmann::json
to_json (const player_update_t &update)
{
    nlohmann::json payload = nlohmann::json::object ();

    if (update.set_track)
        {
            if (update.encoded_track.has_value ())
                payload["encodedTrack"] = *update.encoded_track;
            else
                payload["encodedTrack"] = nullptr;
        }

    if (update.position.has_value ())
        payload["position"] = *update.position;

    if (update.set_end_time)
        {
            if (update.end_time.has_value ())
                payload["endTime"] = *update.end_time;
            else
                payload["endTime"] = nullptr;
        }

    if (update.volume.has_value ())
        payload["volume"] = *update.volume;

    if (update.paused.has_value ())
        payload["paused"] = *update.paused;

    if (update.voice.has_value ())
        {
            const auto &vs = *update.voice;
            if (!vs.is_complete ())
                throw exception ("Incomplete voice state in player update");

            payload["voice"] = { { "token", *vs.token },
                                 { "endpoint", *vs.endpoint },
                                 { "sessionId", *vs.session_id } };
        }

    return payload;
}

} // voxlink::remote
