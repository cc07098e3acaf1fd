#ifndef VOXLINK_TESTS_MOCKS_H
#define VOXLINK_TESTS_MOCKS_H

#include "voxlink/remote/node.h"
#include "voxlink/track.h"
#include "voxlink/voice_client.h"
#include <gmock/gmock.h>
#include <optional>
#include <string>

namespace voxlink::tests
{

class MockNode : public remote::Node
{
  public:
    explicit MockNode (const std::string &identifier = "mock")
        : remote::Node (identifier)
    {
    }

    MOCK_METHOD (std::optional<track_t>, update_player,
                 (const dpp::snowflake &guild_id,
                  const remote::player_update_t &update, bool replace),
                 (override));

    MOCK_METHOD (void, destroy_player, (const dpp::snowflake &guild_id),
                 (override));
};

class MockVoiceClient : public voice::VoiceSessionClient
{
  public:
    MOCK_METHOD (void, change_voice_state,
                 (const dpp::snowflake &guild_id,
                  const dpp::snowflake &channel_id, bool self_deaf,
                  bool self_mute),
                 (override));

    MOCK_METHOD (int, cleanup, (const dpp::snowflake &guild_id),
                 (override));
};

inline track_t
make_track (const std::string &encoded, const std::string &title = "")
{
    track_t t;
    t.encoded = encoded;
    t.identifier = encoded;
    t.title = title.empty () ? encoded : title;
    t.is_seekable = true;
    return t;
}

MATCHER (IsVoicePush, "update carrying only a voice session")
{
    return arg.voice.has_value () && !arg.set_track
           && !arg.volume.has_value () && !arg.paused.has_value ();
}

MATCHER_P (HasVolume, v, "")
{
    return arg.volume.has_value () && *arg.volume == v;
}

MATCHER_P (HasPaused, v, "")
{
    return arg.paused.has_value () && *arg.paused == v;
}

MATCHER_P (HasPosition, v, "")
{
    return arg.position.has_value () && *arg.position == v;
}

MATCHER_P (PlaysTrack, encoded, "")
{
    return arg.set_track && arg.encoded_track.has_value ()
           && *arg.encoded_track == encoded;
}

MATCHER (ClearsTrack, "")
{
    return arg.set_track && !arg.encoded_track.has_value ();
}

} // voxlink::tests

#endif // VOXLINK_TESTS_MOCKS_H
