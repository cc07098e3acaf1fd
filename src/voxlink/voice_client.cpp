#include "voxlink/voice_client.h"
#include "voxlink/voxlink.h"
#include <iostream>

namespace voxlink::voice
{

// gateway opcode 4
static constexpr int OP_VOICE_STATE_UPDATE = 4;

VoiceSessionClient::~VoiceSessionClient () = default;

DppVoiceClient::DppVoiceClient (dpp::cluster *cluster) : cluster (cluster) {}

dpp::discord_client *
DppVoiceClient::get_shard (const dpp::snowflake &guild_id) const
{
    dpp::guild *g = dpp::find_guild (guild_id);
    if (!g)
        return nullptr;

    return this->cluster->get_shard (g->shard_id);
}

void
DppVoiceClient::change_voice_state (const dpp::snowflake &guild_id,
                                    const dpp::snowflake &channel_id,
                                    bool self_deaf, bool self_mute)
{
    dpp::discord_client *from = this->get_shard (guild_id);

    if (!from)
        throw exception ("No shard available for guild " + guild_id.str ());

    nlohmann::json d = { { "guild_id", guild_id.str () },
                         { "channel_id", nullptr },
                         { "self_mute", self_mute },
                         { "self_deaf", self_deaf } };

    if (channel_id)
        d["channel_id"] = channel_id.str ();

    nlohmann::json payload
        = { { "op", OP_VOICE_STATE_UPDATE }, { "d", d } };

    if (get_debug_state ())
        std::cerr << "[DppVoiceClient::change_voice_state] " << guild_id
                  << " channel=" << channel_id << '\n';

    from->queue_message (payload.dump (), false);
}

int
DppVoiceClient::cleanup (const dpp::snowflake &guild_id)
{
    dpp::discord_client *from = this->get_shard (guild_id);

    if (!from)
        return CLEANUP_NOTHING;

    std::lock_guard lk (from->voice_mutex);

    auto v = from->connecting_voice_channels.find (guild_id);
    if (v == from->connecting_voice_channels.end ())
        return CLEANUP_NOTHING;

    from->connecting_voice_channels.erase (v);

    return CLEANUP_DONE;
}

} // voxlink::voice
