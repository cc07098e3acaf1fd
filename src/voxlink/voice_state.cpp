#include "voxlink/voice_state.h"

namespace voxlink::voice
{

bool
voice_state_t::is_complete () const
{
    return session_id.has_value () && token.has_value ()
           && endpoint.has_value ();
}

Accumulator::Accumulator () : dirty (false) {}

static bool
assign_field (std::optional<std::string> &field, const std::string &value)
{
    if (field.has_value () && *field == value)
        return false;

    field = value;
    return true;
}

membership_status_e
Accumulator::apply_membership (const dpp::snowflake &channel_id,
                               const std::string &session_id)
{
    if (!channel_id)
        return MEMBERSHIP_LOST;

    if (assign_field (state.session_id, session_id))
        dirty = true;

    return MEMBERSHIP_UPDATED;
}

void
Accumulator::apply_credentials (const std::string &token,
                                const std::string &endpoint)
{
    // evaluate both, no short circuit
    const bool token_changed = assign_field (state.token, token);
    const bool endpoint_changed = assign_field (state.endpoint, endpoint);

    if (token_changed || endpoint_changed)
        dirty = true;
}

bool
Accumulator::is_complete () const
{
    return state.is_complete ();
}

bool
Accumulator::has_pending () const
{
    return dirty && state.is_complete ();
}

std::optional<voice_state_t>
Accumulator::take_pending ()
{
    if (!has_pending ())
        return std::nullopt;

    dirty = false;
    return state;
}

const voice_state_t &
Accumulator::get_state () const
{
    return state;
}

} // voxlink::voice
