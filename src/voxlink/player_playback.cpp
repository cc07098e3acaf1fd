#include "voxlink/player.h"
#include <algorithm>
#include <iostream>

namespace voxlink
{
namespace player
{

int
clamp_volume (int value)
{
    return std::clamp (value, VOXLINK_MIN_VOLUME, VOXLINK_MAX_VOLUME);
}

track_t
Player::play (const track_t &track, const play_options_t &options)
{
    std::lock_guard lk (this->t_mutex);

    this->require_session ("Player::play");

    const int old_volume = this->volume;
    const std::optional<track_t> old_current = this->current;
    const std::optional<track_t> old_original = this->original;
    const std::optional<track_t> old_previous = this->previous;

    const int vol = options.volume.has_value ()
                        ? clamp_volume (*options.volume)
                        : this->volume;

    this->volume = vol;

    if (options.replace || !this->current.has_value ())
        {
            this->current = track;
            this->original = track;
        }

    this->previous = old_current;

    const bool pause = options.paused.value_or (this->paused);

    remote::player_update_t update;
    update.set_track = true;
    update.encoded_track = track.encoded;
    update.volume = vol;
    update.position = options.start;
    update.set_end_time = true;
    update.end_time = options.end;
    update.paused = pause;

    try
        {
            this->node->update_player (this->guild_id, update,
                                       options.replace);
        }
    catch (const std::exception &e)
        {
            this->current = old_current;
            this->original = old_original;
            this->previous = old_previous;
            this->volume = old_volume;

            std::cerr << "[Player::play ERROR] " << this->guild_id << " '"
                      << track::get_title (track) << "': " << e.what ()
                      << '\n';
            throw;
        }

    this->paused = pause;

    if (get_debug_state ())
        std::cerr << "[Player::play] " << this->guild_id << " '"
                  << track::get_title (*this->current) << "'\n";

    return *this->current;
}

void
Player::pause (bool value)
{
    std::lock_guard lk (this->t_mutex);

    this->require_session ("Player::pause");

    remote::player_update_t update;
    update.paused = value;

    this->node->update_player (this->guild_id, update);

    // only committed once the node accepted it
    this->paused = value;
}

void
Player::seek (int64_t position)
{
    std::lock_guard lk (this->t_mutex);

    this->require_session ("Player::seek");

    if (!this->current.has_value ())
        return;

    remote::player_update_t update;
    update.position = position;

    this->node->update_player (this->guild_id, update);
}

void
Player::set_volume (int value)
{
    std::lock_guard lk (this->t_mutex);

    this->require_session ("Player::set_volume");

    const int vol = clamp_volume (value);

    remote::player_update_t update;
    update.volume = vol;

    this->node->update_player (this->guild_id, update);

    this->volume = vol;
}

std::optional<track_t>
Player::skip (bool force)
{
    std::lock_guard lk (this->t_mutex);

    this->require_session ("Player::skip");

    const std::optional<track_t> old = this->current;

    remote::player_update_t update;
    update.set_track = true;

    this->node->update_player (this->guild_id, update, true);

    if (get_debug_state ())
        std::cerr << "[Player::skip] " << this->guild_id
                  << " (force=" << force << ")\n";

    return old;
}

std::optional<track_t>
Player::stop (bool force)
{
    return this->skip (force);
}

void
Player::set_filter ()
{
    throw not_implemented ("Player::set_filter isn't supported yet");
}

bool
Player::is_playing () const
{
    std::lock_guard lk (this->t_mutex);
    return this->connected && this->current.has_value ();
}

bool
Player::is_paused () const
{
    std::lock_guard lk (this->t_mutex);
    return this->paused;
}

int
Player::get_volume () const
{
    std::lock_guard lk (this->t_mutex);
    return this->volume;
}

std::optional<track_t>
Player::get_current () const
{
    std::lock_guard lk (this->t_mutex);
    return this->current;
}

std::optional<track_t>
Player::get_original () const
{
    std::lock_guard lk (this->t_mutex);
    return this->original;
}

std::optional<track_t>
Player::get_previous () const
{
    std::lock_guard lk (this->t_mutex);
    return this->previous;
}

} // player
} // voxlink
