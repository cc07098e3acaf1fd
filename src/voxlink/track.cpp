#include "voxlink/track.h"

namespace voxlink
{

bool
track_t::operator== (const track_t &other) const
{
    return encoded == other.encoded;
}

bool
track_t::operator!= (const track_t &other) const
{
    return !(*this == other);
}

namespace track
{

track_t
from_json (const nlohmann::json &j)
{
    track_t t;

    t.encoded = j.value ("encoded", "");

    auto info = j.find ("info");
    if (info == j.end () || !info->is_object ())
        return t;

    t.identifier = info->value ("identifier", "");
    t.title = info->value ("title", "");
    t.author = info->value ("author", "");
    t.uri = info->value ("uri", "");
    t.source_name = info->value ("sourceName", "");
    t.length = info->value ("length", (int64_t)0);
    t.is_stream = info->value ("isStream", false);
    t.is_seekable = info->value ("isSeekable", false);

    return t;
}

static void
push_tracks (load_result_t &res, const nlohmann::json &arr)
{
    if (!arr.is_array ())
        return;

    for (const auto &el : arr)
        {
            if (!el.is_object ())
                continue;

            res.tracks.push_back (from_json (el));
        }
}

load_result_t
parse_load_result (const nlohmann::json &j)
{
    load_result_t res;

    if (!j.is_object ())
        {
            res.type = LOAD_ERROR;
            res.error_message = "Invalid loadtracks response";
            return res;
        }

    const std::string load_type = j.value ("loadType", "");
    auto data = j.find ("data");
    const bool has_data = data != j.end ();

    if (load_type == "track")
        {
            res.type = LOAD_TRACK;
            if (has_data && data->is_object ())
                res.tracks.push_back (from_json (*data));
        }
    else if (load_type == "playlist")
        {
            res.type = LOAD_PLAYLIST;
            if (has_data && data->is_object ())
                push_tracks (res, data->value ("tracks", nlohmann::json ()));
        }
    else if (load_type == "search")
        {
            res.type = LOAD_SEARCH;
            if (has_data)
                push_tracks (res, *data);
        }
    else if (load_type == "empty")
        {
            res.type = LOAD_EMPTY;
        }
    else if (load_type == "error")
        {
            res.type = LOAD_ERROR;
            res.error_message = (has_data && data->is_object ())
                                    ? data->value ("message", "Unknown error")
                                    : "Unknown error (no data field)";
        }
    else
        {
            res.type = LOAD_ERROR;
            res.error_message = "Unknown loadType: " + load_type;
        }

    return res;
}

std::string
get_title (const track_t &t)
{
    if (t.title.empty ())
        return t.identifier;

    if (t.author.empty ())
        return t.title;

    return t.title + " - " + t.author;
}

} // track
} // voxlink
