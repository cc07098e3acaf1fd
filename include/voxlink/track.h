#ifndef VOXLINK_TRACK_H
#define VOXLINK_TRACK_H

#include <dpp/json.h>
#include <cstdint>
#include <string>
#include <vector>

namespace voxlink
{

/**
 * @brief Track as known by the remote node. `encoded` is the opaque blob the
 * node hands out and accepts back, everything else is display info.
 */
struct track_t
{
    std::string encoded;
    std::string identifier;
    std::string title;
    std::string author;
    std::string uri;
    std::string source_name;
    int64_t length = 0;
    bool is_stream = false;
    bool is_seekable = false;

    bool operator== (const track_t &other) const;
    bool operator!= (const track_t &other) const;
};

enum load_type_t
{
    LOAD_TRACK,
    LOAD_PLAYLIST,
    LOAD_SEARCH,
    LOAD_EMPTY,
    LOAD_ERROR
};

struct load_result_t
{
    load_type_t type = LOAD_EMPTY;
    std::vector<track_t> tracks;

    // for LOAD_ERROR
    std::string error_message;
};

namespace track
{

/**
 * @brief Parse a track object `{ "encoded": ..., "info": { ... } }`
 *
 * @throw nlohmann::json::exception when `j` isn't an object
 */
track_t from_json (const nlohmann::json &j);

/**
 * @brief Parse a /loadtracks response body
 */
load_result_t parse_load_result (const nlohmann::json &j);

std::string get_title (const track_t &t);

} // track
} // voxlink

#endif // VOXLINK_TRACK_H
