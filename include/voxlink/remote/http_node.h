#ifndef VOXLINK_REMOTE_HTTP_NODE_H
#define VOXLINK_REMOTE_HTTP_NODE_H

#include "voxlink/remote/node.h"
#include <cstdint>
#include <dpp/dpp.h>
#include <optional>
#include <string>

namespace voxlink::remote
{

struct node_config_t
{
    std::string identifier;
    std::string host = "127.0.0.1";
    uint16_t port = 2333;
    bool secure = false;
    std::string password;

    // remote session id used in /v4/sessions/{session_id}/players/...
    std::string session_id = "default";
};

/**
 * @brief Parse a node entry of the NODES config array
 *
 * @throw voxlink::exception entry isn't an object or has no HOST
 */
node_config_t node_config_from_json (const nlohmann::json &j);

/**
 * @brief Error text for a failed response, with the node's `message` when
 * the body carries one
 */
std::string get_error_message (const std::string &body, int status);

/**
 * @brief Map a response status to remote_session_error, status 0 means no
 * response at all
 *
 * @throw remote_session_error status is 0 or not 2xx, code () is the status
 */
void check_response_status (int status, const std::string &body,
                            const std::string &identifier);

std::string get_player_path (const std::string &session_id,
                             const dpp::snowflake &guild_id);

/**
 * @brief Player PATCH path, `noReplace` is the inverse of replace
 */
std::string get_update_player_path (const std::string &session_id,
                                    const dpp::snowflake &guild_id,
                                    bool replace);

/**
 * @brief Track echoed in a player PATCH response, nullopt when absent or
 * malformed
 */
std::optional<track_t> parse_update_response (const std::string &body);

/**
 * @brief Parse a /loadtracks body, malformed bodies give LOAD_ERROR
 */
load_result_t parse_load_tracks_response (const std::string &body);

/**
 * @brief Node reached through its REST API, every call blocks until the
 * response arrives. Never call from the cluster's request threads.
 */
class HttpNode : public Node
{
    dpp::cluster *cluster;
    node_config_t cfg;
    std::string base_url;

    /**
     * @brief Perform request and wait for the response
     *
     * @return std::string Response body, may be empty for 204
     * @throw remote_session_error transport failure or non 2xx status
     */
    std::string http_request (const std::string &method,
                              const std::string &path,
                              const std::string &body_json = "") const;

  public:
    HttpNode (dpp::cluster *cluster, const node_config_t &cfg);
    ~HttpNode ();

    /**
     * @brief Make sure the configured remote session exists and resumes.
     * Only valid after the cluster started.
     *
     * @throw remote_session_error
     */
    void ensure_session ();

    /**
     * @brief Resolve identifier (url or search query) into tracks
     *
     * @throw remote_session_error
     */
    load_result_t load_tracks (const std::string &identifier) const;

    std::optional<track_t> update_player (const dpp::snowflake &guild_id,
                                          const player_update_t &update,
                                          bool replace = false) override;

    void destroy_player (const dpp::snowflake &guild_id) override;

    const std::string &get_base_url () const;
};

} // voxlink::remote

#endif // VOXLINK_REMOTE_HTTP_NODE_H
