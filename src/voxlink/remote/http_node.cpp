#include "voxlink/remote/http_node.h"
#include "voxlink/config.h"
#include <future>
#include <iostream>
#include <map>
#include <memory>

namespace voxlink::remote
{

node_config_t
node_config_from_json (const nlohmann::json &j)
{
    if (!j.is_object ())
        throw exception ("Node config entry isn't an object");

    node_config_t cfg;

    cfg.host = j.value ("HOST", "");
    if (cfg.host.empty ())
        throw exception ("Node config entry has no HOST");

    cfg.port = j.value ("PORT", (uint16_t)2333);
    cfg.secure = j.value ("SECURE", false);
    cfg.password = j.value ("PASSWORD", "");
    cfg.session_id = j.value ("SESSION_ID", "default");
    cfg.identifier = j.value (
        "IDENTIFIER", cfg.host + ":" + std::to_string (cfg.port));

    return cfg;
}

HttpNode::HttpNode (dpp::cluster *cluster, const node_config_t &cfg)
    : Node (cfg.identifier), cluster (cluster), cfg (cfg)
{
    this->base_url = (cfg.secure ? "https://" : "http://") + cfg.host + ":"
                     + std::to_string (cfg.port);

    fprintf (stderr, "[HttpNode] %s at %s with session_id='%s'\n",
             cfg.identifier.c_str (), this->base_url.c_str (),
             cfg.session_id.c_str ());
}

HttpNode::~HttpNode () = default;

static dpp::http_method
get_http_method (const std::string &method)
{
    if (method == "POST")
        return dpp::m_post;
    if (method == "PATCH")
        return dpp::m_patch;
    if (method == "DELETE")
        return dpp::m_delete;
    if (method == "PUT")
        return dpp::m_put;

    return dpp::m_get;
}

std::string
get_error_message (const std::string &body, int status)
{
    std::string msg = "Remote node responded with status "
                      + std::to_string (status);

    if (body.empty ())
        return msg;

    nlohmann::json j = nlohmann::json::parse (body, nullptr, false);

    if (j.is_discarded () || !j.is_object ())
        return msg;

    auto detail = j.find ("message");

    // "message" can be null
    if (detail != j.end () && detail->is_string ()
        && !detail->get<std::string> ().empty ())
        msg += ": " + detail->get<std::string> ();

    return msg;
}

void
check_response_status (int status, const std::string &body,
                       const std::string &identifier)
{
    if (status == 0)
        throw remote_session_error ("No response from remote node "
                                        + identifier,
                                    0);

    if (status < 200 || status >= 300)
        throw remote_session_error (get_error_message (body, status), status);
}

std::string
get_player_path (const std::string &session_id,
                 const dpp::snowflake &guild_id)
{
    return "/v4/sessions/" + session_id + "/players/" + guild_id.str ();
}

std::string
get_update_player_path (const std::string &session_id,
                        const dpp::snowflake &guild_id, bool replace)
{
    return get_player_path (session_id, guild_id)
           + "?noReplace=" + (replace ? "false" : "true");
}

std::optional<track_t>
parse_update_response (const std::string &body)
{
    nlohmann::json j = nlohmann::json::parse (body, nullptr, false);

    if (j.is_discarded () || !j.is_object ())
        return std::nullopt;

    auto t = j.find ("track");
    if (t == j.end () || !t->is_object ())
        return std::nullopt;

    try
        {
            return track::from_json (*t);
        }
    catch (const nlohmann::json::exception &e)
        {
            // the update itself was accepted
            std::cerr << "[remote::parse_update_response WARN] Malformed "
                         "track in response: "
                      << e.what () << '\n';
            return std::nullopt;
        }
}

load_result_t
parse_load_tracks_response (const std::string &body)
{
    load_result_t res;

    nlohmann::json j = nlohmann::json::parse (body, nullptr, false);

    if (j.is_discarded ())
        {
            res.type = LOAD_ERROR;
            res.error_message = "Failed to parse remote node response";
            return res;
        }

    try
        {
            return track::parse_load_result (j);
        }
    catch (const nlohmann::json::exception &e)
        {
            res.type = LOAD_ERROR;
            res.error_message
                = std::string ("Malformed loadtracks response: ") + e.what ();
            return res;
        }
}

std::string
HttpNode::http_request (const std::string &method, const std::string &path,
                        const std::string &body_json) const
{
    const std::string full_url = this->base_url + path;
    const bool debug = get_debug_state ();

    std::multimap<std::string, std::string> headers;
    headers.emplace ("Authorization", this->cfg.password);
    headers.emplace ("User-Id", this->cluster->me.id.str ());
    headers.emplace ("Client-Name", VOXLINK_CLIENT_NAME);

    auto prom
        = std::make_shared<std::promise<dpp::http_request_completion_t> > ();
    auto fut = prom->get_future ();

    if (debug)
        std::cerr << "[HttpNode::http_request] " << method << ' ' << path
                  << " (body="
                  << (body_json.empty ()
                          ? std::string ("empty")
                          : std::to_string (body_json.size ()) + " bytes")
                  << ")\n";

    this->cluster->request (
        full_url, get_http_method (method),
        [prom] (const dpp::http_request_completion_t &cc) {
            prom->set_value (cc);
        },
        body_json, body_json.empty () ? "" : "application/json", headers);

    dpp::http_request_completion_t cc;

    try
        {
            cc = fut.get ();
        }
    catch (const std::future_error &e)
        {
            // request dropped without completion, e.g. on shutdown
            std::cerr << "[HttpNode::http_request ERROR] " << method << ' '
                      << path << " dropped: " << e.what () << '\n';

            throw remote_session_error ("Request to remote node "
                                            + this->get_identifier ()
                                            + " was dropped",
                                        0);
        }

    if (debug)
        std::cerr << "[HttpNode::http_request] " << cc.status << " on "
                  << method << ' ' << path
                  << " (response length=" << cc.body.size () << ")\n";

    if (cc.status == 0)
        std::cerr << "[HttpNode::http_request ERROR] " << method << ' '
                  << path << " failed with no response\n";
    else if (cc.status < 200 || cc.status >= 300)
        std::cerr << "[HttpNode::http_request WARN] " << method << ' '
                  << path << " status " << cc.status << ": " << cc.body
                  << '\n';

    check_response_status ((int)cc.status, cc.body, this->get_identifier ());

    return cc.body;
}

void
HttpNode::ensure_session ()
{
    nlohmann::json payload;
    payload["resuming"] = true;
    payload["timeout"] = 60;

    this->http_request ("PATCH", "/v4/sessions/" + this->cfg.session_id,
                        payload.dump ());

    fprintf (stderr, "[HttpNode::ensure_session] %s: session '%s' ready\n",
             this->get_identifier ().c_str (), this->cfg.session_id.c_str ());
}

load_result_t
HttpNode::load_tracks (const std::string &identifier) const
{
    const std::string body = this->http_request (
        "GET", "/v4/loadtracks?identifier=" + dpp::utility::url_encode (identifier));

    load_result_t res = parse_load_tracks_response (body);

    if (res.type == LOAD_ERROR)
        std::cerr << "[HttpNode::load_tracks WARN] '" << identifier
                  << "': " << res.error_message << '\n';
    else if (get_debug_state ())
        std::cerr << "[HttpNode::load_tracks] Loaded " << res.tracks.size ()
                  << " track(s) for '" << identifier << "'\n";

    return res;
}

std::optional<track_t>
HttpNode::update_player (const dpp::snowflake &guild_id,
                         const player_update_t &update, bool replace)
{
    const std::string path = get_update_player_path (this->cfg.session_id,
                                                     guild_id, replace);

    const std::string body
        = this->http_request ("PATCH", path, to_json (update).dump ());

    return parse_update_response (body);
}

void
HttpNode::destroy_player (const dpp::snowflake &guild_id)
{
    this->http_request ("DELETE",
                        get_player_path (this->cfg.session_id, guild_id));
}

const std::string &
HttpNode::get_base_url () const
{
    return this->base_url;
}

} // voxlink::remote
