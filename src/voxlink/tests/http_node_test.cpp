#include "voxlink/remote/http_node.h"
#include <gtest/gtest.h>

using namespace voxlink;
using voxlink::remote::remote_session_error;

TEST (HttpNodeResponseTest, SuccessStatusPasses)
{
    EXPECT_NO_THROW (remote::check_response_status (200, "{}", "main"));
    EXPECT_NO_THROW (remote::check_response_status (204, "", "main"));
}

TEST (HttpNodeResponseTest, NoResponseIsStatusZero)
{
    try
        {
            remote::check_response_status (0, "", "main");
            FAIL () << "status 0 accepted";
        }
    catch (const remote_session_error &e)
        {
            EXPECT_EQ (e.code (), 0);
            EXPECT_NE (std::string (e.what ()).find ("main"),
                       std::string::npos);
        }
}

TEST (HttpNodeResponseTest, ErrorStatusCarriesNodeMessage)
{
    try
        {
            remote::check_response_status (
                404, R"({"status":404,"message":"Session not found"})",
                "main");
            FAIL () << "status 404 accepted";
        }
    catch (const remote_session_error &e)
        {
            EXPECT_EQ (e.code (), 404);
            EXPECT_STREQ (e.what (), "Remote node responded with status "
                                     "404: Session not found");
        }

    EXPECT_THROW (remote::check_response_status (302, "", "main"),
                  remote_session_error);
}

TEST (HttpNodeResponseTest, ErrorMessageToleratesOddBodies)
{
    const std::string plain = "Remote node responded with status 500";

    EXPECT_EQ (remote::get_error_message ("", 500), plain);
    EXPECT_EQ (remote::get_error_message ("<html>oops</html>", 500), plain);
    EXPECT_EQ (remote::get_error_message ("[1,2]", 500), plain);
    EXPECT_EQ (remote::get_error_message (R"({"message":null})", 500),
               plain);
    EXPECT_EQ (remote::get_error_message (R"({"message":42})", 500), plain);
    EXPECT_EQ (remote::get_error_message (R"({"message":""})", 500), plain);
}

TEST (HttpNodeResponseTest, NullMessageStillMapsToSessionError)
{
    try
        {
            remote::check_response_status (500, R"({"message":null})",
                                           "main");
            FAIL () << "status 500 accepted";
        }
    catch (const remote_session_error &e)
        {
            EXPECT_EQ (e.code (), 500);
        }
}

TEST (HttpNodePathTest, PlayerPaths)
{
    EXPECT_EQ (remote::get_player_path ("abc", 123),
               "/v4/sessions/abc/players/123");
    EXPECT_EQ (remote::get_update_player_path ("abc", 123, true),
               "/v4/sessions/abc/players/123?noReplace=false");
    EXPECT_EQ (remote::get_update_player_path ("abc", 123, false),
               "/v4/sessions/abc/players/123?noReplace=true");
}

TEST (HttpNodeResponseTest, UpdateResponseTrackEcho)
{
    const std::string body = R"({
        "guildId": "123",
        "track": {
            "encoded": "QAAB",
            "info": { "identifier": "id", "title": "Song", "length": 1000,
                      "isSeekable": true }
        },
        "volume": 100,
        "paused": false
    })";

    auto t = remote::parse_update_response (body);

    ASSERT_TRUE (t.has_value ());
    EXPECT_EQ (t->encoded, "QAAB");
    EXPECT_EQ (t->title, "Song");
    EXPECT_TRUE (t->is_seekable);
}

TEST (HttpNodeResponseTest, UpdateResponseWithoutTrack)
{
    EXPECT_FALSE (remote::parse_update_response ("").has_value ());
    EXPECT_FALSE (remote::parse_update_response ("not json").has_value ());
    EXPECT_FALSE (
        remote::parse_update_response (R"({"track":null})").has_value ());
}

TEST (HttpNodeResponseTest, MalformedTrackEchoIsDropped)
{
    EXPECT_NO_THROW ({
        auto t = remote::parse_update_response (
            R"({"track":{"encoded":null,"info":{}}})");
        EXPECT_FALSE (t.has_value ());
    });
}

TEST (HttpNodeResponseTest, LoadTracksBody)
{
    load_result_t res = remote::parse_load_tracks_response (
        R"({"loadType":"search","data":[{"encoded":"QA","info":{}}]})");

    EXPECT_EQ (res.type, LOAD_SEARCH);
    ASSERT_EQ (res.tracks.size (), 1u);
    EXPECT_EQ (res.tracks[0].encoded, "QA");

    EXPECT_EQ (remote::parse_load_tracks_response ("garbage").type,
               LOAD_ERROR);
}

TEST (HttpNodeResponseTest, MalformedLoadTracksIsError)
{
    load_result_t res = remote::parse_load_tracks_response (
        R"({"loadType":"track","data":{"encoded":null}})");

    EXPECT_EQ (res.type, LOAD_ERROR);
    EXPECT_TRUE (res.tracks.empty ());
    EXPECT_FALSE (res.error_message.empty ());
}
