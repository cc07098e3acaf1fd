#include "voxlink/cmds.h"
#include <future>
#include <gtest/gtest.h>
#include <stdexcept>

using namespace voxlink;

TEST (CommandGuardTest, ReplyFromBody)
{
    EXPECT_EQ (command::run_guarded ("join",
                                     [] (std::string &o) { o = "Joined"; }),
               "Joined");
}

TEST (CommandGuardTest, EmptyReplyIsDone)
{
    EXPECT_EQ (command::run_guarded ("pause", [] (std::string &) {}), "Done");
}

TEST (CommandGuardTest, ExceptionTextIsShown)
{
    const std::string out
        = command::run_guarded ("join", [] (std::string &o) {
              o = "partial";
              throw voxlink::exception ("No remote node available");
          });

    EXPECT_EQ (out, "`[ERROR]` No remote node available");
}

TEST (CommandGuardTest, UnexpectedErrorsDontEscape)
{
    std::string out;

    EXPECT_NO_THROW (out = command::run_guarded ("play", [] (std::string &) {
                         throw std::future_error (
                             std::future_errc::broken_promise);
                     }));
    EXPECT_EQ (out, "`[ERROR]` Something went wrong");

    EXPECT_NO_THROW (out = command::run_guarded ("play", [] (std::string &) {
                         nlohmann::json j = nlohmann::json::parse (
                             R"({"encoded":null})");
                         j.value ("encoded", std::string ());
                     }));
    EXPECT_EQ (out, "`[ERROR]` Something went wrong");

    EXPECT_NO_THROW (out = command::run_guarded ("seek", [] (std::string &) {
                         throw std::runtime_error ("boom");
                     }));
    EXPECT_EQ (out, "`[ERROR]` Something went wrong");
}
