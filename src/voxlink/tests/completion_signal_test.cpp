#include "voxlink/util/completion_signal.h"
#include <chrono>
#include <gtest/gtest.h>
#include <thread>

using namespace voxlink::util;
using namespace std::chrono_literals;

TEST (CompletionSignalTest, TimesOutWhenNeverRaised)
{
    CompletionSignal s;

    const auto start = std::chrono::steady_clock::now ();
    EXPECT_EQ (s.wait_for (50ms), WAIT_TIMEOUT);
    EXPECT_GE (std::chrono::steady_clock::now () - start, 45ms);
}

TEST (CompletionSignalTest, RaisedBeforeWaitReturnsImmediately)
{
    CompletionSignal s;
    s.set ();

    EXPECT_TRUE (s.is_set ());
    EXPECT_EQ (s.wait_for (0ms), WAIT_RAISED);
}

TEST (CompletionSignalTest, RaisedFromAnotherThread)
{
    CompletionSignal s;

    std::thread t ([&s] () {
        std::this_thread::sleep_for (20ms);
        s.set ();
    });

    EXPECT_EQ (s.wait_for (2000ms), WAIT_RAISED);
    t.join ();
}

TEST (CompletionSignalTest, CancelWakesWaiter)
{
    CompletionSignal s;

    std::thread t ([&s] () {
        std::this_thread::sleep_for (20ms);
        s.cancel ();
    });

    EXPECT_EQ (s.wait_for (2000ms), WAIT_CANCELLED);
    t.join ();

    // still usable afterwards
    EXPECT_FALSE (s.is_set ());
    s.set ();
    EXPECT_EQ (s.wait_for (0ms), WAIT_RAISED);
}

TEST (CompletionSignalTest, ClearResetsAndWakes)
{
    CompletionSignal s;
    s.set ();
    s.clear ();

    EXPECT_FALSE (s.is_set ());
    EXPECT_EQ (s.wait_for (10ms), WAIT_TIMEOUT);

    std::thread t ([&s] () {
        std::this_thread::sleep_for (20ms);
        s.clear ();
    });

    EXPECT_EQ (s.wait_for (2000ms), WAIT_CANCELLED);
    t.join ();
}
