#include "voxlink/voice_state.h"
#include <gtest/gtest.h>

using namespace voxlink::voice;

TEST (AccumulatorTest, IncompleteUntilAllThreeFields)
{
    Accumulator acc;

    EXPECT_FALSE (acc.is_complete ());

    EXPECT_EQ (acc.apply_membership (42, "sess"), MEMBERSHIP_UPDATED);
    EXPECT_FALSE (acc.is_complete ());
    EXPECT_FALSE (acc.has_pending ());
    EXPECT_FALSE (acc.take_pending ().has_value ());

    acc.apply_credentials ("tkn", "voice.example:443");
    EXPECT_TRUE (acc.is_complete ());
    EXPECT_TRUE (acc.has_pending ());
}

TEST (AccumulatorTest, CredentialsFirstThenMembership)
{
    Accumulator acc;

    acc.apply_credentials ("tkn", "ep");
    EXPECT_FALSE (acc.has_pending ());

    acc.apply_membership (7, "sess");

    auto vs = acc.take_pending ();
    ASSERT_TRUE (vs.has_value ());
    EXPECT_EQ (*vs->session_id, "sess");
    EXPECT_EQ (*vs->token, "tkn");
    EXPECT_EQ (*vs->endpoint, "ep");
}

TEST (AccumulatorTest, PendingOncePerTransition)
{
    Accumulator acc;

    acc.apply_membership (7, "sess");
    acc.apply_credentials ("tkn", "ep");

    ASSERT_TRUE (acc.take_pending ().has_value ());
    EXPECT_FALSE (acc.take_pending ().has_value ());

    // repeats of the same values don't make a new transition
    acc.apply_membership (7, "sess");
    acc.apply_credentials ("tkn", "ep");
    EXPECT_FALSE (acc.has_pending ());

    // a new token does
    acc.apply_credentials ("tkn2", "ep");
    auto vs = acc.take_pending ();
    ASSERT_TRUE (vs.has_value ());
    EXPECT_EQ (*vs->token, "tkn2");
}

TEST (AccumulatorTest, MembershipLostStoresNothing)
{
    Accumulator acc;

    acc.apply_membership (7, "sess");
    EXPECT_EQ (acc.apply_membership (0, "other"), MEMBERSHIP_LOST);

    EXPECT_EQ (*acc.get_state ().session_id, "sess");
}

TEST (AccumulatorTest, LastWriteWinsPerField)
{
    Accumulator acc;

    acc.apply_membership (7, "a");
    acc.apply_membership (8, "b");
    acc.apply_credentials ("t1", "e1");
    acc.apply_credentials ("t2", "e2");

    const voice_state_t &vs = acc.get_state ();
    EXPECT_EQ (*vs.session_id, "b");
    EXPECT_EQ (*vs.token, "t2");
    EXPECT_EQ (*vs.endpoint, "e2");
}
