//------------------------------------------------------------------------------
/*
    This file is part of gas-sentinel
    Copyright (c) 2025, the gas-sentinel developers.

    Permission to use, copy, modify, and distribute this software for any
    purpose with or without fee is hereby granted, provided that the above
    copyright notice and this permission notice appear in all copies.

    THE  SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES
    WITH  REGARD  TO  THIS  SOFTWARE  INCLUDING  ALL  IMPLIED  WARRANTIES  OF
    MERCHANTABILITY  AND  FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR
    ANY  SPECIAL,  DIRECT,  INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
    WHATSOEVER  RESULTING  FROM  LOSS  OF USE, DATA OR PROFITS, WHETHER IN AN
    ACTION  OF  CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
    OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
*/
//==============================================================================

#include "scheduler/ItemState.hpp"

#include <gtest/gtest.h>

#include <sstream>

using namespace scheduler;

TEST(ItemStateTests, ToString)
{
    EXPECT_EQ(ItemState{ItemState::Pending}.toString(), "Pending");
    EXPECT_EQ(ItemState{ItemState::Evaluating}.toString(), "Evaluating");
    EXPECT_EQ(ItemState{ItemState::Fired}.toString(), "Fired");
    EXPECT_EQ(ItemState{ItemState::Waiting}.toString(), "Waiting");
    EXPECT_EQ(ItemState{ItemState::Skipped}.toString(), "Skipped");
}

TEST(ItemStateTests, Compare)
{
    ItemState const state{ItemState::Waiting};
    EXPECT_TRUE(state == ItemState::Waiting);
    EXPECT_FALSE(state == ItemState::Pending);
    EXPECT_TRUE(state == ItemState{ItemState::Waiting});
    EXPECT_FALSE(state == ItemState{ItemState::Fired});
}

TEST(ItemStateTests, Terminal)
{
    EXPECT_TRUE(ItemState{ItemState::Fired}.isTerminal());
    EXPECT_TRUE(ItemState{ItemState::Skipped}.isTerminal());
    EXPECT_FALSE(ItemState{ItemState::Pending}.isTerminal());
    EXPECT_FALSE(ItemState{ItemState::Evaluating}.isTerminal());
    EXPECT_FALSE(ItemState{ItemState::Waiting}.isTerminal());
}

TEST(ItemStateTests, Stream)
{
    std::stringstream ss;
    ss << ItemState{ItemState::Skipped};
    EXPECT_EQ(ss.str(), "Skipped");
}
