/* SPDX-License-Identifier: LGPL-2.1-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

#include "SignalCancellation.hpp"
#include <signal.h>
#include <gtest/gtest.h>
#include <stdexcept>

namespace UpdateKit {

namespace {

using Handler = void (*)(int);

Handler handlerOf(int signal) {
    struct sigaction current;
    sigaction(signal, nullptr, &current);
    return current.sa_handler;
}

} // anonymous namespace

TEST(SignalCancellationTest, SignalsCancelWhileActive) {
    CancellationToken token;
    {
        SignalCancellation guard{token};
        EXPECT_FALSE(token.isCancelled());
        raise(SIGTERM);
        EXPECT_TRUE(token.isCancelled());
    }
}

TEST(SignalCancellationTest, PreviousHandlersAreRestored) {
    ASSERT_EQ(handlerOf(SIGINT), SIG_DFL);
    ASSERT_EQ(handlerOf(SIGHUP), SIG_DFL);
    ASSERT_EQ(handlerOf(SIGTERM), SIG_DFL);
    {
        CancellationToken token;
        SignalCancellation guard{token};
        EXPECT_NE(handlerOf(SIGINT), SIG_DFL);
        EXPECT_NE(handlerOf(SIGHUP), SIG_DFL);
        EXPECT_NE(handlerOf(SIGTERM), SIG_DFL);
    }
    EXPECT_EQ(handlerOf(SIGINT), SIG_DFL);
    EXPECT_EQ(handlerOf(SIGHUP), SIG_DFL);
    EXPECT_EQ(handlerOf(SIGTERM), SIG_DFL);
}

TEST(SignalCancellationTest, OnlyOneGuardAtATime) {
    CancellationToken first;
    CancellationToken second;
    SignalCancellation guard{first};
    EXPECT_THROW(SignalCancellation{second}, std::logic_error);

    raise(SIGINT);
    EXPECT_TRUE(first.isCancelled());
    EXPECT_FALSE(second.isCancelled());
}

} // namespace UpdateKit
