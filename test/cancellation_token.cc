#include <gtest/gtest.h>
#include <parexec/cancellation_token.hh>
#include <thread>

using parexec::CancellationToken;
using std::chrono::milliseconds;
using std::chrono::seconds;

// NOLINTNEXTLINE
TEST(cancellation_token, without_deadline) {
    CancellationToken token;
    EXPECT_FALSE(token.cancelled());
    EXPECT_FALSE(token.expired());
    EXPECT_EQ(token.deadline(), std::nullopt);
    EXPECT_EQ(token.remaining(), std::nullopt);

    token.cancel();
    EXPECT_TRUE(token.cancelled());
    EXPECT_FALSE(token.expired());
}

// NOLINTNEXTLINE
TEST(cancellation_token, deadline) {
    CancellationToken token{milliseconds{50}};
    EXPECT_FALSE(token.expired());
    ASSERT_TRUE(token.remaining().has_value());
    EXPECT_LE(*token.remaining(), milliseconds{50});

    std::this_thread::sleep_for(milliseconds{60});
    EXPECT_TRUE(token.expired());
    EXPECT_FALSE(token.cancelled());
    EXPECT_EQ(token.remaining(), std::chrono::nanoseconds::zero());
}

// NOLINTNEXTLINE
TEST(cancellation_token, chaining) {
    CancellationToken parent{seconds{1}};
    CancellationToken longer{seconds{100}, &parent};
    CancellationToken shorter{milliseconds{10}, &parent};
    CancellationToken no_deadline{&parent};

    EXPECT_EQ(longer.deadline(), parent.deadline());
    EXPECT_EQ(no_deadline.deadline(), parent.deadline());
    EXPECT_LT(*shorter.deadline(), *parent.deadline());

    EXPECT_FALSE(longer.cancelled());
    parent.cancel();
    EXPECT_TRUE(longer.cancelled());
    EXPECT_TRUE(shorter.cancelled());
    EXPECT_TRUE(no_deadline.cancelled());

    // Cancelling a child does not affect its parent
    CancellationToken root;
    CancellationToken child{&root};
    child.cancel();
    EXPECT_FALSE(root.cancelled());
}
