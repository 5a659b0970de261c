#include "app/outcome_log.h"

#include <gtest/gtest.h>

TEST(OutcomeLog, JoinsFacesWithPlus)
{
    App::OutcomeLog log;
    EXPECT_TRUE(log.empty());
    EXPECT_EQ(log.text(), "");

    log.append(0, 6);
    EXPECT_EQ(log.text(), "6");

    log.append(2, 3);
    log.append(1, 1);
    EXPECT_EQ(log.text(), "6+3+1");
    EXPECT_EQ(log.faces(), (std::vector<int>{6, 3, 1}));
}

TEST(OutcomeLog, ResetStartsOver)
{
    App::OutcomeLog log;
    log.append(0, 2);
    log.append(1, 5);
    log.reset();

    EXPECT_TRUE(log.empty());
    log.append(0, 4);
    EXPECT_EQ(log.text(), "4");
}

TEST(OutcomeLog, WithdrawnDieLeavesTheLog)
{
    App::OutcomeLog log;
    log.append(0, 3);
    log.append(1, 6);
    log.append(2, 2);

    log.withdraw(1);
    EXPECT_EQ(log.text(), "3+2");

    // Unknown dice are ignored.
    log.withdraw(7);
    EXPECT_EQ(log.text(), "3+2");

    log.append(1, 4);
    EXPECT_EQ(log.text(), "3+2+4");
    EXPECT_EQ(log.faces(), (std::vector<int>{3, 2, 4}));
}
