#include "blackjack/HandEvaluation.hh"
#include "blackjack/Outcome.hh"

#include <gtest/gtest.h>

#include <string>

using Blackjack::HandEvaluation;
using Blackjack::HandResult;
using Blackjack::HandSettlement;

namespace {

constexpr auto BET = 10;
const auto BLACKJACK = HandEvaluation {21, true};

void test(
    const HandResult result, const Blackjack::Chips payout,
    const HandEvaluation& player, const HandEvaluation& dealer,
    const std::string& message)
{
    EXPECT_EQ(
        HandSettlement(result, payout),
        Blackjack::settleHand(player, dealer, BET)) << message;
}

}

TEST(OutcomeTest, testPlayerBlackjack)
{
    test(HandResult::BLACKJACK, 25, BLACKJACK, {20, false}, "against 20");
    test(HandResult::BLACKJACK, 25, BLACKJACK, {21, false}, "against 21");
    test(HandResult::BLACKJACK, 25, BLACKJACK, {24, false}, "against bust");
    test(HandResult::PUSH, 10, BLACKJACK, BLACKJACK, "against blackjack");
}

TEST(OutcomeTest, testPlayerWins)
{
    test(HandResult::WIN, 20, {20, false}, {19, false}, "higher value");
    test(HandResult::WIN, 20, {12, false}, {22, false}, "dealer bust");
}

TEST(OutcomeTest, testPush)
{
    test(HandResult::PUSH, 10, {18, false}, {18, false}, "equal values");
    test(HandResult::PUSH, 10, {21, false}, {21, false}, "equal 21");
}

TEST(OutcomeTest, testPlayerLoses)
{
    test(HandResult::LOSS, 0, {17, false}, {18, false}, "lower value");
    test(HandResult::LOSS, 0, {21, false}, BLACKJACK, "21 against blackjack");
    test(HandResult::LOSS, 0, {22, false}, {18, false}, "player bust");
    test(HandResult::LOSS, 0, {23, false}, {25, false}, "both bust");
}

TEST(OutcomeTest, testTotalPayout)
{
    const auto outcome = Blackjack::Outcome {
        HandSettlement {HandResult::BLACKJACK, 25},
        HandSettlement {HandResult::PUSH, 10}};
    EXPECT_EQ(35, outcome.getTotalPayout());
    EXPECT_EQ(
        20,
        (Blackjack::Outcome {HandSettlement {HandResult::WIN, 20}}
             .getTotalPayout()));
}
