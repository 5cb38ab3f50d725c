#include "blackjack/Card.hh"
#include "blackjack/HandEvaluation.hh"

#include <boost/lexical_cast.hpp>
#include <gtest/gtest.h>

#include <string>

using Blackjack::Cards;
using Blackjack::HandEvaluation;
using Blackjack::Rank;
using Blackjack::Suit;

namespace {

Blackjack::Card card(const Rank rank, const Suit suit = Suit::CLUBS)
{
    return Blackjack::cardFor(rank, suit);
}

}

TEST(HandEvaluationTest, testCardValues)
{
    EXPECT_EQ(2, Blackjack::getCardValue(card(Rank::TWO)));
    EXPECT_EQ(9, Blackjack::getCardValue(card(Rank::NINE, Suit::HEARTS)));
    EXPECT_EQ(10, Blackjack::getCardValue(card(Rank::TEN)));
    EXPECT_EQ(10, Blackjack::getCardValue(card(Rank::JACK, Suit::SPADES)));
    EXPECT_EQ(10, Blackjack::getCardValue(card(Rank::KING)));
    EXPECT_EQ(11, Blackjack::getCardValue(card(Rank::ACE, Suit::DIAMONDS)));
}

TEST(HandEvaluationTest, testEmptyHand)
{
    EXPECT_EQ(HandEvaluation(0, false), Blackjack::evaluateHand(Cards {}));
}

TEST(HandEvaluationTest, testBlackjack)
{
    EXPECT_EQ(
        HandEvaluation(21, true),
        Blackjack::evaluateHand(
            Cards {card(Rank::ACE), card(Rank::KING, Suit::HEARTS)}));
    EXPECT_EQ(
        HandEvaluation(21, true),
        Blackjack::evaluateHand(
            Cards {card(Rank::TEN, Suit::SPADES), card(Rank::ACE)}));
}

TEST(HandEvaluationTest, testThreeCardTwentyOneIsNotBlackjack)
{
    EXPECT_EQ(
        HandEvaluation(21, false),
        Blackjack::evaluateHand(
            Cards {
                card(Rank::SEVEN), card(Rank::SEVEN, Suit::DIAMONDS),
                card(Rank::SEVEN, Suit::HEARTS)}));
}

TEST(HandEvaluationTest, testSoftAces)
{
    EXPECT_EQ(
        HandEvaluation(12, false),
        Blackjack::evaluateHand(
            Cards {card(Rank::ACE), card(Rank::ACE, Suit::SPADES)}));
    EXPECT_EQ(
        HandEvaluation(17, false),
        Blackjack::evaluateHand(
            Cards {card(Rank::ACE), card(Rank::SIX)}));
    EXPECT_EQ(
        HandEvaluation(16, false),
        Blackjack::evaluateHand(
            Cards {card(Rank::ACE), card(Rank::FIVE), card(Rank::KING)}));
    EXPECT_EQ(
        HandEvaluation(21, false),
        Blackjack::evaluateHand(
            Cards {
                card(Rank::ACE), card(Rank::ACE, Suit::HEARTS),
                card(Rank::NINE)}));
}

TEST(HandEvaluationTest, testBust)
{
    const auto evaluation = Blackjack::evaluateHand(
        Cards {card(Rank::KING), card(Rank::QUEEN), card(Rank::FIVE)});
    EXPECT_EQ(HandEvaluation(25, false), evaluation);
    EXPECT_TRUE(evaluation.isBust());
    EXPECT_FALSE(HandEvaluation(21, false).isBust());
}

TEST(HandEvaluationTest, testOutput)
{
    EXPECT_EQ("17", boost::lexical_cast<std::string>(HandEvaluation(17, false)));
    EXPECT_EQ(
        "blackjack", boost::lexical_cast<std::string>(HandEvaluation(21, true)));
}
