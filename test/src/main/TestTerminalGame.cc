#include "blackjack/Card.hh"
#include "blackjack/Shoe.hh"
#include "engine/Table.hh"
#include "main/TerminalGame.hh"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

using Blackjack::Cards;
using Blackjack::Rank;
using Blackjack::Suit;
using Blackjack::Engine::Table;
using Blackjack::Engine::TablePhase;
using Blackjack::Main::TerminalGame;

namespace {

Blackjack::Card card(const Rank rank, const Suit suit = Suit::CLUBS)
{
    return Blackjack::cardFor(rank, suit);
}

bool contains(const std::string& output, const std::string& expected)
{
    return output.find(expected) != std::string::npos;
}

}

class TerminalGameTest : public testing::Test {
protected:

    TerminalGameTest() :
        table {
            100,
            Blackjack::Shoe {
                {
                    card(Rank::TEN), card(Rank::NINE, Suit::DIAMONDS),
                    card(Rank::SEVEN, Suit::HEARTS),
                    card(Rank::TEN, Suit::SPADES), card(Rank::TWO)},
                2}},
        game {table, in, out}
    {
    }

    std::istringstream in;
    std::ostringstream out;
    Table table;
    TerminalGame game;
};

TEST_F(TerminalGameTest, testPlayUntilReshuffle)
{
    in.str("abc\n10\nx\ns\n");
    EXPECT_TRUE(game.run());
    const auto output = out.str();
    EXPECT_TRUE(contains(output, "You have 100 chips."));
    EXPECT_TRUE(contains(output, std::string {TerminalGame::BET_PROMPT}));
    EXPECT_TRUE(contains(output, "Bet must be a whole number\n"));
    EXPECT_TRUE(contains(output, std::string {TerminalGame::ACTION_PROMPT}));
    EXPECT_TRUE(contains(output, "Invalid action! Please press h, s, d or 2\n"));
    EXPECT_TRUE(contains(output, "Dealer: 7h 10s (17)\n"));
    EXPECT_TRUE(contains(output, "Player hand: win, paid 20\n"));
    EXPECT_TRUE(
        contains(
            output,
            "The shoe needs to be reshuffled. Final stack: 110\n"));
    EXPECT_EQ(TablePhase::FINISHED, table.getPhase());
}

TEST_F(TerminalGameTest, testInputEndsWhileBetting)
{
    in.str("0\n");
    EXPECT_FALSE(game.run());
    EXPECT_TRUE(contains(out.str(), "Bet must be greater than 0\n"));
    EXPECT_EQ(TablePhase::AWAITING_BET, table.getPhase());
    EXPECT_EQ(100, table.getPlayerStack());
}

TEST_F(TerminalGameTest, testInputEndsWhilePlaying)
{
    in.str("10\n");
    EXPECT_FALSE(game.playHand());
    EXPECT_EQ(TablePhase::PLAYER_ACTING, table.getPhase());
    EXPECT_EQ(90, table.getPlayerStack());
}

TEST(TerminalGameSplitTest, testPlaySplitHand)
{
    auto table = Table {
        100,
        Blackjack::Shoe {
            {
                card(Rank::EIGHT), card(Rank::EIGHT, Suit::DIAMONDS),
                card(Rank::SIX, Suit::HEARTS), card(Rank::TEN),
                card(Rank::NINE, Suit::SPADES), card(Rank::KING, Suit::HEARTS),
                card(Rank::SIX)},
            0}};
    auto in = std::istringstream {"10\n2\n2\ns\ns\n"};
    auto out = std::ostringstream {};
    auto game = TerminalGame {table, in, out};
    EXPECT_TRUE(game.playHand());
    const auto output = out.str();
    EXPECT_TRUE(contains(output, "Playing the first hand.\n"));
    EXPECT_TRUE(contains(output, "The hand has already been split\n"));
    EXPECT_TRUE(contains(output, "Playing the split hand.\n"));
    EXPECT_TRUE(contains(output, "Split: 8d 9s (17), bet 10\n"));
    EXPECT_TRUE(contains(output, "Player hand: win, paid 20\n"));
    EXPECT_TRUE(contains(output, "Split hand: win, paid 20\n"));
    EXPECT_EQ(120, table.getPlayerStack());
}
