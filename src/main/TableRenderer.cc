#include "main/TableRenderer.hh"

#include "blackjack/HandEvaluation.hh"
#include "blackjack/Outcome.hh"
#include "engine/Table.hh"

#include <boost/format.hpp>

#include <cmath>
#include <optional>
#include <ostream>

namespace Blackjack {
namespace Main {

namespace {

void printHandLine(
    std::ostream& os, const char* title, const Cards& cards,
    const std::optional<int>& bet)
{
    os << title << ": ";
    printCards(os, cards);
    if (bet) {
        os << ", bet " << *bet;
    }
    os << "\n";
}

}

std::string formatChips(const Chips chips)
{
    if (std::floor(chips) == chips) {
        return boost::str(boost::format("%.0f") % chips);
    }
    return boost::str(boost::format("%.1f") % chips);
}

void printCards(std::ostream& os, const Cards& cards)
{
    if (cards.empty()) {
        os << "-";
        return;
    }
    for (const auto card : cards) {
        os << getLabel(card) << " ";
    }
    os << "(" << evaluateHand(cards) << ")";
}

void printTable(std::ostream& os, const Engine::Table& table)
{
    os << "\n";
    printHandLine(os, "Dealer", table.getDealerCards(), std::nullopt);
    printHandLine(os, "Player", table.getPlayerCards(), table.getBet());
    if (const auto* split_cards = table.getSplitCards()) {
        printHandLine(os, "Split", *split_cards, table.getSplitBet());
    }
    os << "Stack: " << formatChips(table.getPlayerStack()) << "\n";
}

void printOutcome(std::ostream& os, const Outcome& outcome)
{
    os << "Player hand: " << outcome.primary.result << ", paid "
       << formatChips(outcome.primary.payout) << "\n";
    if (const auto& split = outcome.split) {
        os << "Split hand: " << split->result << ", paid "
           << formatChips(split->payout) << "\n";
    }
}

void printEndOfGame(
    std::ostream& os, const Engine::EndReason reason, const Chips stack)
{
    switch (reason) {
    case Engine::EndReason::OUT_OF_CHIPS:
        os << "You are out of chips.";
        break;
    case Engine::EndReason::STACK_CEILING_REACHED:
        os << "You broke the bank!";
        break;
    case Engine::EndReason::RESHUFFLE:
        os << "The shoe needs to be reshuffled.";
        break;
    }
    os << " Final stack: " << formatChips(stack) << "\n";
}

}
}
