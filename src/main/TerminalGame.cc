#include "main/TerminalGame.hh"

#include "engine/Table.hh"
#include "main/TableRenderer.hh"
#include "Logging.hh"

#include <boost/lexical_cast.hpp>

#include <istream>
#include <ostream>
#include <stdexcept>

namespace Blackjack {
namespace Main {

using namespace std::string_view_literals;

namespace {

template<typename T>
const T& getOrThrow(const Result<T>& result)
{
    if (const auto* failure = getFailure(result)) {
        throw std::logic_error {
            "Table rejected a transition: " +
            boost::lexical_cast<std::string>(*failure)};
    }
    return *getValue(result);
}

}

const std::string_view TerminalGame::BET_PROMPT {
    "How much would you like to bet on this hand? "sv};
const std::string_view TerminalGame::ACTION_PROMPT {
    "Hit (h), Stand (s), Double (d) or Split (2)? "sv};

TerminalGame::TerminalGame(
    Engine::Table& table, std::istream& in, std::ostream& out) :
    table {table},
    in {in},
    out {out}
{
}

bool TerminalGame::run()
{
    while (!table.hasEnded()) {
        if (!playHand()) {
            log(LogLevel::INFO, "Input ended before the game");
            return false;
        }
    }
    if (const auto reason = table.getEndReason()) {
        printEndOfGame(out, *reason, table.getPlayerStack());
    }
    return true;
}

bool TerminalGame::playHand()
{
    out << "\nYou have " << formatChips(table.getPlayerStack())
        << " chips.\n";
    if (!placeBet()) {
        return false;
    }
    getOrThrow(table.dealInitial());
    printTable(out, table);
    if (!playActions()) {
        return false;
    }
    getOrThrow(table.revealDealer());
    printTable(out, table);
    printOutcome(out, getOrThrow(table.settle()));
    out << std::flush;
    return true;
}

bool TerminalGame::readLine(const std::string_view prompt, std::string& line)
{
    out << prompt << std::flush;
    return static_cast<bool>(std::getline(in, line));
}

bool TerminalGame::placeBet()
{
    auto line = std::string {};
    while (readLine(BET_PROMPT, line)) {
        const auto result = table.setBet(line);
        if (const auto* failure = getFailure(result)) {
            out << failure->reason << "\n";
        } else {
            return true;
        }
    }
    return false;
}

bool TerminalGame::playActions()
{
    auto line = std::string {};
    while (const auto slot = table.getActiveHand()) {
        if (table.getSplitCards()) {
            out << (
                *slot == Engine::HandSlot::PRIMARY ?
                "Playing the first hand.\n" : "Playing the split hand.\n");
        }
        if (!readLine(ACTION_PROMPT, line)) {
            return false;
        }
        const auto result = table.applyAction(line);
        if (const auto* failure = getFailure(result)) {
            out << failure->reason << "\n";
        } else {
            printTable(out, table);
        }
    }
    return true;
}

}
}
