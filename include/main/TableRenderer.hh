/** \file
 *
 * \brief Definition of plain text rendering of the table
 */

#ifndef MAIN_TABLERENDERER_HH_
#define MAIN_TABLERENDERER_HH_

#include "blackjack/BlackjackConstants.hh"
#include "blackjack/Card.hh"

#include <iosfwd>
#include <string>

namespace Blackjack {

struct Outcome;

namespace Engine {
class Table;
enum class EndReason;
}

namespace Main {

/** \brief Format an amount of chips
 *
 * Whole amounts are formatted without decimals, and other amounts with one
 * decimal (the only fractions a stack can hold are halves).
 *
 * \param chips the amount
 *
 * \return the formatted amount
 */
std::string formatChips(Chips chips);

/** \brief Output a set of cards
 *
 * Cards are output as their labels separated by spaces, followed by the
 * evaluation of the hand in parentheses. An empty set is output as a dash.
 *
 * \param os the output stream
 * \param cards the cards
 */
void printCards(std::ostream& os, const Cards& cards);

/** \brief Output the state of the table
 *
 * Outputs the dealer cards, the player cards, the split cards if the hand has
 * been split, the bets and the stack of the player.
 *
 * \param os the output stream
 * \param table the table
 */
void printTable(std::ostream& os, const Engine::Table& table);

/** \brief Output the outcome of a hand
 *
 * \param os the output stream
 * \param outcome the outcome
 */
void printOutcome(std::ostream& os, const Outcome& outcome);

/** \brief Output the message shown when the game ends
 *
 * \param os the output stream
 * \param reason the reason the game ended
 * \param stack the final stack of the player
 */
void printEndOfGame(std::ostream& os, Engine::EndReason reason, Chips stack);

}
}

#endif // MAIN_TABLERENDERER_HH_
