/** \file
 *
 * \brief Definition of Blackjack::Card and the related rank and suit concepts
 */

#ifndef BLACKJACK_CARD_HH_
#define BLACKJACK_CARD_HH_

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace Blackjack {

/** \brief Playing card
 *
 * A card is identified by an integer between 0 and 51. The rank of the card
 * is the remainder of dividing the integer by 13 and the suit is the quotient.
 * Cards carry no identity beyond their integer, so two decks in a shoe
 * contain equal cards.
 */
using Card = int;

/** \brief Sequence of cards
 */
using Cards = std::vector<Card>;

/** \brief Rank of a card
 *
 * The ranks are in the same order as the remainders of the card integers.
 */
enum class Rank {
    TWO,
    THREE,
    FOUR,
    FIVE,
    SIX,
    SEVEN,
    EIGHT,
    NINE,
    TEN,
    JACK,
    QUEEN,
    KING,
    ACE,
};

/** \brief Suit of a card
 */
enum class Suit {
    CLUBS,
    DIAMONDS,
    HEARTS,
    SPADES,
};

/** \brief Determine the rank of a card
 *
 * \param card the card, between 0 and 51
 *
 * \return the rank of \p card
 */
Rank getRank(Card card);

/** \brief Determine the suit of a card
 *
 * \param card the card, between 0 and 51
 *
 * \return the suit of \p card
 */
Suit getSuit(Card card);

/** \brief Make the card with the given rank and suit
 *
 * This function is the inverse of getRank() and getSuit().
 *
 * \return the card \c c such that <tt>getRank(c) == rank</tt> and
 * <tt>getSuit(c) == suit</tt>
 */
Card cardFor(Rank rank, Suit suit);

/** \brief Get the display symbol of a rank
 *
 * \return one of “2”, “3”, …, “10”, “J”, “Q”, “K”, “A”
 */
std::string_view getSymbol(Rank rank);

/** \brief Get the display symbol of a suit
 *
 * \return one of “c”, “d”, “h”, “s”
 */
std::string_view getSymbol(Suit suit);

/** \brief Get the display label of a card
 *
 * \param card the card, between 0 and 51
 *
 * \return rank symbol followed by suit symbol, e.g. “10h” or “As”
 */
std::string getLabel(Card card);

/** \brief Output a Rank to stream
 *
 * \param os the output stream
 * \param rank the rank to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, Rank rank);

/** \brief Output a Suit to stream
 *
 * \param os the output stream
 * \param suit the suit to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, Suit suit);

}

#endif // BLACKJACK_CARD_HH_
