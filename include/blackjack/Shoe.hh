/** \file
 *
 * \brief Definition of Blackjack::Shoe class
 */

#ifndef BLACKJACK_SHOE_HH_
#define BLACKJACK_SHOE_HH_

#include "blackjack/Card.hh"
#include "blackjack/Random.hh"

#include <stdexcept>

namespace Blackjack {

/** \brief Exception indicating invalid shoe or table configuration
 *
 * Configuration errors are detected at construction and are not recoverable
 * during a game.
 */
class ConfigurationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/** \brief Shoe of one or more shuffled decks
 *
 * The shoe holds the cards that are dealt from during the game, and a cut
 * card placed at a randomized reshuffle point. The reshuffle point is fixed
 * when the shoe is created. Once fewer cards than the reshuffle point remain,
 * the shoe is spent and play should stop.
 */
class Shoe {
public:

    /** \brief Create new shuffled shoe
     *
     * Each deck is shuffled independently, and the decks are then stacked on
     * top of each other. The reshuffle point is drawn uniformly from the
     * interval [30, 52 × \p nDecks).
     *
     * \param nDecks the number of decks
     * \param rng the random number generator used for shuffling and drawing
     * the reshuffle point
     *
     * \throw ConfigurationError if \p nDecks is not between 1 and 6
     */
    Shoe(int nDecks, Rng& rng);

    /** \brief Create new stacked shoe
     *
     * The shoe is stacked so that cards are dealt in the order they appear
     * in \p cardsInDrawOrder. The number of decks reported by the shoe is the
     * number of full decks needed to hold the cards.
     *
     * \param cardsInDrawOrder the cards, the first card dealt first
     * \param reshufflePoint the reshuffle point
     *
     * \throw ConfigurationError if some card is not between 0 and 51, or if
     * \p reshufflePoint is negative
     */
    Shoe(Cards cardsInDrawOrder, int reshufflePoint);

    /** \brief Deal the top card from the shoe
     *
     * \return the card removed from the shoe
     *
     * \throw std::out_of_range if the shoe is empty
     */
    Card pop();

    /** \brief Determine the number of cards remaining in the shoe
     */
    int getNumberOfCards() const;

    /** \brief Determine the number of decks the shoe was created with
     */
    int getNumberOfDecks() const;

    /** \brief Get the reshuffle point
     *
     * \return the card count below which the shoe needs reshuffle
     */
    int getReshufflePoint() const;

    /** \brief Determine if the shoe needs to be reshuffled
     *
     * \return true if fewer cards than the reshuffle point remain
     */
    bool needsReshuffle() const;

private:

    Cards cards;
    int nDecks;
    int reshufflePoint;
};

}

#endif // BLACKJACK_SHOE_HH_
