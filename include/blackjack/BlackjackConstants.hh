/** \file
 *
 * \brief Definition of fundamental blackjack constants needed by several
 * classes
 */

#ifndef BLACKJACKCONSTANTS_HH_
#define BLACKJACKCONSTANTS_HH_

/** \brief Top level namespace of the Blackjack engine
 *
 * The Blackjack namespace directly contains classes related to cards, shoes
 * and hand evaluation. It also contains subnamespaces for the table state
 * machine and the terminal front-end.
 */
namespace Blackjack {

/** \brief Chip amounts
 *
 * Chips are fractional because a blackjack pays 3:2.
 */
using Chips = double;

/** \brief Number of cards in playing card deck
 */
constexpr auto N_CARDS = 52;

/** \brief Number of ranks in a suit
 */
constexpr auto N_RANKS = 13;

/** \brief Number of suits in a deck
 */
constexpr auto N_SUITS = N_CARDS / N_RANKS; // 4

/** \brief Minimum number of decks in a shoe
 */
constexpr auto MIN_DECKS = 1;

/** \brief Maximum number of decks in a shoe
 */
constexpr auto MAX_DECKS = 6;

/** \brief Lower bound for the randomized reshuffle point
 */
constexpr auto MIN_RESHUFFLE_POINT = 30;

/** \brief Hand value of a blackjack
 */
constexpr auto BLACKJACK_VALUE = 21;

/** \brief Number of cards forming a blackjack
 */
constexpr auto N_BLACKJACK_CARDS = 2;

/** \brief Value the dealer stands on (including soft 17)
 */
constexpr auto DEALER_STAND_VALUE = 17;

/** \brief The smallest bet accepted by the table
 */
constexpr auto MIN_BET = 1;

}

#endif // BLACKJACKCONSTANTS_HH_
