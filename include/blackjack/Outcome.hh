/** \file
 *
 * \brief Definition of an utility to calculate blackjack payouts
 */

#ifndef BLACKJACK_OUTCOME_HH_
#define BLACKJACK_OUTCOME_HH_

#include "blackjack/BlackjackConstants.hh"

#include <boost/operators.hpp>

#include <iosfwd>
#include <optional>

namespace Blackjack {

struct HandEvaluation;

/** \brief Result of a settled player hand
 */
enum class HandResult {
    BLACKJACK,  ///< Player blackjack against a dealer without one, pays 3:2
    WIN,        ///< Player beats the dealer, pays 1:1
    PUSH,       ///< Tie, the bet is returned
    LOSS,       ///< Dealer wins, the bet is lost
};

/** \brief Settlement of a single player hand
 */
struct HandSettlement : private boost::equality_comparable<HandSettlement> {

    HandSettlement() = default;

    /** \brief Create new hand settlement
     *
     * \param result see \ref result
     * \param payout see \ref payout
     */
    constexpr HandSettlement(HandResult result, Chips payout) :
        result {result},
        payout {payout}
    {
    }

    /** \brief The result of the hand
     */
    HandResult result;

    /** \brief The chips returned to the player
     *
     * The payout includes the returned bet, so that a push pays the bet and
     * a loss pays nothing.
     */
    Chips payout;
};

/** \brief Outcome of a hand of blackjack
 *
 * Contains the settlement of the primary hand, and the settlement of the
 * split hand if the player split.
 */
struct Outcome : private boost::equality_comparable<Outcome> {

    Outcome() = default;

    /** \brief Create new outcome
     *
     * \param primary see \ref primary
     * \param split see \ref split
     */
    Outcome(
        const HandSettlement& primary,
        const std::optional<HandSettlement>& split = std::nullopt) :
        primary {primary},
        split {split}
    {
    }

    HandSettlement primary;                ///< \brief The primary hand
    std::optional<HandSettlement> split;   ///< \brief The split hand, if any

    /** \brief Get the chips credited to the player stack
     *
     * \return the sum of the payouts of the hands
     */
    Chips getTotalPayout() const;
};

/** \brief Settle a player hand against the dealer hand
 *
 * The rules are applied in the following order:
 * - a player blackjack against a dealer without blackjack pays 2.5 × bet
 * - a player hand not bust beating the dealer, or against a bust dealer,
 *   pays 2 × bet
 * - a player hand not bust tying with a dealer without blackjack, or a
 *   blackjack against a blackjack, pays 1 × bet
 * - anything else pays nothing
 *
 * \param player the evaluation of the player hand
 * \param dealer the evaluation of the dealer hand
 * \param bet the bet backing the player hand
 *
 * \return the settlement of the player hand
 */
HandSettlement settleHand(
    const HandEvaluation& player, const HandEvaluation& dealer, int bet);

/** \brief Equality operator for hand settlements
 */
bool operator==(const HandSettlement& lhs, const HandSettlement& rhs);

/** \brief Equality operator for outcomes
 */
bool operator==(const Outcome& lhs, const Outcome& rhs);

/** \brief Output a HandResult to stream
 *
 * \param os the output stream
 * \param result the result to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, HandResult result);

/** \brief Output a HandSettlement to stream
 *
 * \param os the output stream
 * \param settlement the settlement to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, const HandSettlement& settlement);

}

#endif // BLACKJACK_OUTCOME_HH_
