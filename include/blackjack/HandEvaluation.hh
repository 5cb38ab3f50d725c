/** \file
 *
 * \brief Definition of blackjack hand evaluation
 */

#ifndef BLACKJACK_HANDEVALUATION_HH_
#define BLACKJACK_HANDEVALUATION_HH_

#include "blackjack/BlackjackConstants.hh"
#include "blackjack/Card.hh"

#include <boost/operators.hpp>

#include <iosfwd>
#include <iterator>

namespace Blackjack {

/** \brief Evaluation of a blackjack hand
 *
 * HandEvaluation objects are equality comparable. They compare equal when
 * both value and blackjack flag are equal.
 *
 * \sa evaluateHand()
 */
struct HandEvaluation : private boost::equality_comparable<HandEvaluation> {
    int value;       ///< \brief Total value, with aces counted soft if possible
    bool blackjack;  ///< \brief Is the hand a two card 21

    HandEvaluation() = default;

    /** \brief Create new hand evaluation
     *
     * \param value the value of the hand
     * \param blackjack is the hand a blackjack
     */
    constexpr HandEvaluation(int value, bool blackjack) :
        value {value},
        blackjack {blackjack}
    {
    }

    /** \brief Determine if the hand is bust
     *
     * \return true if the value of the hand exceeds 21
     */
    constexpr bool isBust() const
    {
        return value > BLACKJACK_VALUE;
    }
};

/** \brief Determine the hard value of a card
 *
 * Number cards count their face value, face cards count ten and aces count
 * eleven.
 *
 * \param card the card
 *
 * \return the value of \p card, counting an ace as 11
 */
int getCardValue(Card card);

/** \brief Evaluate a hand of cards
 *
 * The value of the hand is first counted with all aces as eleven. Then, once
 * for each ace, ten is subtracted while the value exceeds 21. The hand is a
 * blackjack if it consists of exactly two cards valued 21.
 *
 * The evaluation is not cached anywhere, and the function should be called
 * again whenever the cards of a hand change.
 *
 * \tparam CardIterator an input iterator that, when dereferenced, returns a
 * Card
 *
 * \param first iterator to the first card of the hand
 * \param last iterator one past the last card of the hand
 *
 * \return the evaluation of the hand
 */
template<typename CardIterator>
HandEvaluation evaluateHand(CardIterator first, CardIterator last)
{
    auto value = 0;
    auto n_aces = 0;
    auto n_cards = 0;
    for (; first != last; ++first) {
        const Card card = *first;
        if (getRank(card) == Rank::ACE) {
            ++n_aces;
        }
        value += getCardValue(card);
        ++n_cards;
    }
    for (; n_aces > 0; --n_aces) {
        if (value > BLACKJACK_VALUE) {
            value -= 10;
        }
    }
    return {
        value,
        n_cards == N_BLACKJACK_CARDS && value == BLACKJACK_VALUE};
}

/** \brief Evaluate a hand of cards
 *
 * \param cards the cards of the hand
 *
 * \return the evaluation of the hand
 *
 * \sa evaluateHand(CardIterator, CardIterator)
 */
inline HandEvaluation evaluateHand(const Cards& cards)
{
    return evaluateHand(std::begin(cards), std::end(cards));
}

/** \brief Equality operator for hand evaluations
 *
 * \sa HandEvaluation
 */
bool operator==(const HandEvaluation&, const HandEvaluation&);

/** \brief Output a HandEvaluation to stream
 *
 * \param os the output stream
 * \param evaluation the evaluation to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, const HandEvaluation& evaluation);

}

#endif // BLACKJACK_HANDEVALUATION_HH_
