/** \file
 *
 * \brief Definition of Blackjack::Action enumeration
 */

#ifndef BLACKJACK_ACTION_HH_
#define BLACKJACK_ACTION_HH_

#include <array>
#include <iosfwd>
#include <optional>
#include <string_view>

namespace Blackjack {

/** \brief Player action
 */
enum class Action {
    HIT,     ///< Draw one more card
    STAND,   ///< End input for the hand
    DOUBLE,  ///< Double the bet, draw exactly one card and end input
    SPLIT,   ///< Split a pair into two hands
};

/** \brief All actions in the order they are offered to the player
 */
inline constexpr auto ACTIONS = std::array {
    Action::HIT, Action::STAND, Action::DOUBLE, Action::SPLIT,
};

/** \brief Parse action from the key typed by the player
 *
 * The keys are “h” (hit), “s” (stand), “d” (double) and “2” (split).
 * Surrounding whitespace is ignored.
 *
 * \param key the key
 *
 * \return the action corresponding to \p key, or nullopt if \p key is not
 * recognized
 */
std::optional<Action> actionFromKey(std::string_view key);

/** \brief Get the key of an action
 *
 * This function is the inverse of actionFromKey().
 */
char getKey(Action action);

/** \brief Output an Action to stream
 *
 * \param os the output stream
 * \param action the action to output
 *
 * \return parameter \p os
 */
std::ostream& operator<<(std::ostream& os, Action action);

}

#endif // BLACKJACK_ACTION_HH_
