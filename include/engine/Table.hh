/** \file
 *
 * \brief Definition of Blackjack::Engine::Table class
 */

#ifndef ENGINE_TABLE_HH_
#define ENGINE_TABLE_HH_

#include "blackjack/Action.hh"
#include "blackjack/BlackjackConstants.hh"
#include "blackjack/Card.hh"
#include "blackjack/HandEvaluation.hh"
#include "blackjack/Outcome.hh"
#include "blackjack/Result.hh"

#include <boost/core/noncopyable.hpp>

#include <iosfwd>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace Blackjack {

class Shoe;

/** \brief The blackjack engine
 *
 * Namespace Engine contains the Table state machine and the concepts it
 * exposes to the front-end.
 */
namespace Engine {

/** \brief Default stack ceiling
 *
 * A player whose stack exceeds the ceiling has broken the bank.
 */
inline constexpr auto DEFAULT_STACK_CEILING = Chips {999999};

/** \brief State of a player hand
 */
enum class HandState {
    ACTING,  ///< The player is still making decisions for the hand
    DONE,    ///< The hand is complete (stood, doubled, bust or blackjack)
};

/** \brief Player hand slot
 */
enum class HandSlot {
    PRIMARY,  ///< The hand dealt to the player
    SPLIT,    ///< The hand created by splitting the primary hand
};

/** \brief Phase of the table
 */
enum class TablePhase {
    AWAITING_BET,         ///< Waiting for the bet of the next hand
    BET_PLACED,           ///< Bet placed, cards not yet dealt
    PLAYER_ACTING,        ///< The player is making decisions
    DEALER_TURN,          ///< Player input ended, dealer cards not revealed
    AWAITING_SETTLEMENT,  ///< Dealer revealed, bets not yet settled
    FINISHED,             ///< The game has ended
};

/** \brief Reason why a game ends
 */
enum class EndReason {
    OUT_OF_CHIPS,           ///< The stack does not cover the minimum bet
    STACK_CEILING_REACHED,  ///< The stack exceeds the ceiling
    RESHUFFLE,              ///< The shoe is spent past its reshuffle point
};

/** \brief Exception indicating an attempt to set the stack out of its range
 *
 * Payouts and deductions never produce a stack out of range, so this
 * exception signals a logic error in the caller.
 */
class StackBoundError : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

/** \brief The state machine playing hands of blackjack
 *
 * The table owns the player stack and the shoe, and orchestrates the
 * lifecycle of each hand: bet, deal, player actions, dealer reveal,
 * settlement and the reshuffle check. Every operation the player can request
 * returns a Result. A rejected request leaves the state of the table
 * unchanged, so the front-end can simply prompt again.
 *
 * The table supports splitting once per hand. The split hand cannot be split
 * again.
 *
 * The dealer stands on every 17, including soft 17.
 */
class Table : private boost::noncopyable {
public:

    /** \brief Create new table
     *
     * \param playerStack the initial stack of the player
     * \param shoe the shoe cards are dealt from
     * \param stackCeiling the stack above which the game ends
     *
     * \throw StackBoundError if \p playerStack is negative or not finite
     * \throw ConfigurationError if \p stackCeiling is not positive
     */
    Table(
        Chips playerStack, Shoe shoe,
        Chips stackCeiling = DEFAULT_STACK_CEILING);

    ~Table();

    /** \brief Set bet from player input
     *
     * Parses \p input as a whole number and sets the bet.
     *
     * Before the cards are dealt, the bet must be positive and covered by the
     * stack. Placing another bet replaces the earlier one.
     *
     * While the player is acting on a hand that still holds its first two
     * cards, setting the bet to double the bet of that hand doubles down:
     * the increment is deducted from the stack, one card is drawn and the
     * input for the hand ends. This is equivalent to applying
     * Action::DOUBLE, and is rejected whenever the double is not permitted.
     *
     * \param input the raw input
     *
     * \return the new bet, or failure if the input is not a valid bet or bets
     * cannot be set in the current phase
     */
    Result<int> setBet(std::string_view input);

    /** \brief Set bet
     *
     * \sa setBet(std::string_view)
     */
    Result<int> setBet(int amount);

    /** \brief Deal the initial cards
     *
     * Resets the card sets, deducts the bet from the stack and deals two
     * cards to the player and one to the dealer, in the order player, player,
     * dealer. A player blackjack ends the player input immediately.
     *
     * \return the evaluation of the player hand, or failure if no bet has been
     * placed
     */
    Result<HandEvaluation> dealInitial();

    /** \brief Determine if action is permitted
     *
     * \param action the action
     *
     * \return true if the player is acting on a hand and \p action is
     * permitted for it, false otherwise
     */
    bool isActionPermitted(Action action) const;

    /** \brief Get the actions currently permitted
     *
     * \return vector containing the permitted actions in the order of
     * Blackjack::ACTIONS
     */
    std::vector<Action> getPermittedActions() const;

    /** \brief Apply action from player input
     *
     * \param key the key typed by the player (“h”, “s”, “d” or “2”)
     *
     * \return the action applied, or failure if the key is not recognized or
     * the action is not permitted
     *
     * \sa applyAction(Action)
     */
    Result<Action> applyAction(std::string_view key);

    /** \brief Apply action to the active hand
     *
     * Hit draws one card. Stand ends the input for the hand. Double doubles
     * the bet, draws one card and ends the input for the hand. Split moves the
     * second card to the split hand backed by an equal bet, and deals one
     * card to each hand.
     *
     * A hand that goes bust or becomes a blackjack ends automatically. When
     * no hand is acting the turn passes to the dealer.
     *
     * \param action the action
     *
     * \return the action applied, or failure if the action is not permitted
     */
    Result<Action> applyAction(Action action);

    /** \brief Reveal the dealer cards
     *
     * The dealer draws one card. Unless the dealer or every player hand has a
     * blackjack, the dealer keeps drawing until the value of the dealer hand
     * is at least 17.
     *
     * \return the evaluation of the dealer hand, or failure if the player
     * input has not ended
     */
    Result<HandEvaluation> revealDealer();

    /** \brief Settle the bets
     *
     * Credits the stack with the payouts of the player hands and checks the
     * shoe. If the game has not ended, the table then awaits the next bet.
     *
     * \return the outcome of the hand, or failure if the dealer has not been
     * revealed
     *
     * \sa settleHand()
     */
    Result<Outcome> settle();

    /** \brief Check if the shoe is spent
     *
     * Sets the reshuffle flag if fewer cards than the reshuffle point remain
     * in the shoe. Once set, the flag is never cleared.
     *
     * \return the reshuffle flag
     */
    bool advanceShoeCheck();

    /** \brief Get the player stack
     */
    Chips getPlayerStack() const;

    /** \brief Set the player stack
     *
     * \param playerStack the new stack
     *
     * \throw StackBoundError if \p playerStack is negative or not finite
     */
    void setPlayerStack(Chips playerStack);

    /** \brief Get the stack ceiling
     */
    Chips getStackCeiling() const;

    /** \brief Get the bet of the primary hand
     *
     * \return the bet, or nullopt if no bet has been placed yet
     */
    std::optional<int> getBet() const;

    /** \brief Get the bet of the split hand
     *
     * \return the split bet, or nullopt if the hand has not been split
     */
    std::optional<int> getSplitBet() const;

    /** \brief Get the dealer cards
     */
    const Cards& getDealerCards() const;

    /** \brief Get the cards of the primary player hand
     */
    const Cards& getPlayerCards() const;

    /** \brief Get the cards of the split hand
     *
     * \return pointer to the split cards, or nullptr if the hand has not been
     * split
     */
    const Cards* getSplitCards() const;

    /** \brief Get the state of a player hand
     *
     * \return the state of the hand in \p slot, or nullopt if there is no such
     * hand
     */
    std::optional<HandState> getHandState(HandSlot slot) const;

    /** \brief Get the hand the player is acting on
     *
     * \return the slot of the active hand, or nullopt if the player is not
     * acting
     */
    std::optional<HandSlot> getActiveHand() const;

    /** \brief Get the current phase
     */
    TablePhase getPhase() const;

    /** \brief Determine if a bet has been placed for the current hand
     */
    bool isBetPlaced() const;

    /** \brief Get the reshuffle flag
     *
     * \sa advanceShoeCheck()
     */
    bool needsReshuffle() const;

    /** \brief Determine if the game has ended
     *
     * The game ends between hands when the stack does not cover the minimum
     * bet, the stack exceeds the ceiling, or the shoe needs reshuffle.
     */
    bool hasEnded() const;

    /** \brief Get the reason the game has ended
     *
     * \return the reason, or nullopt if the game has not ended
     */
    std::optional<EndReason> getEndReason() const;

    /** \brief Get the shoe
     */
    const Shoe& getShoe() const;

    class Impl;

private:

    const std::unique_ptr<Impl> impl;
};

/** \brief Output a HandState to stream
 */
std::ostream& operator<<(std::ostream& os, HandState state);

/** \brief Output a HandSlot to stream
 */
std::ostream& operator<<(std::ostream& os, HandSlot slot);

/** \brief Output a TablePhase to stream
 */
std::ostream& operator<<(std::ostream& os, TablePhase phase);

/** \brief Output an EndReason to stream
 */
std::ostream& operator<<(std::ostream& os, EndReason reason);

}
}

#endif // ENGINE_TABLE_HH_
