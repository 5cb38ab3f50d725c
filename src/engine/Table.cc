#include "engine/Table.hh"

#include "blackjack/Shoe.hh"
#include "Logging.hh"

#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/mpl/list.hpp>
#include <boost/statechart/custom_reaction.hpp>
#include <boost/statechart/event.hpp>
#include <boost/statechart/simple_state.hpp>
#include <boost/statechart/state_machine.hpp>

#include <algorithm>
#include <cassert>
#include <cmath>
#include <ostream>
#include <string>
#include <utility>

namespace sc = boost::statechart;

namespace Blackjack {
namespace Engine {

struct PlayerHand {
    Cards cards;
    int bet {};
    HandState state {HandState::DONE};
};

namespace {

bool isFirstDecision(const PlayerHand& hand)
{
    return static_cast<int>(hand.cards.size()) == N_BLACKJACK_CARDS;
}

void endHandIfComplete(PlayerHand& hand)
{
    const auto evaluation = evaluateHand(hand.cards);
    if (evaluation.isBust() || evaluation.blackjack) {
        hand.state = HandState::DONE;
    }
}

Failure wrongPhase(const char* reason)
{
    return failure(FailureKind::WRONG_PHASE, reason);
}

Failure invalidBet(std::string reason)
{
    return failure(FailureKind::INVALID_BET, std::move(reason));
}

template<typename T>
Result<T> logIfRejected(Result<T> result, std::string_view request)
{
    if (const auto* f = getFailure(result)) {
        log(LogLevel::INFO, "Rejected %s: %s", request, *f);
    }
    return result;
}

}

////////////////////////////////////////////////////////////////////////////////
// Events
////////////////////////////////////////////////////////////////////////////////

class PlaceBetEvent : public sc::event<PlaceBetEvent> {
public:
    PlaceBetEvent(const int amount, Result<int>& ret) :
        amount {amount},
        ret {ret}
    {
    }

    int amount;
    Result<int>& ret;
};
class DealEvent : public sc::event<DealEvent> {
public:
    DealEvent(Result<HandEvaluation>& ret) :
        ret {ret}
    {
    }

    Result<HandEvaluation>& ret;
};
class ActionEvent : public sc::event<ActionEvent> {
public:
    ActionEvent(const Action action, Result<Action>& ret) :
        action {action},
        ret {ret}
    {
    }

    Action action;
    Result<Action>& ret;
};
class RevealDealerEvent : public sc::event<RevealDealerEvent> {
public:
    RevealDealerEvent(Result<HandEvaluation>& ret) :
        ret {ret}
    {
    }

    Result<HandEvaluation>& ret;
};
class SettleEvent : public sc::event<SettleEvent> {
public:
    SettleEvent(Result<Outcome>& ret) :
        ret {ret}
    {
    }

    Result<Outcome>& ret;
};

////////////////////////////////////////////////////////////////////////////////
// Table::Impl
////////////////////////////////////////////////////////////////////////////////

class AwaitingBet;

class Table::Impl : public sc::state_machine<Table::Impl, AwaitingBet> {
public:
    Impl(Chips playerStack, Shoe shoe, Chips stackCeiling);

    Result<int> placeBet(int amount);
    Result<int> increaseBet(int amount);
    void dealInitial();
    std::optional<std::string> checkAction(Action action) const;
    void applyAction(Action action);
    void revealDealer();
    Outcome settle();
    bool advanceShoeCheck();

    Chips getPlayerStack() const { return playerStack; }
    void setPlayerStack(Chips stack);
    Chips getStackCeiling() const { return stackCeiling; }
    const Shoe& getShoe() const { return shoe; }
    const PlayerHand& getPrimaryHand() const { return primaryHand; }
    const std::optional<PlayerHand>& getSplitHand() const { return splitHand; }
    const Cards& getDealerCards() const { return dealerCards; }
    bool needsReshuffle() const { return reshuffle; }

    std::optional<HandSlot> getActiveSlot() const;
    std::optional<EndReason> getEndCondition() const;

private:

    PlayerHand* getActiveHand();
    const PlayerHand* getActiveHand() const;
    void draw(Cards& cards);
    void deductFromStack(Chips amount);
    void commitBetIncrease(PlayerHand& hand, int amount);
    void doubleDown(PlayerHand& hand);
    bool allPlayerHandsBlackjack() const;

    Chips playerStack;
    const Chips stackCeiling;
    Shoe shoe;
    bool reshuffle {false};
    Cards dealerCards;
    PlayerHand primaryHand;
    std::optional<PlayerHand> splitHand;
};

Table::Impl::Impl(
    const Chips playerStack, Shoe shoe, const Chips stackCeiling) :
    playerStack {},
    stackCeiling {stackCeiling},
    shoe(std::move(shoe))
{
    setPlayerStack(playerStack);
    if (!(stackCeiling > 0)) {
        throw ConfigurationError {"Stack ceiling must be positive"};
    }
}

Result<int> Table::Impl::placeBet(const int amount)
{
    if (amount < MIN_BET) {
        return invalidBet("Bet must be greater than 0");
    }
    if (amount > playerStack) {
        return invalidBet("Bet must not be larger than remaining chips");
    }
    primaryHand.bet = amount;
    log(LogLevel::DEBUG, "Bet placed: %d", amount);
    return amount;
}

Result<int> Table::Impl::increaseBet(const int amount)
{
    auto* hand = getActiveHand();
    if (!hand) {
        return wrongPhase("No hand is being played");
    }
    if (amount != 2 * hand->bet) {
        return invalidBet("The new bet must double the current bet");
    }
    if (auto reason = checkAction(Action::DOUBLE)) {
        return invalidBet(std::move(*reason));
    }
    doubleDown(*hand);
    return amount;
}

void Table::Impl::dealInitial()
{
    dealerCards.clear();
    primaryHand.cards.clear();
    primaryHand.state = HandState::ACTING;
    splitHand.reset();
    deductFromStack(primaryHand.bet);
    draw(primaryHand.cards);
    draw(primaryHand.cards);
    draw(dealerCards);
    endHandIfComplete(primaryHand);
    log(LogLevel::DEBUG, "Dealt %s %s against %s",
        getLabel(primaryHand.cards[0]), getLabel(primaryHand.cards[1]),
        getLabel(dealerCards[0]));
}

std::optional<std::string> Table::Impl::checkAction(const Action action) const
{
    const auto* hand = getActiveHand();
    if (!hand) {
        return "No hand is being played";
    }
    if (evaluateHand(hand->cards).blackjack) {
        return "The hand is a blackjack";
    }
    const auto first_decision = isFirstDecision(*hand);
    switch (action) {
    case Action::HIT:
    case Action::STAND:
        break;
    case Action::DOUBLE:
        if (!first_decision) {
            return "Double is only allowed as the first decision";
        }
        if (playerStack < hand->bet) {
            return "Not enough chips to double";
        }
        break;
    case Action::SPLIT:
        if (splitHand) {
            return "The hand has already been split";
        }
        if (!first_decision) {
            return "Split is only allowed as the first decision";
        }
        if (getRank(hand->cards[0]) != getRank(hand->cards[1])) {
            return "Split requires two cards of equal rank";
        }
        if (playerStack < hand->bet) {
            return "Not enough chips to split";
        }
        break;
    }
    return std::nullopt;
}

void Table::Impl::applyAction(const Action action)
{
    auto* hand = getActiveHand();
    assert(hand);
    switch (action) {
    case Action::HIT:
        draw(hand->cards);
        endHandIfComplete(*hand);
        break;
    case Action::STAND:
        hand->state = HandState::DONE;
        break;
    case Action::DOUBLE:
        doubleDown(*hand);
        break;
    case Action::SPLIT:
        splitHand.emplace(
            PlayerHand {
                Cards {primaryHand.cards.back()}, primaryHand.bet,
                HandState::ACTING});
        primaryHand.cards.pop_back();
        deductFromStack(splitHand->bet);
        draw(primaryHand.cards);
        draw(splitHand->cards);
        endHandIfComplete(primaryHand);
        endHandIfComplete(*splitHand);
        break;
    }
    log(LogLevel::DEBUG, "Applied %s", action);
}

void Table::Impl::revealDealer()
{
    draw(dealerCards);
    if (evaluateHand(dealerCards).blackjack || allPlayerHandsBlackjack()) {
        return;
    }
    while (evaluateHand(dealerCards).value < DEALER_STAND_VALUE) {
        draw(dealerCards);
    }
    log(LogLevel::DEBUG, "Dealer hand: %s", evaluateHand(dealerCards));
}

Outcome Table::Impl::settle()
{
    const auto dealer = evaluateHand(dealerCards);
    auto outcome = Outcome {
        settleHand(evaluateHand(primaryHand.cards), dealer, primaryHand.bet)};
    if (splitHand) {
        outcome.split = settleHand(
            evaluateHand(splitHand->cards), dealer, splitHand->bet);
    }
    const auto payout = outcome.getTotalPayout();
    setPlayerStack(playerStack + payout);
    log(LogLevel::DEBUG, "Hand settled: %s, stack: %f", payout, playerStack);
    return outcome;
}

bool Table::Impl::advanceShoeCheck()
{
    if (!reshuffle && shoe.needsReshuffle()) {
        log(LogLevel::INFO, "Reshuffle point %d reached",
            shoe.getReshufflePoint());
        reshuffle = true;
    }
    return reshuffle;
}

void Table::Impl::setPlayerStack(const Chips stack)
{
    if (!std::isfinite(stack) || stack < 0) {
        throw StackBoundError {"Player stack must not be negative"};
    }
    playerStack = stack;
}

std::optional<HandSlot> Table::Impl::getActiveSlot() const
{
    if (primaryHand.state == HandState::ACTING) {
        return HandSlot::PRIMARY;
    } else if (splitHand && splitHand->state == HandState::ACTING) {
        return HandSlot::SPLIT;
    }
    return std::nullopt;
}

std::optional<EndReason> Table::Impl::getEndCondition() const
{
    if (playerStack < MIN_BET) {
        return EndReason::OUT_OF_CHIPS;
    } else if (playerStack > stackCeiling) {
        return EndReason::STACK_CEILING_REACHED;
    } else if (reshuffle) {
        return EndReason::RESHUFFLE;
    }
    return std::nullopt;
}

PlayerHand* Table::Impl::getActiveHand()
{
    return const_cast<PlayerHand*>(std::as_const(*this).getActiveHand());
}

const PlayerHand* Table::Impl::getActiveHand() const
{
    const auto slot = getActiveSlot();
    if (slot == HandSlot::PRIMARY) {
        return &primaryHand;
    } else if (slot == HandSlot::SPLIT) {
        return &*splitHand;
    }
    return nullptr;
}

void Table::Impl::draw(Cards& cards)
{
    cards.push_back(shoe.pop());
}

void Table::Impl::deductFromStack(const Chips amount)
{
    setPlayerStack(playerStack - amount);
}

void Table::Impl::commitBetIncrease(PlayerHand& hand, const int amount)
{
    deductFromStack(amount - hand.bet);
    hand.bet = amount;
    log(LogLevel::DEBUG, "Bet increased to %d", amount);
}

void Table::Impl::doubleDown(PlayerHand& hand)
{
    commitBetIncrease(hand, 2 * hand.bet);
    draw(hand.cards);
    hand.state = HandState::DONE;
}

bool Table::Impl::allPlayerHandsBlackjack() const
{
    return evaluateHand(primaryHand.cards).blackjack &&
        (!splitHand || evaluateHand(splitHand->cards).blackjack);
}

////////////////////////////////////////////////////////////////////////////////
// AwaitingBet
////////////////////////////////////////////////////////////////////////////////

class BetPlaced;

class AwaitingBet : public sc::simple_state<AwaitingBet, Table::Impl> {
public:
    using reactions = sc::custom_reaction<PlaceBetEvent>;
    sc::result react(const PlaceBetEvent& event);
};

sc::result AwaitingBet::react(const PlaceBetEvent& event)
{
    event.ret = outermost_context().placeBet(event.amount);
    if (isSuccessful(event.ret)) {
        return transit<BetPlaced>();
    }
    return discard_event();
}

////////////////////////////////////////////////////////////////////////////////
// HandInProgress
////////////////////////////////////////////////////////////////////////////////

class HandInProgress :
    public sc::simple_state<HandInProgress, Table::Impl, BetPlaced> {};

////////////////////////////////////////////////////////////////////////////////
// BetPlaced
////////////////////////////////////////////////////////////////////////////////

class PlayerActing;
class DealerTurn;

class BetPlaced : public sc::simple_state<BetPlaced, HandInProgress> {
public:
    using reactions = boost::mpl::list<
        sc::custom_reaction<PlaceBetEvent>,
        sc::custom_reaction<DealEvent>>;
    sc::result react(const PlaceBetEvent& event);
    sc::result react(const DealEvent& event);
};

sc::result BetPlaced::react(const PlaceBetEvent& event)
{
    event.ret = outermost_context().placeBet(event.amount);
    return discard_event();
}

sc::result BetPlaced::react(const DealEvent& event)
{
    auto& context = outermost_context();
    context.dealInitial();
    event.ret = evaluateHand(context.getPrimaryHand().cards);
    if (context.getActiveSlot()) {
        return transit<PlayerActing>();
    }
    return transit<DealerTurn>();
}

////////////////////////////////////////////////////////////////////////////////
// PlayerActing
////////////////////////////////////////////////////////////////////////////////

class PlayerActing : public sc::simple_state<PlayerActing, HandInProgress> {
public:
    using reactions = boost::mpl::list<
        sc::custom_reaction<ActionEvent>,
        sc::custom_reaction<PlaceBetEvent>>;
    sc::result react(const ActionEvent& event);
    sc::result react(const PlaceBetEvent& event);
};

sc::result PlayerActing::react(const ActionEvent& event)
{
    auto& context = outermost_context();
    if (auto reason = context.checkAction(event.action)) {
        event.ret = failure(FailureKind::ILLEGAL_ACTION, std::move(*reason));
        return discard_event();
    }
    context.applyAction(event.action);
    event.ret = event.action;
    if (context.getActiveSlot()) {
        return discard_event();
    }
    return transit<DealerTurn>();
}

sc::result PlayerActing::react(const PlaceBetEvent& event)
{
    auto& context = outermost_context();
    event.ret = context.increaseBet(event.amount);
    if (context.getActiveSlot()) {
        return discard_event();
    }
    return transit<DealerTurn>();
}

////////////////////////////////////////////////////////////////////////////////
// DealerTurn
////////////////////////////////////////////////////////////////////////////////

class AwaitingSettlement;

class DealerTurn : public sc::simple_state<DealerTurn, HandInProgress> {
public:
    using reactions = sc::custom_reaction<RevealDealerEvent>;
    sc::result react(const RevealDealerEvent& event);
};

sc::result DealerTurn::react(const RevealDealerEvent& event)
{
    auto& context = outermost_context();
    context.revealDealer();
    event.ret = evaluateHand(context.getDealerCards());
    return transit<AwaitingSettlement>();
}

////////////////////////////////////////////////////////////////////////////////
// AwaitingSettlement
////////////////////////////////////////////////////////////////////////////////

class Finished;

class AwaitingSettlement :
    public sc::simple_state<AwaitingSettlement, HandInProgress> {
public:
    using reactions = sc::custom_reaction<SettleEvent>;
    sc::result react(const SettleEvent& event);
};

sc::result AwaitingSettlement::react(const SettleEvent& event)
{
    auto& context = outermost_context();
    event.ret = context.settle();
    context.advanceShoeCheck();
    if (const auto reason = context.getEndCondition()) {
        log(LogLevel::INFO, "Game ended: %s", *reason);
        return transit<Finished>();
    }
    return transit<AwaitingBet>();
}

////////////////////////////////////////////////////////////////////////////////
// Finished
////////////////////////////////////////////////////////////////////////////////

class Finished : public sc::simple_state<Finished, Table::Impl> {};

////////////////////////////////////////////////////////////////////////////////
// Table
////////////////////////////////////////////////////////////////////////////////

Table::Table(
    const Chips playerStack, Shoe shoe, const Chips stackCeiling) :
    impl {std::make_unique<Impl>(playerStack, std::move(shoe), stackCeiling)}
{
    impl->initiate();
}

Table::~Table() = default;

Result<int> Table::setBet(const std::string_view input)
{
    const auto trimmed = boost::algorithm::trim_copy(std::string {input});
    auto amount = 0;
    try {
        amount = boost::lexical_cast<int>(trimmed);
    } catch (const boost::bad_lexical_cast&) {
        return logIfRejected<int>(
            invalidBet("Bet must be a whole number"), "bet");
    }
    return setBet(amount);
}

Result<int> Table::setBet(const int amount)
{
    auto ret = Result<int> {wrongPhase("Bets cannot be placed now")};
    impl->process_event(PlaceBetEvent {amount, ret});
    return logIfRejected(std::move(ret), "bet");
}

Result<HandEvaluation> Table::dealInitial()
{
    auto ret = Result<HandEvaluation> {
        wrongPhase("Cards can only be dealt after placing a bet")};
    impl->process_event(DealEvent {ret});
    return logIfRejected(std::move(ret), "deal");
}

bool Table::isActionPermitted(const Action action) const
{
    return impl->state_cast<const PlayerActing*>() &&
        !impl->checkAction(action);
}

std::vector<Action> Table::getPermittedActions() const
{
    auto ret = std::vector<Action> {};
    std::copy_if(
        ACTIONS.begin(), ACTIONS.end(), std::back_inserter(ret),
        [this](const auto action) { return isActionPermitted(action); });
    return ret;
}

Result<Action> Table::applyAction(const std::string_view key)
{
    if (const auto action = actionFromKey(key)) {
        return applyAction(*action);
    }
    return logIfRejected<Action>(
        failure(
            FailureKind::ILLEGAL_ACTION,
            "Invalid action! Please press h, s, d or 2"),
        "action");
}

Result<Action> Table::applyAction(const Action action)
{
    auto ret = Result<Action> {wrongPhase("No hand is being played")};
    impl->process_event(ActionEvent {action, ret});
    return logIfRejected(std::move(ret), "action");
}

Result<HandEvaluation> Table::revealDealer()
{
    auto ret = Result<HandEvaluation> {
        wrongPhase("The dealer can only reveal after the player is done")};
    impl->process_event(RevealDealerEvent {ret});
    return logIfRejected(std::move(ret), "dealer reveal");
}

Result<Outcome> Table::settle()
{
    auto ret = Result<Outcome> {
        wrongPhase("Bets can only be settled after the dealer is revealed")};
    impl->process_event(SettleEvent {ret});
    return logIfRejected(std::move(ret), "settlement");
}

bool Table::advanceShoeCheck()
{
    return impl->advanceShoeCheck();
}

Chips Table::getPlayerStack() const
{
    return impl->getPlayerStack();
}

void Table::setPlayerStack(const Chips playerStack)
{
    impl->setPlayerStack(playerStack);
}

Chips Table::getStackCeiling() const
{
    return impl->getStackCeiling();
}

std::optional<int> Table::getBet() const
{
    const auto bet = impl->getPrimaryHand().bet;
    return (bet > 0) ? std::optional<int> {bet} : std::nullopt;
}

std::optional<int> Table::getSplitBet() const
{
    if (const auto& split_hand = impl->getSplitHand()) {
        return split_hand->bet;
    }
    return std::nullopt;
}

const Cards& Table::getDealerCards() const
{
    return impl->getDealerCards();
}

const Cards& Table::getPlayerCards() const
{
    return impl->getPrimaryHand().cards;
}

const Cards* Table::getSplitCards() const
{
    if (const auto& split_hand = impl->getSplitHand()) {
        return &split_hand->cards;
    }
    return nullptr;
}

std::optional<HandState> Table::getHandState(const HandSlot slot) const
{
    if (impl->getPrimaryHand().cards.empty()) {
        return std::nullopt;
    } else if (slot == HandSlot::PRIMARY) {
        return impl->getPrimaryHand().state;
    } else if (const auto& split_hand = impl->getSplitHand()) {
        return split_hand->state;
    }
    return std::nullopt;
}

std::optional<HandSlot> Table::getActiveHand() const
{
    if (impl->state_cast<const PlayerActing*>()) {
        return impl->getActiveSlot();
    }
    return std::nullopt;
}

TablePhase Table::getPhase() const
{
    if (impl->state_cast<const BetPlaced*>()) {
        return TablePhase::BET_PLACED;
    } else if (impl->state_cast<const PlayerActing*>()) {
        return TablePhase::PLAYER_ACTING;
    } else if (impl->state_cast<const DealerTurn*>()) {
        return TablePhase::DEALER_TURN;
    } else if (impl->state_cast<const AwaitingSettlement*>()) {
        return TablePhase::AWAITING_SETTLEMENT;
    } else if (hasEnded()) {
        return TablePhase::FINISHED;
    }
    return TablePhase::AWAITING_BET;
}

bool Table::isBetPlaced() const
{
    return impl->state_cast<const HandInProgress*>();
}

bool Table::needsReshuffle() const
{
    return impl->needsReshuffle();
}

bool Table::hasEnded() const
{
    if (impl->state_cast<const Finished*>()) {
        return true;
    }
    return impl->state_cast<const AwaitingBet*>() &&
        impl->getEndCondition().has_value();
}

std::optional<EndReason> Table::getEndReason() const
{
    if (hasEnded()) {
        return impl->getEndCondition();
    }
    return std::nullopt;
}

const Shoe& Table::getShoe() const
{
    return impl->getShoe();
}

std::ostream& operator<<(std::ostream& os, const HandState state)
{
    switch (state) {
    case HandState::ACTING:
        return os << "acting";
    case HandState::DONE:
        return os << "done";
    }
    return os;
}

std::ostream& operator<<(std::ostream& os, const HandSlot slot)
{
    switch (slot) {
    case HandSlot::PRIMARY:
        return os << "primary";
    case HandSlot::SPLIT:
        return os << "split";
    }
    return os;
}

std::ostream& operator<<(std::ostream& os, const TablePhase phase)
{
    switch (phase) {
    case TablePhase::AWAITING_BET:
        return os << "awaiting bet";
    case TablePhase::BET_PLACED:
        return os << "bet placed";
    case TablePhase::PLAYER_ACTING:
        return os << "player acting";
    case TablePhase::DEALER_TURN:
        return os << "dealer turn";
    case TablePhase::AWAITING_SETTLEMENT:
        return os << "awaiting settlement";
    case TablePhase::FINISHED:
        return os << "finished";
    }
    return os;
}

std::ostream& operator<<(std::ostream& os, const EndReason reason)
{
    switch (reason) {
    case EndReason::OUT_OF_CHIPS:
        return os << "out of chips";
    case EndReason::STACK_CEILING_REACHED:
        return os << "stack ceiling reached";
    case EndReason::RESHUFFLE:
        return os << "shoe needs reshuffle";
    }
    return os;
}

}
}
