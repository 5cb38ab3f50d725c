#include "blackjack/Outcome.hh"

#include "blackjack/HandEvaluation.hh"

#include <ostream>

namespace Blackjack {

namespace {

constexpr auto BLACKJACK_PAYOUT_FACTOR = 2.5;
constexpr auto WIN_PAYOUT_FACTOR = 2;

}

Chips Outcome::getTotalPayout() const
{
    return primary.payout + (split ? split->payout : Chips {});
}

HandSettlement settleHand(
    const HandEvaluation& player, const HandEvaluation& dealer, const int bet)
{
    if (player.blackjack && !dealer.blackjack) {
        return {HandResult::BLACKJACK, BLACKJACK_PAYOUT_FACTOR * bet};
    }
    if (!player.isBust()) {
        if (player.value > dealer.value || dealer.isBust()) {
            return {HandResult::WIN, Chips(WIN_PAYOUT_FACTOR * bet)};
        }
        const auto tie = !dealer.blackjack && player.value == dealer.value;
        if (tie || (player.blackjack && dealer.blackjack)) {
            return {HandResult::PUSH, Chips(bet)};
        }
    }
    return {HandResult::LOSS, Chips {}};
}

bool operator==(const HandSettlement& lhs, const HandSettlement& rhs)
{
    return lhs.result == rhs.result && lhs.payout == rhs.payout;
}

bool operator==(const Outcome& lhs, const Outcome& rhs)
{
    return lhs.primary == rhs.primary && lhs.split == rhs.split;
}

std::ostream& operator<<(std::ostream& os, const HandResult result)
{
    switch (result) {
    case HandResult::BLACKJACK:
        return os << "blackjack";
    case HandResult::WIN:
        return os << "win";
    case HandResult::PUSH:
        return os << "push";
    case HandResult::LOSS:
        return os << "loss";
    }
    return os;
}

std::ostream& operator<<(std::ostream& os, const HandSettlement& settlement)
{
    return os << settlement.result << " (" << settlement.payout << ")";
}

}
