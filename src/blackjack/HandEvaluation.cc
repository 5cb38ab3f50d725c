#include "blackjack/HandEvaluation.hh"

#include <ostream>

namespace Blackjack {

int getCardValue(const Card card)
{
    const auto rank = getRank(card);
    if (rank == Rank::ACE) {
        return 11;
    } else if (rank >= Rank::TEN) {
        return 10;
    }
    return static_cast<int>(rank) + 2;
}

bool operator==(const HandEvaluation& lhs, const HandEvaluation& rhs)
{
    return lhs.value == rhs.value && lhs.blackjack == rhs.blackjack;
}

std::ostream& operator<<(std::ostream& os, const HandEvaluation& evaluation)
{
    if (evaluation.blackjack) {
        return os << "blackjack";
    }
    return os << evaluation.value;
}

}
