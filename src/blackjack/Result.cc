#include "blackjack/Result.hh"

#include <ostream>

namespace Blackjack {

std::ostream& operator<<(std::ostream& os, const FailureKind kind)
{
    switch (kind) {
    case FailureKind::INVALID_BET:
        return os << "invalid bet";
    case FailureKind::ILLEGAL_ACTION:
        return os << "illegal action";
    case FailureKind::WRONG_PHASE:
        return os << "wrong phase";
    }
    return os;
}

std::ostream& operator<<(std::ostream& os, const Failure& failure)
{
    return os << failure.kind << ": " << failure.reason;
}

}
