#include "blackjack/Card.hh"

#include "blackjack/BlackjackConstants.hh"

#include <array>
#include <ostream>

namespace Blackjack {

namespace {

using namespace std::string_view_literals;

constexpr auto RANK_SYMBOLS = std::array {
    "2"sv, "3"sv, "4"sv, "5"sv, "6"sv, "7"sv, "8"sv, "9"sv, "10"sv,
    "J"sv, "Q"sv, "K"sv, "A"sv,
};

constexpr auto SUIT_SYMBOLS = std::array {
    "c"sv, "d"sv, "h"sv, "s"sv,
};

static_assert(RANK_SYMBOLS.size() == N_RANKS);
static_assert(SUIT_SYMBOLS.size() == N_SUITS);

}

Rank getRank(const Card card)
{
    return static_cast<Rank>(card % N_RANKS);
}

Suit getSuit(const Card card)
{
    return static_cast<Suit>(card / N_RANKS);
}

Card cardFor(const Rank rank, const Suit suit)
{
    return static_cast<int>(suit) * N_RANKS + static_cast<int>(rank);
}

std::string_view getSymbol(const Rank rank)
{
    return RANK_SYMBOLS.at(static_cast<std::size_t>(rank));
}

std::string_view getSymbol(const Suit suit)
{
    return SUIT_SYMBOLS.at(static_cast<std::size_t>(suit));
}

std::string getLabel(const Card card)
{
    auto ret = std::string {getSymbol(getRank(card))};
    ret += getSymbol(getSuit(card));
    return ret;
}

std::ostream& operator<<(std::ostream& os, const Rank rank)
{
    return os << getSymbol(rank);
}

std::ostream& operator<<(std::ostream& os, const Suit suit)
{
    return os << getSymbol(suit);
}

}
