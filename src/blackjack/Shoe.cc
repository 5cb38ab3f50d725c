#include "blackjack/Shoe.hh"

#include "blackjack/BlackjackConstants.hh"
#include "Logging.hh"

#include <boost/iterator/counting_iterator.hpp>

#include <algorithm>
#include <utility>

namespace Blackjack {

namespace {

int checkDecks(const int nDecks)
{
    if (nDecks < MIN_DECKS || nDecks > MAX_DECKS) {
        throw ConfigurationError {"Number of decks must be between 1 and 6"};
    }
    return nDecks;
}

Cards generateShuffledDecks(const int nDecks, Rng& rng)
{
    auto cards = Cards {};
    cards.reserve(nDecks * N_CARDS);
    for (auto n = 0; n < nDecks; ++n) {
        const auto first = cards.insert(
            cards.end(),
            boost::make_counting_iterator<Card>(0),
            boost::make_counting_iterator<Card>(N_CARDS));
        std::shuffle(first, cards.end(), rng);
    }
    return cards;
}

int drawReshufflePoint(const int nDecks, Rng& rng)
{
    auto dist = std::uniform_int_distribution<int> {
        MIN_RESHUFFLE_POINT, nDecks * N_CARDS - 1};
    return dist(rng);
}

}

Shoe::Shoe(const int nDecks, Rng& rng) :
    cards {generateShuffledDecks(checkDecks(nDecks), rng)},
    nDecks {nDecks},
    reshufflePoint {drawReshufflePoint(nDecks, rng)}
{
    log(LogLevel::DEBUG, "Shoe of %d decks created, reshuffle point: %d",
        nDecks, reshufflePoint);
}

Shoe::Shoe(Cards cardsInDrawOrder, const int reshufflePoint) :
    cards(std::move(cardsInDrawOrder)),
    nDecks {(static_cast<int>(cards.size()) + N_CARDS - 1) / N_CARDS},
    reshufflePoint {reshufflePoint}
{
    const auto valid = std::all_of(
        cards.begin(), cards.end(),
        [](const auto card) { return 0 <= card && card < N_CARDS; });
    if (!valid) {
        throw ConfigurationError {"Invalid card in stacked shoe"};
    }
    if (reshufflePoint < 0) {
        throw ConfigurationError {"Reshuffle point must not be negative"};
    }
    // Cards are popped from the back
    std::reverse(cards.begin(), cards.end());
}

Card Shoe::pop()
{
    if (cards.empty()) {
        throw std::out_of_range {"Shoe is empty"};
    }
    const auto card = cards.back();
    cards.pop_back();
    return card;
}

int Shoe::getNumberOfCards() const
{
    return static_cast<int>(cards.size());
}

int Shoe::getNumberOfDecks() const
{
    return nDecks;
}

int Shoe::getReshufflePoint() const
{
    return reshufflePoint;
}

bool Shoe::needsReshuffle() const
{
    return getNumberOfCards() < reshufflePoint;
}

}
