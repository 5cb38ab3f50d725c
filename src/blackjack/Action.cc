#include "blackjack/Action.hh"

#include <boost/algorithm/string/trim.hpp>

#include <algorithm>
#include <ostream>
#include <string>

namespace Blackjack {

namespace {

using namespace std::string_view_literals;

constexpr auto ACTION_KEYS = std::array {'h', 's', 'd', '2'};
constexpr auto ACTION_NAMES = std::array {
    "hit"sv, "stand"sv, "double"sv, "split"sv,
};

}

std::optional<Action> actionFromKey(const std::string_view key)
{
    const auto trimmed = boost::algorithm::trim_copy(std::string {key});
    if (trimmed.size() != 1) {
        return std::nullopt;
    }
    const auto iter = std::find(
        ACTION_KEYS.begin(), ACTION_KEYS.end(), trimmed.front());
    if (iter == ACTION_KEYS.end()) {
        return std::nullopt;
    }
    return ACTIONS[iter - ACTION_KEYS.begin()];
}

char getKey(const Action action)
{
    return ACTION_KEYS.at(static_cast<std::size_t>(action));
}

std::ostream& operator<<(std::ostream& os, const Action action)
{
    return os << ACTION_NAMES.at(static_cast<std::size_t>(action));
}

}
