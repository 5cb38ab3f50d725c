/** \file
 *
 * \brief Definition of Blackjack::Main::TerminalGame class
 */

#ifndef MAIN_TERMINALGAME_HH_
#define MAIN_TERMINALGAME_HH_

#include <iosfwd>
#include <string>
#include <string_view>

namespace Blackjack {

namespace Engine {
class Table;
}

namespace Main {

/** \brief Line based terminal front-end of a table
 *
 * TerminalGame reads lines from an input stream and forwards them to the bet
 * and action setters of a table. When the table rejects the input, the
 * reason is printed and the prompt repeated. The state of the table and the
 * outcome of each hand are printed to an output stream.
 */
class TerminalGame {
public:

    /** \brief Prompt for the bet of a hand
     */
    static const std::string_view BET_PROMPT;

    /** \brief Prompt for the player action
     */
    static const std::string_view ACTION_PROMPT;

    /** \brief Create new terminal game
     *
     * \param table the table to play on
     * \param in the stream the player input is read from
     * \param out the stream the table is rendered to
     */
    TerminalGame(Engine::Table& table, std::istream& in, std::ostream& out);

    /** \brief Play hands until the game ends
     *
     * \return true if the game ended, false if the input ended first
     */
    bool run();

    /** \brief Play one hand
     *
     * \return true if the hand was played to the end, false if the input
     * ended first
     */
    bool playHand();

private:

    bool readLine(std::string_view prompt, std::string& line);
    bool placeBet();
    bool playActions();

    Engine::Table& table;
    std::istream& in;
    std::ostream& out;
};

}
}

#endif // MAIN_TERMINALGAME_HH_
