/** \file
 *
 * \brief Definition of Blackjack::Main::Config class
 */

#ifndef MAIN_CONFIG_HH_
#define MAIN_CONFIG_HH_

#include "blackjack/BlackjackConstants.hh"
#include "blackjack/Random.hh"

#include <iosfwd>
#include <memory>
#include <optional>
#include <string_view>

namespace Blackjack {

/** \brief The terminal front-end of the Blackjack engine
 */
namespace Main {

/** \brief Configuration file processing utility
 *
 * The configuration file is a Lua script. After running the script, the
 * following global variables are read:
 *
 * - \c starting_stack: the initial chip stack (number, default 1000)
 * - \c decks: the number of decks in the shoe (integer, default 6)
 * - \c stack_ceiling: the stack above which the player has broken the bank
 *   (number, default 999999)
 * - \c seed: the seed of the random number generator (integer, optional)
 *
 * A variable of unexpected type is ignored with a warning and the default
 * is used instead.
 */
class Config {
public:

    /** \brief Create default configs
     */
    Config();

    /** \brief Create configuration from stream
     *
     * The constructor reads configuration script from stream \p in and
     * processes it. The processing involves reading the stream until EOF,
     * parsing the contents as Lua script and running the script.
     *
     * \throw std::runtime_error if reading the stream or processing the script
     * fails
     * \throw ConfigurationError if the number of decks is not between 1 and 6
     */
    Config(std::istream& in);

    /** \brief Move constructor
     */
    Config(Config&&);

    ~Config();

    /** \brief Move assignment
     */
    Config& operator=(Config&&);

    /** \brief Get the initial chip stack
     */
    Chips getStartingStack() const;

    /** \brief Get the number of decks in the shoe
     */
    int getNumberOfDecks() const;

    /** \brief Get the stack ceiling
     */
    Chips getStackCeiling() const;

    /** \brief Get the random number generator seed
     *
     * \return the seed, or nullopt if the generator should be seeded from the
     * OS random number source
     */
    std::optional<Rng::result_type> getSeed() const;

private:

    struct Impl;
    std::unique_ptr<const Impl> impl;
};

/** \brief Create configuration from file
 *
 * Depending on the value the \p path, the function generates the config object
 * in different ways:
 * - If \p path is empty, default configuration is returned
 * - If \p path is hyphen (“-”), configuration is read from stdin
 * - Otherwise \p path is interpreted as path to the configuration file
 *
 * \param path the path of the configuration file
 *
 * \return config object based on the file
 *
 * \throw std::runtime_error if the file cannot be read or processed
 */
Config configFromPath(std::string_view path);

}
}

#endif // MAIN_CONFIG_HH_
