#include "blackjack/Random.hh"
#include "blackjack/Shoe.hh"
#include "engine/Table.hh"
#include "main/Config.hh"
#include "main/TerminalGame.hh"
#include "Logging.hh"

#include <boost/lexical_cast.hpp>

#include <getopt.h>

#include <array>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

namespace {

using namespace Blackjack;

Rng createRng(const std::optional<Rng::result_type> seed)
{
    if (seed) {
        log(LogLevel::INFO, "Using seed %d", *seed);
        return makeRng(seed);
    }
    return getRng();
}

class BlackjackApp {
public:

    BlackjackApp(
        const Main::Config& config,
        const std::optional<Rng::result_type> seed) :
        rng {createRng(seed ? seed : config.getSeed())},
        table {
            config.getStartingStack(),
            Shoe {config.getNumberOfDecks(), rng},
            config.getStackCeiling()},
        game {table, std::cin, std::cout}
    {
        log(LogLevel::INFO, "Startup completed");
    }

    ~BlackjackApp()
    {
        log(LogLevel::INFO, "Shutting down");
    }

    void run()
    {
        game.run();
    }

private:

    Rng rng;
    Engine::Table table;
    Main::TerminalGame game;
};

std::optional<Rng::result_type> parseSeed(const char* arg)
{
    try {
        return boost::lexical_cast<Rng::result_type>(arg);
    } catch (const boost::bad_lexical_cast&) {
        std::cerr << "invalid seed: " << arg << std::endl;
        std::exit(EXIT_FAILURE);
    }
}

}

int blackjack_main(int argc, char* argv[])
{
    auto configPath = std::string {};
    auto seed = std::optional<Rng::result_type> {};

    const auto short_opt = "vf:s:";
    auto long_opt = std::array {
        option { "config", required_argument, 0, 'f' },
        option { "seed", required_argument, 0, 's' },
        option { nullptr, 0, 0, 0 },
    };
    auto verbosity = 0;
    auto opt_index = 0;
    while (true) {
        auto c = getopt_long(
            argc, argv, short_opt, long_opt.data(), &opt_index);
        if (c == -1) {
            break;
        } else if (c == 'v') {
            ++verbosity;
        } else if (c == 'f') {
            configPath = optarg;
        } else if (c == 's') {
            seed = parseSeed(optarg);
        } else {
            std::exit(EXIT_FAILURE);
        }
    }

    setupLogging(getLogLevel(verbosity), std::cerr);

    BlackjackApp app {Main::configFromPath(configPath), seed};
    app.run();
    return EXIT_SUCCESS;
}
