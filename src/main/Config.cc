#include "main/Config.hh"

#include "blackjack/Shoe.hh"
#include "engine/Table.hh"
#include "Logging.hh"

#include <array>
#include <cassert>
#include <cerrno>
#include <cstring>
#include <exception>
#include <fstream>
#include <iostream>
#include <limits>
#include <memory>
#include <new>
#include <stdexcept>
#include <string>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

namespace Blackjack {
namespace Main {

using namespace std::string_view_literals;

namespace {

constexpr auto STARTING_STACK = "starting_stack"sv;
constexpr auto DECKS = "decks"sv;
constexpr auto STACK_CEILING = "stack_ceiling"sv;
constexpr auto SEED = "seed"sv;

constexpr auto DEFAULT_STARTING_STACK = Chips {1000};
constexpr auto DEFAULT_DECKS = 6;

class LuaPopGuard {
public:
    LuaPopGuard(lua_State* lua);
    ~LuaPopGuard();
private:
    lua_State* lua;
};

LuaPopGuard::LuaPopGuard(lua_State* lua) :
    lua {lua}
{
}

LuaPopGuard::~LuaPopGuard()
{
    lua_pop(lua, 1);
}

constexpr auto READ_CHUNK_SIZE = 4096;
struct LuaStreamReaderArgs {
    LuaStreamReaderArgs(std::istream& in) : in {in}, buf {} {};
    std::istream& in;
    std::array<char, READ_CHUNK_SIZE> buf;
};

extern "C"
const char* config_lua_reader(
    lua_State*, void* data, std::size_t* size)
{
    auto& args = *static_cast<LuaStreamReaderArgs*>(data);
    if (args.in) {
        errno = 0;
        args.in.read(args.buf.data(), args.buf.size());
        if (args.in.bad()) {
            // Exceptions must not propagate through the Lua C API
            log(LogLevel::WARNING, "Failed to read config: %s", strerror(errno));
        } else {
            *size = args.in.gcount();
            return args.buf.data();
        }
    }
    *size = 0;
    return nullptr;
}

void loadAndExecuteFromStream(lua_State* lua, std::istream& in)
{
    std::istream::sentry s {in, true};
    if (!s) {
        log(LogLevel::ERROR, "Bad stream while reading config: %s",
            strerror(errno));
        throw std::runtime_error {"Failed to read config"};
    }
    const auto reader_args = std::make_unique<LuaStreamReaderArgs>(in);
    auto error = lua_load(
        lua, config_lua_reader, reader_args.get(), "config", nullptr);
    if (!error) {
        const auto out_of_memory_handler =
            std::set_new_handler(std::terminate);
        error = lua_pcall(lua, 0, 0, 0);
        std::set_new_handler(out_of_memory_handler);
    }
    if (error) {
        log(LogLevel::ERROR, "Error while running config script: %s",
            lua_tostring(lua, -1));
        throw std::runtime_error {"Could not process config"};
    }
}

std::optional<lua_Number> getNumber(lua_State* lua, std::string_view key)
{
    lua_getglobal(lua, key.data());
    LuaPopGuard guard {lua};
    auto success = 0;
    const auto ret = lua_tonumberx(lua, -1, &success);
    if (success) {
        return ret;
    } else if (!lua_isnoneornil(lua, -1)) {
        log(LogLevel::WARNING, "Expected number: %s", key);
    }
    return std::nullopt;
}

std::optional<lua_Integer> getInt(lua_State* lua, std::string_view key)
{
    lua_getglobal(lua, key.data());
    LuaPopGuard guard {lua};
    auto success = 0;
    const auto ret = lua_tointegerx(lua, -1, &success);
    if (success) {
        return ret;
    } else if (!lua_isnoneornil(lua, -1)) {
        log(LogLevel::WARNING, "Expected integer: %s", key);
    }
    return std::nullopt;
}

}

struct Config::Impl {
    Impl();
    Impl(std::istream& in);

    Chips startingStack {DEFAULT_STARTING_STACK};
    int nDecks {DEFAULT_DECKS};
    Chips stackCeiling {Engine::DEFAULT_STACK_CEILING};
    std::optional<Rng::result_type> seed {};

private:

    void createDecksConfig(lua_State* lua);
    void createSeedConfig(lua_State* lua);
};

Config::Impl::Impl() = default;

Config::Impl::Impl(std::istream& in)
{
    log(LogLevel::INFO, "Reading configs");

    const auto& closer = lua_close;
    const auto lua = std::unique_ptr<lua_State, decltype(closer)> {
        luaL_newstate(), closer};
    if (!lua) {
        throw std::runtime_error {"Failed to create Lua state"};
    }
    luaL_openlibs(lua.get());

    loadAndExecuteFromStream(lua.get(), in);

    startingStack = getNumber(lua.get(), STARTING_STACK)
        .value_or(DEFAULT_STARTING_STACK);
    createDecksConfig(lua.get());
    stackCeiling = getNumber(lua.get(), STACK_CEILING)
        .value_or(Engine::DEFAULT_STACK_CEILING);
    createSeedConfig(lua.get());

    log(LogLevel::INFO, "Reading configs completed");
}

void Config::Impl::createDecksConfig(lua_State* lua)
{
    if (const auto value = getInt(lua, DECKS)) {
        if (*value < MIN_DECKS || *value > MAX_DECKS) {
            log(LogLevel::ERROR, "Invalid number of decks: %d", *value);
            throw ConfigurationError {
                "Number of decks must be between 1 and 6"};
        }
        nDecks = static_cast<int>(*value);
    }
}

void Config::Impl::createSeedConfig(lua_State* lua)
{
    if (const auto value = getInt(lua, SEED)) {
        constexpr auto max_seed = std::numeric_limits<Rng::result_type>::max();
        if (*value < 0 || static_cast<unsigned long long>(*value) > max_seed) {
            log(LogLevel::WARNING, "Seed out of range: %d", *value);
        } else {
            seed = static_cast<Rng::result_type>(*value);
        }
    }
}

Config::Config() :
    impl {std::make_unique<Impl>()}
{
}

Config::Config(std::istream& in) :
    impl {std::make_unique<Impl>(in)}
{
}

Config::Config(Config&&) = default;

Config::~Config() = default;

Config& Config::operator=(Config&&) = default;

Chips Config::getStartingStack() const
{
    assert(impl);
    return impl->startingStack;
}

int Config::getNumberOfDecks() const
{
    assert(impl);
    return impl->nDecks;
}

Chips Config::getStackCeiling() const
{
    assert(impl);
    return impl->stackCeiling;
}

std::optional<Rng::result_type> Config::getSeed() const
{
    assert(impl);
    return impl->seed;
}

Config configFromPath(const std::string_view path)
{
    if (path.empty()) {
        return {};
    }
    errno = 0;
    if (path == "-") {
        return Config {std::cin};
    }
    auto in = std::ifstream {std::string {path}};
    return Config {in};
}

}
}
