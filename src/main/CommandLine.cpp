// Copyright 2026 nftsim contributors. Licensed under the Apache License,
// Version 2.0. See the COPYING file at the root of this distribution or at
// http://www.apache.org/licenses/LICENSE-2.0

#include "main/CommandLine.h"
#include "crypto/Random.h"
#include "main/Config.h"
#include "main/NFTSimVersion.h"
#include "simulation/NFTSimulation.h"
#include "util/Logging.h"

#include <medida/metrics_registry.h>

#ifdef BUILD_TESTS
#include "test/test.h"
#endif

#include <algorithm>
#include <clara.hpp>
#include <fmt/format.h>
#include <functional>
#include <iostream>
#include <limits>

namespace nftsim
{

void
writeWithTextFlow(std::ostream& os, std::string const& text)
{
    size_t consoleWidth = CLARA_TEXTFLOW_CONFIG_CONSOLE_WIDTH;
    os << clara::TextFlow::Column(text).width(consoleWidth) << "\n\n";
}

std::string
parseUnsigned(std::string const& arg, std::string const& name, uint64_t max,
              uint64_t& value)
{
    auto invalid = fmt::format(
        FMT_STRING("{} must be an integer between 0 and {}, got '{}'"), name,
        max, arg);
    if (arg.empty() || !std::all_of(arg.begin(), arg.end(), [](char c) {
            return c >= '0' && c <= '9';
        }))
    {
        return invalid;
    }
    try
    {
        auto parsed = std::stoull(arg);
        if (parsed > max)
        {
            return invalid;
        }
        value = parsed;
    }
    catch (std::out_of_range&)
    {
        return invalid;
    }
    return std::string{};
}

namespace
{

class CommandLine
{
  public:
    struct ConfigOption
    {
        using Common = std::pair<std::string, bool>;
        static const std::vector<Common> COMMON_OPTIONS;

        // Unset means: use LOG_LEVEL from the config.
        std::optional<LogLevel> mLogLevel;
        std::string mConfigFile;

        Config getConfig() const;
    };

    class Command
    {
      public:
        using RunFunc = std::function<int(CommandLineArgs const& args)>;

        Command(std::string const& name, std::string const& description,
                RunFunc const& runFunc);
        int run(CommandLineArgs const& args) const;
        std::string name() const;
        std::string description() const;

      private:
        std::string mName;
        std::string mDescription;
        RunFunc mRunFunc;
    };

    explicit CommandLine(std::vector<Command> const& commands);

    using AdjustedCommandLine =
        std::pair<std::string, std::vector<std::string>>;
    AdjustedCommandLine adjustCommandLine(clara::detail::Args const& args);
    std::optional<Command> selectCommand(std::string const& commandName);
    void writeToStream(std::string const& exeName, std::ostream& os) const;

  private:
    std::vector<Command> mCommands;
};

const std::vector<std::pair<std::string, bool>>
    CommandLine::ConfigOption::COMMON_OPTIONS{
        {"--conf", true}, {"--ll", true}, {"--help", false}};

class ParserWithValidation
{
  public:
    ParserWithValidation(
        clara::Parser parser,
        std::function<std::string()> isValid = [] { return std::string{}; })
    {
        mParser = parser;
        mIsValid = isValid;
    }

    ParserWithValidation(
        clara::Opt opt,
        std::function<std::string()> isValid = [] { return std::string{}; })
    {
        mParser = clara::Parser{} | opt;
        mIsValid = isValid;
    }

    const clara::Parser&
    parser() const
    {
        return mParser;
    }

    std::string
    validate() const
    {
        return mIsValid();
    }

  private:
    clara::Parser mParser;
    std::function<std::string()> mIsValid;
};

clara::Opt
logLevelParser(std::optional<LogLevel>& value)
{
    return clara::Opt{
        [&](std::string const& arg) { value = Logging::getLLfromString(arg); },
        "LEVEL"}["--ll"]("set the log level");
}

clara::Parser
configurationParser(CommandLine::ConfigOption& configOption)
{
    return logLevelParser(configOption.mLogLevel) |
           clara::Opt{configOption.mConfigFile,
                      "FILE-NAME"}["--conf"](fmt::format(
               FMT_STRING("specify a config file ('{}' for STDIN, built-in "
                          "defaults if omitted)"),
               Config::STDIN_SPECIAL_NAME));
}

ParserWithValidation
seedParser(std::string& arg, std::optional<uint64_t>& seed)
{
    return {clara::Opt{arg, "SEED"}["--seed"](
                "seed of the run's random engine, overrides SEED (0 picks "
                "one)"),
            [&arg, &seed] {
                if (arg.empty())
                {
                    return std::string{};
                }
                uint64_t value = 0;
                auto error = parseUnsigned(
                    arg, "SEED", std::numeric_limits<uint64_t>::max(), value);
                if (error.empty())
                {
                    seed = value;
                }
                return error;
            }};
}

ParserWithValidation
ledgerCountParser(std::string& arg, std::optional<uint32_t>& ledgers)
{
    return {clara::Opt{arg, "COUNT"}["--ledgers"](
                "number of ledgers to run, overrides NUM_LEDGERS"),
            [&arg, &ledgers] {
                if (arg.empty())
                {
                    return std::string{};
                }
                uint64_t value = 0;
                auto error = parseUnsigned(
                    arg, "COUNT", std::numeric_limits<uint32_t>::max(), value);
                if (error.empty())
                {
                    ledgers = static_cast<uint32_t>(value);
                }
                return error;
            }};
}

clara::Opt
statsFileParser(std::string& fileName)
{
    return clara::Opt{fileName, "FILE-NAME"}["--stats-file"](
        "write the JSON run summary to FILE-NAME, overrides STATS_FILE_PATH");
}

int
runWithHelp(CommandLineArgs const& args,
            std::vector<ParserWithValidation> parsers, std::function<int()> f)
{
    auto isHelp = false;
    auto parser = clara::Parser{} | clara::Help(isHelp);
    for (auto const& p : parsers)
        parser |= p.parser();
    auto errorMessage =
        parser
            .parse(args.mCommandName,
                   clara::detail::TokenStream{std::begin(args.mArgs),
                                              std::end(args.mArgs)})
            .errorMessage();
    if (errorMessage.empty())
    {
        for (auto const& p : parsers)
        {
            errorMessage = p.validate();
            if (!errorMessage.empty())
            {
                break;
            }
        }
    }

    if (!errorMessage.empty())
    {
        writeWithTextFlow(std::cerr, errorMessage);
        writeWithTextFlow(std::cerr, args.mCommandDescription);
        parser.writeToStream(std::cerr);
        return 1;
    }

    if (isHelp)
    {
        writeWithTextFlow(std::cout, args.mCommandDescription);
        parser.writeToStream(std::cout);
        return 0;
    }

    return f();
}

CommandLine::Command::Command(std::string const& name,
                              std::string const& description,
                              RunFunc const& runFunc)
    : mName{name}, mDescription{description}, mRunFunc{runFunc}
{
}

int
CommandLine::Command::run(CommandLineArgs const& args) const
{
    return mRunFunc(args);
}

std::string
CommandLine::Command::name() const
{
    return mName;
}

std::string
CommandLine::Command::description() const
{
    return mDescription;
}

Config
CommandLine::ConfigOption::getConfig() const
{
    Config config;

    if (mLogLevel)
    {
        Logging::setLogLevel(*mLogLevel, nullptr);
    }
    if (!mConfigFile.empty())
    {
        LOG_INFO(DEFAULT_LOG, "Config from {}", mConfigFile);
        config.load(mConfigFile);
    }
    else
    {
        LOG_INFO(DEFAULT_LOG, "No config file given, using defaults");
    }

    Logging::setFmt(config.CHAIN_ID);
    if (!config.LOG_FILE_PATH.empty())
    {
        Logging::setLoggingToFile(config.LOG_FILE_PATH);
    }
    Logging::setLogLevel(mLogLevel ? *mLogLevel
                                   : Logging::getLLfromString(config.LOG_LEVEL),
                         nullptr);
    return config;
}

CommandLine::CommandLine(std::vector<Command> const& commands)
    : mCommands{commands}
{
    mCommands.push_back(Command{"help", "display list of available commands",
                                [this](CommandLineArgs const& args) {
                                    writeToStream(args.mExeName, std::cout);
                                    return 0;
                                }});

    std::sort(
        std::begin(mCommands), std::end(mCommands),
        [](Command const& x, Command const& y) { return x.name() < y.name(); });
}

CommandLine::AdjustedCommandLine
CommandLine::adjustCommandLine(clara::detail::Args const& args)
{
    auto tokens = clara::detail::TokenStream{args};
    auto command = std::string{};
    auto remainingTokens = std::vector<std::string>{};
    auto found = false;
    auto optionValue = false;

    while (tokens)
    {
        auto token = *tokens;
        if (found || optionValue)
        {
            remainingTokens.push_back(token.token);
            optionValue = false;
        }
        else if (token.type == clara::detail::TokenType::Argument)
        {
            command = token.token;
            found = true;
        }
        else // clara::detail::TokenType::Option
        {
            auto commonIt =
                std::find_if(std::begin(ConfigOption::COMMON_OPTIONS),
                             std::end(ConfigOption::COMMON_OPTIONS),
                             [&](ConfigOption::Common const& option) {
                                 return token.token == option.first;
                             });
            if (commonIt != std::end(ConfigOption::COMMON_OPTIONS))
            {
                remainingTokens.push_back(token.token);
                optionValue = commonIt->second;
            }
            else
            {
                return {}; // unknown option before the command: show help
            }
        }
        ++tokens;
    }

    return CommandLine::AdjustedCommandLine{command, remainingTokens};
}

std::optional<CommandLine::Command>
CommandLine::selectCommand(std::string const& commandName)
{
    auto command = std::find_if(
        std::begin(mCommands), std::end(mCommands),
        [&](Command const& command) { return command.name() == commandName; });
    if (command != std::end(mCommands))
    {
        return std::make_optional<Command>(*command);
    }

    command = std::find_if(
        std::begin(mCommands), std::end(mCommands),
        [&](Command const& command) { return command.name() == "help"; });
    if (command != std::end(mCommands))
    {
        return std::make_optional<Command>(*command);
    }
    return std::nullopt;
}

void
CommandLine::writeToStream(std::string const& exeName, std::ostream& os) const
{
    os << "usage:\n"
       << "  " << exeName << " "
       << "COMMAND";
    os << "\n\nwhere COMMAND is one of following:" << std::endl;

    size_t consoleWidth = CLARA_TEXTFLOW_CONFIG_CONSOLE_WIDTH;
    size_t commandWidth = 0;
    for (auto const& command : mCommands)
        commandWidth = std::max(commandWidth, command.name().size() + 2);

    commandWidth = std::min(commandWidth, consoleWidth / 2);

    for (auto const& command : mCommands)
    {
        auto row = clara::TextFlow::Column(command.name())
                       .width(commandWidth)
                       .indent(2) +
                   clara::TextFlow::Spacer(4) +
                   clara::TextFlow::Column(command.description())
                       .width(consoleWidth - 7 - commandWidth);
        os << row << std::endl;
    }
}
}

int
runSimulation(CommandLineArgs const& args)
{
    CommandLine::ConfigOption configOption;
    std::string seedArg;
    std::optional<uint64_t> seed;
    std::string ledgersArg;
    std::optional<uint32_t> ledgers;
    std::string statsFile;

    return runWithHelp(
        args,
        {configurationParser(configOption), seedParser(seedArg, seed),
         ledgerCountParser(ledgersArg, ledgers), statsFileParser(statsFile)},
        [&] {
            auto cfg = configOption.getConfig();
            if (seed)
            {
                cfg.SEED = *seed;
            }
            if (ledgers)
            {
                cfg.NUM_LEDGERS = *ledgers;
            }
            if (!statsFile.empty())
            {
                cfg.STATS_FILE_PATH = statsFile;
            }
            if (cfg.SEED == 0)
            {
                cfg.SEED = randomSeed();
            }

            CLOG_INFO(Process, "Starting nftsim {} on chain '{}' with seed {}",
                      NFTSIM_VERSION, cfg.CHAIN_ID, cfg.SEED);

            medida::MetricsRegistry metrics;
            NFTSimulation simulation(cfg, metrics);
            bool completed = simulation.run();

            std::cout << simulation.getStatus().toStyledString();
            if (!cfg.STATS_FILE_PATH.empty())
            {
                simulation.writeStatus(cfg.STATS_FILE_PATH);
            }
            if (!completed)
            {
                CLOG_ERROR(Process, "Replay with --seed {}", cfg.SEED);
                return 1;
            }
            return 0;
        });
}

int
runGenSeed(CommandLineArgs const& args)
{
    return runWithHelp(args, {}, [&] {
        std::cout << randomSeed() << std::endl;
        return 0;
    });
}

int
runVersion(CommandLineArgs const&)
{
    std::cout << NFTSIM_VERSION << std::endl;
    return 0;
}

int
handleCommandLine(int argc, char* const* argv)
{
    auto commandLine = CommandLine{
        {{"gen-seed", "generate and print a random run seed", runGenSeed},
         {"run", "run a randomized NFT workload and print its summary",
          runSimulation},
#ifdef BUILD_TESTS
         {"test", "execute test suite", runTest},
#endif
         {"version", "print version information", runVersion}}};

    auto adjustedCommandLine = commandLine.adjustCommandLine({argc, argv});
    auto command = commandLine.selectCommand(adjustedCommandLine.first);
    bool didDefaultToHelp = command->name() != adjustedCommandLine.first;

    auto exeName = "nftsim";
    auto commandName =
        fmt::format(FMT_STRING("{0} {1}"), exeName, command->name());
    auto args = CommandLineArgs{exeName, commandName, command->description(),
                                adjustedCommandLine.second};

    try
    {
        int res = command->run(args);
        return didDefaultToHelp ? 1 : res;
    }
    catch (std::exception& e)
    {
        LOG_FATAL(DEFAULT_LOG, "Got an exception: {}", e.what());
        return 1;
    }
}
}
