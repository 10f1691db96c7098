#include "TrainRunner.h"
#include "core/ConfigLoader.h"
#include "core/LoggingChannels.h"
#include "core/ReflectSerializer.h"
#include "core/evolution/EvolutionConfig.h"
#include "core/evolution/Genome.h"
#include "core/evolution/OperatorRegistry.h"
#include "core/evolution/PhenotypeDecoder.h"
#include "core/evolution/RandomStreams.h"
#include "core/evolution/SeedParser.h"
#include <args.hxx>
#include <chrono>
#include <csignal>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace GeneticCars;

namespace {

constexpr const char* EVOLUTION_CONFIG_FILE = "evolution.json";

// CLI-specific commands.
struct CliCommandInfo {
    std::string name;
    std::string description;
};

const std::vector<CliCommandInfo> CLI_COMMANDS = {
    { "decode", "Decode a genome into its vehicle definition" },
    { "train", "Run evolution with the headless evaluator" },
};

std::string getCommandListHelp()
{
    std::string help = "Command:\n";
    for (const auto& cmd : CLI_COMMANDS) {
        help += "  " + cmd.name + " - " + cmd.description + "\n";
    }
    return help;
}

// Built-in names accepted by crossoverOperator and mutationOperator in evolution.json.
std::string getOperatorListHelp()
{
    const OperatorRegistry registry = OperatorRegistry::createDefault();
    auto join = [](const std::vector<std::string>& names) {
        std::string joined;
        for (const auto& name : names) {
            joined += (joined.empty() ? "" : ", ") + name;
        }
        return joined;
    };

    std::string help = "Built-in operators:\n";
    help += "  crossover: " + join(registry.crossoverNames()) + "\n";
    help += "  mutation: " + join(registry.mutationNames()) + "\n";
    return help;
}

std::string getExamplesHelp()
{
    std::string examples = "Examples:\n";
    examples += "  geneticcars-cli train --seed dunes --generations 50\n";
    examples += "  geneticcars-cli train --seed '\\x2a' --operators ./libgeneticcars-crossover-flip.so\n";
    examples += "  geneticcars-cli decode --seed '\\d42'\n";
    examples += "  geneticcars-cli decode --genome 0101...\n";
    examples += "  geneticcars-cli train -v --log-channels 'operators:trace,*:info'\n";
    return examples;
}

// Empty seed text falls back to the current date and time, as the original UI did.
std::string defaultSeedText()
{
    const auto now = std::chrono::system_clock::now();
    const std::time_t time = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&time, &local);
    std::ostringstream stream;
    stream << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return stream.str();
}

std::optional<EvolutionConfig> loadEvolutionConfig()
{
    auto result = ConfigLoader::loadOrDefault<EvolutionConfig>(EVOLUTION_CONFIG_FILE);
    if (result.isError()) {
        std::cerr << "Error: " << result.errorValue() << std::endl;
        return std::nullopt;
    }
    return result.value();
}

Client::TrainRunner* g_runner = nullptr;

void sigintHandler(int)
{
    if (g_runner) {
        std::cerr << "\n[Ctrl+C detected - stopping training gracefully...]\n" << std::flush;
        g_runner->requestStop();
    }
}

} // namespace

int main(int argc, char** argv)
{
    // Console logs go to stderr so stdout carries only JSON.
    LoggingChannels::initialize(spdlog::level::info, spdlog::level::debug, "cli", true);

    args::ArgumentParser parser(
        "Genetic Cars CLI",
        "Evolve procedurally generated vehicles without the physics harness.\n\n"
            + getOperatorListHelp() + "\n" + getExamplesHelp());

    args::HelpFlag help(parser, "help", "Display this help menu", { 'h', "help" });
    args::Flag verbose(parser, "verbose", "Enable debug logging", { 'v', "verbose" });
    args::ValueFlag<std::string> logChannels(
        parser,
        "spec",
        "Per-channel log levels, e.g. 'evolution:debug,*:warn'",
        { "log-channels" });
    args::ValueFlag<std::string> configDir(
        parser, "dir", "Directory searched first for evolution.json", { "config-dir" });
    args::ValueFlag<std::string> seedText(
        parser,
        "seed",
        "Seed: \\x<hex>, \\d<decimal>, or any text (default: current date and time)",
        { 's', "seed" });
    args::ValueFlag<int> generations(
        parser, "count", "Train: generations to evaluate (default: 10)", { 'g', "generations" }, 10);
    args::ValueFlag<std::string> operatorModule(
        parser, "path", "Train: operator module overriding the config", { "operators" });
    args::ValueFlag<std::string> genomeBits(
        parser, "bits", "Decode: genome as a string of 0 and 1", { "genome" });

    args::Positional<std::string> command(parser, "command", getCommandListHelp());

    try {
        parser.ParseCLI(argc, argv);
    }
    catch (const args::Help&) {
        std::cout << parser;
        return 0;
    }
    catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    // Configure logging.
    if (verbose) {
        LoggingChannels::setConsoleLevel(spdlog::level::debug);
        spdlog::set_level(spdlog::level::debug);
    }
    if (logChannels) {
        auto logResult = LoggingChannels::configureFromString(args::get(logChannels));
        if (logResult.isError()) {
            std::cerr << "Error: " << logResult.errorValue() << std::endl;
            return 1;
        }
    }

    if (!command) {
        std::cerr << "Error: command is required\n\n";
        std::cerr << parser;
        return 1;
    }

    if (configDir) {
        ConfigLoader::setConfigDir(args::get(configDir));
    }

    auto config = loadEvolutionConfig();
    if (!config) {
        return 1;
    }
    if (operatorModule) {
        config->operatorModule = args::get(operatorModule);
    }

    const std::string seedInput =
        seedText && !args::get(seedText).empty() ? args::get(seedText) : defaultSeedText();
    auto seedResult = parseSeed(seedInput);
    if (seedResult.isError()) {
        std::cerr << "Error: " << seedResult.errorValue() << std::endl;
        return 1;
    }
    const uint64_t seed = seedResult.value();
    SLOG_INFO("Seed '{}' -> {}", seedInput, seed);

    const std::string commandName = args::get(command);

    if (commandName == "train") {
        const int generationCount = args::get(generations);
        if (generationCount < 1) {
            std::cerr << "Error: --generations must be at least 1" << std::endl;
            return 1;
        }

        Client::TrainRunner runner;
        g_runner = &runner;
        auto oldHandler = std::signal(SIGINT, sigintHandler);

        auto results = runner.run(*config, seed, generationCount);

        std::signal(SIGINT, oldHandler);
        g_runner = nullptr;

        // Output results as JSON to stdout.
        nlohmann::json output = ReflectSerializer::to_json(results);
        output["config"] = *config;
        output["highScores"] = nlohmann::json::array();
        for (const auto& entry : runner.highScores()) {
            nlohmann::json j = entry;
            j["text"] = entry.toString();
            output["highScores"].push_back(j);
        }
        std::cout << output.dump(2) << std::endl;

        return results.completed ? 0 : 1;
    }

    if (commandName == "decode") {
        auto valid = validateEvolutionConfig(*config);
        if (valid.isError()) {
            std::cerr << "Error: " << valid.errorValue().toString() << std::endl;
            return 1;
        }

        const PhenotypeDecoder decoder(GenomeLayout(config->bodyPointCount, config->wheelCount));

        Genome genome;
        if (genomeBits) {
            auto parsed = Genome::fromString(args::get(genomeBits));
            if (parsed.isError()) {
                std::cerr << "Error: " << parsed.errorValue() << std::endl;
                return 1;
            }
            genome = parsed.value();
        }
        else {
            // Same genome the engine would give individual 0 of generation 1.
            auto rng = deriveStream(seed, 1, 0, StreamPurpose::Initial);
            genome = Genome::random(decoder.genomeLength(), rng);
        }

        auto decoded = decoder.decode(genome);
        if (decoded.isError()) {
            std::cerr << "Error: " << decoded.errorValue().toString() << std::endl;
            return 1;
        }

        nlohmann::json output;
        output["genome"] = genome;
        output["bits"] = genome.size();
        output["vehicle"] = decoded.value();
        std::cout << output.dump(2) << std::endl;
        return 0;
    }

    std::cerr << "Error: unknown command '" << commandName << "'\n\n";
    std::cerr << getCommandListHelp();
    return 1;
}
