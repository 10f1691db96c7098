#include "OperatorModule.h"

#include "core/LoggingChannels.h"

#include <dlfcn.h>
#include <stdexcept>

namespace GeneticCars {

namespace {

uint64_t drawModuleSeed(std::mt19937& rng)
{
    const uint64_t high = rng();
    const uint64_t low = rng();
    return (high << 32) | low;
}

Genome genomeFromModuleOutput(const std::vector<uint8_t>& output, const std::string& role)
{
    auto result = Genome::fromBitValues(output);
    if (result.isError()) {
        throw std::runtime_error(role + " module output: " + result.errorValue());
    }
    return std::move(result.value());
}

class ModuleCrossoverOperator : public CrossoverOperator {
public:
    ModuleCrossoverOperator(std::shared_ptr<const OperatorModule> module, GeneticCarsCrossoverFn fn)
        : module_(std::move(module)), fn_(fn)
    {}

    std::string name() const override { return module_->path().filename().string(); }

    Genome crossover(
        const Genome& a, const Genome& b, double rate, std::mt19937& rng) const override
    {
        const auto aBits = a.toBitValues();
        const auto bBits = b.toBitValues();
        // Pre-filled with an invalid value so untouched bytes are caught by validation.
        std::vector<uint8_t> offspring(a.size(), 0xFF);

        const uint64_t seed = drawModuleSeed(rng);
        const int status =
            fn_(aBits.data(), bBits.data(), aBits.size(), rate, seed, offspring.data());
        if (status != 0) {
            throw std::runtime_error(
                GENETICCARS_CROSSOVER_SYMBOL " returned status " + std::to_string(status));
        }
        return genomeFromModuleOutput(offspring, "Crossover");
    }

private:
    std::shared_ptr<const OperatorModule> module_;
    GeneticCarsCrossoverFn fn_;
};

class ModuleMutationOperator : public MutationOperator {
public:
    ModuleMutationOperator(std::shared_ptr<const OperatorModule> module, GeneticCarsMutateFn fn)
        : module_(std::move(module)), fn_(fn)
    {}

    std::string name() const override { return module_->path().filename().string(); }

    Genome mutate(const Genome& genome, int flipCount, std::mt19937& rng) const override
    {
        const auto bits = genome.toBitValues();
        std::vector<uint8_t> mutant(bits.size(), 0xFF);

        const uint64_t seed = drawModuleSeed(rng);
        const int status = fn_(bits.data(), bits.size(), flipCount, seed, mutant.data());
        if (status != 0) {
            throw std::runtime_error(
                GENETICCARS_MUTATE_SYMBOL " returned status " + std::to_string(status));
        }
        return genomeFromModuleOutput(mutant, "Mutation");
    }

private:
    std::shared_ptr<const OperatorModule> module_;
    GeneticCarsMutateFn fn_;
};

} // namespace

OperatorModule::OperatorModule(std::filesystem::path path, void* handle)
    : path_(std::move(path)), handle_(handle)
{
    crossoverFn_ =
        reinterpret_cast<GeneticCarsCrossoverFn>(dlsym(handle_, GENETICCARS_CROSSOVER_SYMBOL));
    mutateFn_ = reinterpret_cast<GeneticCarsMutateFn>(dlsym(handle_, GENETICCARS_MUTATE_SYMBOL));
}

OperatorModule::~OperatorModule()
{
    if (handle_) {
        LOG_DEBUG(Operators, "Unloading operator module {}", path_.string());
        dlclose(handle_);
    }
}

Result<std::shared_ptr<OperatorModule>, EvolutionError> OperatorModule::load(
    const std::filesystem::path& path)
{
    using R = Result<std::shared_ptr<OperatorModule>, EvolutionError>;

    void* handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle) {
        const char* reason = dlerror();
        LOG_WARN(
            Operators,
            "Failed to load operator module {}: {}",
            path.string(),
            reason ? reason : "unknown error");
        return R::error(
            EvolutionError::configuration(
                "Cannot load operator module " + path.string() + ": "
                + (reason ? reason : "unknown error")));
    }

    std::shared_ptr<OperatorModule> module(new OperatorModule(path, handle));
    LOG_INFO(
        Operators,
        "Loaded operator module {} (crossover: {}, mutation: {})",
        path.string(),
        module->hasCrossover() ? "yes" : "no",
        module->hasMutation() ? "yes" : "no");
    return R::okay(std::move(module));
}

Result<std::shared_ptr<const CrossoverOperator>, EvolutionError> OperatorModule::
    crossoverOperator() const
{
    using R = Result<std::shared_ptr<const CrossoverOperator>, EvolutionError>;
    if (!crossoverFn_) {
        return R::error(
            EvolutionError::configuration(
                path_.string() + " does not export " GENETICCARS_CROSSOVER_SYMBOL));
    }
    return R::okay(std::make_shared<ModuleCrossoverOperator>(shared_from_this(), crossoverFn_));
}

Result<std::shared_ptr<const MutationOperator>, EvolutionError> OperatorModule::mutationOperator()
    const
{
    using R = Result<std::shared_ptr<const MutationOperator>, EvolutionError>;
    if (!mutateFn_) {
        return R::error(
            EvolutionError::configuration(
                path_.string() + " does not export " GENETICCARS_MUTATE_SYMBOL));
    }
    return R::okay(std::make_shared<ModuleMutationOperator>(shared_from_this(), mutateFn_));
}

} // namespace GeneticCars
