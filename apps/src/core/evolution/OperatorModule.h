#pragma once

#include "EvolutionError.h"
#include "GeneticOperators.h"
#include "OperatorModuleAbi.h"
#include "core/Result.h"

#include <filesystem>
#include <memory>
#include <string>

namespace GeneticCars {

/**
 * @brief RAII handle on a dlopen()ed operator module.
 *
 * Operators created from the module hold a shared reference to it, so the library stays
 * mapped for as long as any of them is alive.
 */
class OperatorModule : public std::enable_shared_from_this<OperatorModule> {
public:
    ~OperatorModule();

    OperatorModule(const OperatorModule&) = delete;
    OperatorModule& operator=(const OperatorModule&) = delete;

    // ConfigurationError when the library cannot be opened.
    static Result<std::shared_ptr<OperatorModule>, EvolutionError> load(
        const std::filesystem::path& path);

    const std::filesystem::path& path() const { return path_; }
    bool hasCrossover() const { return crossoverFn_ != nullptr; }
    bool hasMutation() const { return mutateFn_ != nullptr; }

    // ConfigurationError when the module does not export the role's symbol.
    Result<std::shared_ptr<const CrossoverOperator>, EvolutionError> crossoverOperator() const;
    Result<std::shared_ptr<const MutationOperator>, EvolutionError> mutationOperator() const;

private:
    OperatorModule(std::filesystem::path path, void* handle);

    std::filesystem::path path_;
    void* handle_ = nullptr;
    GeneticCarsCrossoverFn crossoverFn_ = nullptr;
    GeneticCarsMutateFn mutateFn_ = nullptr;
};

} // namespace GeneticCars
