// ============================================================================
// pmc/example_models.hpp - Built-in steppable models
// ============================================================================
//
//   coin   one probabilistic choice: start -> {A: 0.6, B: 0.4}, then absorbing
//   dice   Knuth-Yao die simulated with fair coin flips
//   pump   water tank with a controllable pump that may fail; nondeterministic
//          and probabilistic choices, forwards the failure choice once broken
//
// ============================================================================

#ifndef PMC_EXAMPLE_MODELS_HPP
#define PMC_EXAMPLE_MODELS_HPP

#include "pmc/model.hpp"

#include <memory>
#include <string>
#include <vector>

namespace pmc {

struct ExampleModelInfo {
    std::string name;
    std::string description;
};

const std::vector<ExampleModelInfo>& example_models();

/// Throws std::invalid_argument for an unknown name.
std::unique_ptr<SteppableModel> make_example_model(const std::string& name);

}  // namespace pmc

#endif  // PMC_EXAMPLE_MODELS_HPP
