#pragma once

#include "recipe_spec.h"

#include <string>
#include <vector>

namespace sous {

// Dependency cycles among `steps`, one per DFS back-edge. Each cycle lists its
// members in edge order and repeats the first member at the end ("a", "b", "a").
// Edges to unknown step names are ignored.
std::vector<std::vector<std::string>> plan_find_cycles(std::vector<step_spec> const &steps);

// Steps sorted by ascending idx (stable). depends_on never reorders.
std::vector<step_spec const *> plan_execution_order(std::vector<step_spec> const &steps);

// Kahn layering: layer N holds steps whose dependencies all sit in earlier layers,
// ordered by idx within a layer. Throws std::runtime_error if the graph has a cycle.
std::vector<std::vector<std::string>> plan_dependency_layers(
    std::vector<step_spec> const &steps);

}  // namespace sous
