#include "planner.h"

#include "util.h"

#include <algorithm>
#include <cstddef>
#include <functional>
#include <stdexcept>
#include <unordered_map>

namespace sous {

namespace {

enum class mark { white, gray, black };

// Name -> position of the first step carrying it.
std::unordered_map<std::string, std::size_t> index_by_name(
    std::vector<step_spec> const &steps) {
  std::unordered_map<std::string, std::size_t> index;
  for (std::size_t i{ 0 }; i < steps.size(); ++i) {
    if (!steps[i].name.empty()) { index.emplace(steps[i].name, i); }
  }
  return index;
}

}  // namespace

std::vector<std::vector<std::string>> plan_find_cycles(
    std::vector<step_spec> const &steps) {
  auto const index{ index_by_name(steps) };
  std::vector<mark> marks(steps.size(), mark::white);
  std::vector<std::size_t> path;
  std::vector<std::vector<std::string>> cycles;

  std::function<void(std::size_t)> visit{ [&](std::size_t node) {
    marks[node] = mark::gray;
    path.push_back(node);

    for (auto const &dep : steps[node].depends_on) {
      auto const it{ index.find(dep) };
      if (it == index.end()) { continue; }
      auto const next{ it->second };

      if (marks[next] == mark::gray) {
        auto const start{ std::find(path.begin(), path.end(), next) };
        std::vector<std::string> cycle;
        for (auto p{ start }; p != path.end(); ++p) { cycle.push_back(steps[*p].name); }
        cycle.push_back(steps[next].name);
        cycles.push_back(std::move(cycle));
      } else if (marks[next] == mark::white) {
        visit(next);
      }
    }

    path.pop_back();
    marks[node] = mark::black;
  } };

  for (std::size_t i{ 0 }; i < steps.size(); ++i) {
    if (steps[i].name.empty() || index.at(steps[i].name) != i) { continue; }
    if (marks[i] == mark::white) { visit(i); }
  }

  return cycles;
}

std::vector<step_spec const *> plan_execution_order(std::vector<step_spec> const &steps) {
  std::vector<step_spec const *> order;
  order.reserve(steps.size());
  for (auto const &s : steps) { order.push_back(&s); }
  std::stable_sort(order.begin(), order.end(), [](step_spec const *a, step_spec const *b) {
    return a->idx < b->idx;
  });
  return order;
}

std::vector<std::vector<std::string>> plan_dependency_layers(
    std::vector<step_spec> const &steps) {
  auto const index{ index_by_name(steps) };
  auto const order{ plan_execution_order(steps) };

  std::unordered_map<std::string, std::size_t> pending;  // unmet dependency count
  std::unordered_map<std::string, std::vector<std::string>> dependents;
  for (auto const *s : order) {
    std::size_t count{ 0 };
    for (auto const &dep : s->depends_on) {
      if (!index.contains(dep)) { continue; }
      ++count;
      dependents[dep].push_back(s->name);
    }
    pending[s->name] = count;
  }

  std::vector<std::vector<std::string>> layers;
  std::vector<std::string> current;
  for (auto const *s : order) {
    if (pending[s->name] == 0) { current.push_back(s->name); }
  }

  std::size_t placed{ 0 };
  while (!current.empty()) {
    placed += current.size();
    std::vector<std::string> next;
    for (auto const &name : current) {
      for (auto const &dependent : dependents[name]) {
        if (--pending[dependent] == 0) { next.push_back(dependent); }
      }
    }
    std::sort(next.begin(), next.end(), [&](std::string const &a, std::string const &b) {
      return steps[index.at(a)].idx < steps[index.at(b)].idx;
    });
    layers.push_back(std::move(current));
    current = std::move(next);
  }

  if (placed != pending.size()) {
    std::vector<std::string> stuck;
    for (auto const *s : order) {
      if (pending[s->name] != 0) { stuck.push_back(s->name); }
    }
    throw std::runtime_error("plan_dependency_layers: dependency cycle among: " +
                             util_join(stuck, ", "));
  }

  return layers;
}

}  // namespace sous
