#include "context.h"

#include "trace.h"
#include "tui.h"

#include <stdexcept>
#include <utility>

namespace sous {

void memory_context_store::put(std::string const &key, value const &val) {
  std::lock_guard const lock(mutex_);
  values_[key] = val;
}

std::optional<value> memory_context_store::find(std::string const &key) const {
  std::lock_guard const lock(mutex_);
  auto const it{ values_.find(key) };
  if (it == values_.end()) { return std::nullopt; }
  return it->second;
}

std::size_t memory_context_store::size() const {
  std::lock_guard const lock(mutex_);
  return values_.size();
}

value context::get(std::string const &key, value default_value) const {
  std::lock_guard const lock(mutex_);
  auto const it{ values_.find(key) };
  return it == values_.end() ? std::move(default_value) : it->second;
}

bool context::contains(std::string const &key) const {
  std::lock_guard const lock(mutex_);
  return values_.contains(key);
}

void context::set(std::string const &key, value val, std::string const &who) {
  std::lock_guard const lock(mutex_);
  set_locked(key, std::move(val), who, "set");
}

void context::set_locked(std::string const &key,
                         value val,
                         std::string const &who,
                         char const *operation) {
  auto const it{ values_.find(key) };
  value old_value{ it == values_.end() ? value{} : it->second };
  if (it != values_.end() && it->second == val) { return; }

  history_.push_back(change_record{ .sequence = next_sequence_++,
                                    .key = key,
                                    .old_value = std::move(old_value),
                                    .new_value = val,
                                    .who = who,
                                    .operation = operation,
                                    .timestamp = std::chrono::system_clock::now() });
  values_[key] = std::move(val);
  dirty_.insert(key);
}

std::vector<std::string> context::keys() const {
  std::lock_guard const lock(mutex_);
  std::vector<std::string> result;
  result.reserve(values_.size());
  for (auto const &[key, _] : values_) { result.push_back(key); }
  return result;
}

std::size_t context::size() const {
  std::lock_guard const lock(mutex_);
  return values_.size();
}

value_table context::snapshot() const {
  std::lock_guard const lock(mutex_);
  return values_;
}

std::vector<change_record> context::history() const {
  std::lock_guard const lock(mutex_);
  return history_;
}

std::vector<change_record> context::history_since(std::uint64_t sequence) const {
  std::lock_guard const lock(mutex_);
  std::vector<change_record> result;
  for (auto const &record : history_) {
    if (record.sequence >= sequence) { result.push_back(record); }
  }
  return result;
}

std::uint64_t context::next_sequence() const {
  std::lock_guard const lock(mutex_);
  return next_sequence_;
}

std::size_t context::clear_history() {
  std::lock_guard const lock(mutex_);
  auto const cleared{ history_.size() };
  history_.clear();
  return cleared;
}

std::vector<std::string> context::pop_dirty_keys() {
  std::lock_guard const lock(mutex_);
  std::vector<std::string> result{ dirty_.begin(), dirty_.end() };
  dirty_.clear();
  return result;
}

void context::merge_from(context const &other,
                         merge_strategy strategy,
                         std::string const &prefix) {
  if (&other == this) { throw std::logic_error("context::merge_from: cannot merge into self"); }

  auto const incoming{ other.snapshot() };
  std::string const who{ "merge:" + (prefix.empty() ? std::string{ "context" } : prefix) };

  std::lock_guard const lock(mutex_);

  auto const target_key{ [&](std::string const &key) {
    return prefix.empty() ? key : prefix + "." + key;
  } };

  if (strategy == merge_strategy::error) {
    std::vector<std::string> conflicts;
    for (auto const &[key, _] : incoming) {
      if (values_.contains(target_key(key))) { conflicts.push_back(target_key(key)); }
    }
    if (!conflicts.empty()) {
      throw std::runtime_error("context merge conflicts on keys: " +
                               util_join(conflicts, ", "));
    }
  }

  for (auto const &[key, val] : incoming) {
    auto const target{ target_key(key) };
    if (strategy == merge_strategy::first_wins && values_.contains(target)) { continue; }
    set_locked(target, val, who, "merge");
  }
}

std::size_t context::flush(context_store &store) {
  std::lock_guard const lock(mutex_);
  std::size_t written{ 0 };

  for (auto it{ dirty_.begin() }; it != dirty_.end();) {
    auto const found{ values_.find(*it) };
    store.put(*it, found == values_.end() ? value{} : found->second);
    it = dirty_.erase(it);
    ++written;
  }

  SOUS_TRACE_CONTEXT_FLUSHED(written);
  tui::debug("context: flushed %zu keys", written);
  return written;
}

nlohmann::json context::to_json() const {
  return value_to_json(value{ snapshot() });
}

std::shared_ptr<context> context::from_json(nlohmann::json const &json) {
  if (!json.is_object()) {
    throw std::runtime_error("context::from_json: expected a JSON object");
  }

  auto ctx{ std::make_shared<context>() };
  auto loaded{ value_from_json(json) };
  ctx->values_ = std::move(*loaded.get<value_table>());
  return ctx;
}

std::string merge_strategy_name(merge_strategy strategy) {
  switch (strategy) {
    case merge_strategy::last_wins: return "last_wins";
    case merge_strategy::first_wins: return "first_wins";
    case merge_strategy::error: return "error";
  }
  return "unknown";
}

merge_strategy merge_strategy_parse(std::string_view name) {
  if (name == "last_wins") { return merge_strategy::last_wins; }
  if (name == "first_wins") { return merge_strategy::first_wins; }
  if (name == "error") { return merge_strategy::error; }
  throw std::runtime_error("unsupported merge strategy '" + std::string{ name } +
                           "' (expected last_wins, first_wins or error)");
}

}  // namespace sous
