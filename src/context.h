#pragma once

#include "util.h"
#include "value.h"

#include "nlohmann/json.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace sous {

struct change_record {
  std::uint64_t sequence;  // monotonically increasing per context
  std::string key;
  value old_value;
  value new_value;
  std::string who;
  std::string operation;  // "set" or "merge"
  std::chrono::system_clock::time_point timestamp;
};

// Opaque persistence target a context can flush dirty keys into.
class context_store {
 public:
  virtual ~context_store() = default;
  virtual void put(std::string const &key, value const &val) = 0;
};

class memory_context_store : public context_store {
 public:
  void put(std::string const &key, value const &val) override;

  std::optional<value> find(std::string const &key) const;
  std::size_t size() const;

 private:
  mutable std::mutex mutex_;
  value_table values_;
};

enum class merge_strategy { last_wins, first_wins, error };

// Shared, attributed key/value store. All members are safe to call concurrently.
class context : unmovable {
 public:
  context() = default;

  value get(std::string const &key, value default_value = {}) const;
  bool contains(std::string const &key) const;

  // No-op when `val` equals the current value.
  void set(std::string const &key, value val, std::string const &who);

  std::vector<std::string> keys() const;  // sorted
  std::size_t size() const;
  value_table snapshot() const;

  std::vector<change_record> history() const;
  std::vector<change_record> history_since(std::uint64_t sequence) const;
  std::uint64_t next_sequence() const;
  std::size_t clear_history();

  std::vector<std::string> pop_dirty_keys();

  // Copies every key of `other` (optionally as "prefix.key"). The error strategy
  // throws std::runtime_error naming the conflicting keys and applies nothing.
  void merge_from(context const &other,
                  merge_strategy strategy = merge_strategy::last_wins,
                  std::string const &prefix = {});

  // Writes dirty keys to `store` and clears them; returns the number written.
  std::size_t flush(context_store &store);

  nlohmann::json to_json() const;
  static std::shared_ptr<context> from_json(nlohmann::json const &json);

 private:
  void set_locked(std::string const &key,
                  value val,
                  std::string const &who,
                  char const *operation);

  mutable std::mutex mutex_;
  value_table values_;
  std::vector<change_record> history_;
  std::set<std::string> dirty_;
  std::uint64_t next_sequence_{ 0 };
};

std::string merge_strategy_name(merge_strategy strategy);
merge_strategy merge_strategy_parse(std::string_view name);

}  // namespace sous
