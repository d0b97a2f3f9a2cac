#pragma once

#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace sous {

template <typename T, typename... Types>
concept one_of = (std::same_as<T, Types> || ...);

struct uncopyable {
  uncopyable() = default;
  uncopyable(uncopyable &&) = default;
  uncopyable &operator=(uncopyable &&) = default;
};

struct unmovable {
  unmovable() = default;
  unmovable(unmovable const &) = delete;
  unmovable &operator=(unmovable const &) = delete;
};

template <typename... Ts>
struct match : Ts... {
  using Ts::operator()...;
};

template <typename... Ts>
match(Ts...) -> match<Ts...>;

// Convert bytes to lowercase hex string
std::string util_bytes_to_hex(void const *data, size_t length);

// RAII file pointer with custom deleter
struct file_deleter {
  void operator()(std::FILE *file) const noexcept;
};
using file_ptr_t = std::unique_ptr<std::FILE, file_deleter>;

// Open file with RAII wrapper. Returns nullptr on failure.
file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode);

// Load entire file into memory as text.
// Throws std::runtime_error if file cannot be opened or read.
std::string util_load_text_file(std::filesystem::path const &path);

// Write text to file, replacing any existing content. Throws std::runtime_error.
void util_write_text_file(std::filesystem::path const &path, std::string_view text);

// Split "a, b,,c" into {"a", "b", "c"}: tokens are trimmed, empty tokens dropped.
std::vector<std::string> util_split_list(std::string_view text, char delimiter = ',');

// Join with separator ("a, b, c").
std::string util_join(std::vector<std::string> const &items, std::string_view separator);

// ISO-8601 UTC timestamp with millisecond precision ("2024-01-02T03:04:05.678Z").
std::string util_format_timestamp(std::chrono::system_clock::time_point tp);

// Inverse of util_format_timestamp. Throws std::runtime_error on malformed input.
std::chrono::system_clock::time_point util_parse_timestamp(std::string_view text);

// Seconds with millisecond precision ("1.250s").
std::string util_format_seconds(double seconds);

// Longest wait the engine schedules; steady_clock::now() plus this cannot overflow.
inline constexpr std::chrono::hours kUtilMaxWait{ 24 * 365 * 100 };

// Seconds as a steady_clock duration clamped to [0, kUtilMaxWait]. NaN maps to 0.
std::chrono::steady_clock::duration util_seconds_to_duration(double seconds);

}  // namespace sous
