#include "util.h"

#include <cstdio>
#include <ctime>
#include <stdexcept>
#include <string>
#include <utility>

namespace sous {

namespace {

std::tm make_utc_tm(std::time_t time) {
  std::tm result{};

#if defined(_WIN32)
  gmtime_s(&result, &time);
#else
  gmtime_r(&time, &result);
#endif

  return result;
}

std::time_t utc_tm_to_time_t(std::tm *tm) {
#if defined(_WIN32)
  return _mkgmtime(tm);
#else
  return timegm(tm);
#endif
}

std::string_view trim(std::string_view s) {
  auto const start{ s.find_first_not_of(" \t\n\r") };
  if (start == std::string_view::npos) { return {}; }
  return s.substr(start, s.find_last_not_of(" \t\n\r") - start + 1);
}

}  // namespace

std::string util_bytes_to_hex(void const *data, size_t length) {
  static constexpr char hex_chars[] = "0123456789abcdef";

  auto const bytes = static_cast<unsigned char const *>(data);
  std::string result;
  result.reserve(length * 2);

  for (size_t i{}; i < length; ++i) {
    result += hex_chars[(bytes[i] >> 4) & 0xf];
    result += hex_chars[bytes[i] & 0xf];
  }

  return result;
}

void file_deleter::operator()(std::FILE *file) const noexcept {
  if (file) { static_cast<void>(std::fclose(file)); }
}

file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode) {
#if defined(_WIN32)
  std::wstring wide_mode;
  for (char const *p{ mode }; *p != '\0'; ++p) {
    wide_mode.push_back(static_cast<wchar_t>(*p));
  }
  return file_ptr_t{ _wfopen(path.c_str(), wide_mode.c_str()) };
#else
  return file_ptr_t{ std::fopen(path.c_str(), mode) };
#endif
}

std::string util_load_text_file(std::filesystem::path const &path) {
  auto file{ util_open_file(path, "rb") };
  if (!file) {
    throw std::runtime_error("util_load_text_file: failed to open file: " + path.string());
  }

  std::string text;
  char buf[4096];
  for (;;) {
    size_t const n{ std::fread(buf, 1, sizeof buf, file.get()) };
    text.append(buf, n);
    if (n < sizeof buf) {
      if (std::ferror(file.get())) {
        throw std::runtime_error("util_load_text_file: failed to read file: " +
                                 path.string());
      }
      break;
    }
  }

  return text;
}

void util_write_text_file(std::filesystem::path const &path, std::string_view text) {
  if (path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      throw std::runtime_error("util_write_text_file: failed to create directory " +
                               path.parent_path().string() + ": " + ec.message());
    }
  }

  auto file{ util_open_file(path, "wb") };
  if (!file) {
    throw std::runtime_error("util_write_text_file: failed to open file: " +
                             path.string());
  }

  if (std::fwrite(text.data(), 1, text.size(), file.get()) != text.size() ||
      std::fflush(file.get()) != 0) {
    throw std::runtime_error("util_write_text_file: failed to write file: " +
                             path.string());
  }
}

std::vector<std::string> util_split_list(std::string_view text, char delimiter) {
  std::vector<std::string> result;
  while (!text.empty()) {
    auto const pos{ text.find(delimiter) };
    auto const token{ trim(text.substr(0, pos)) };
    if (!token.empty()) { result.emplace_back(token); }
    text = (pos == std::string_view::npos) ? std::string_view{} : text.substr(pos + 1);
  }
  return result;
}

std::string util_join(std::vector<std::string> const &items, std::string_view separator) {
  std::string result;
  for (size_t i{ 0 }; i < items.size(); ++i) {
    if (i > 0) { result.append(separator); }
    result.append(items[i]);
  }
  return result;
}

std::string util_format_timestamp(std::chrono::system_clock::time_point tp) {
  auto const seconds{ std::chrono::floor<std::chrono::seconds>(tp) };
  auto const millis{
    std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds).count()
  };

  std::time_t const timestamp{ std::chrono::system_clock::to_time_t(seconds) };
  std::tm const utc_tm{ make_utc_tm(timestamp) };

  char base[32]{};
  if (std::strftime(base, sizeof base, "%Y-%m-%dT%H:%M:%S", &utc_tm) == 0) { return {}; }

  char buffer[64]{};
  int const written{ std::snprintf(buffer,
                                   sizeof buffer,
                                   "%s.%03lldZ",
                                   base,
                                   static_cast<long long>(millis)) };
  if (written <= 0) { return {}; }

  return std::string{ buffer, static_cast<std::size_t>(written) };
}

std::chrono::system_clock::time_point util_parse_timestamp(std::string_view text) {
  std::string const str{ text };
  int year{ 0 }, month{ 0 }, day{ 0 }, hour{ 0 }, minute{ 0 }, second{ 0 }, millis{ 0 };
  char zone{ '\0' };

  int const fields{ std::sscanf(str.c_str(),
                                "%4d-%2d-%2dT%2d:%2d:%2d.%3d%c",
                                &year,
                                &month,
                                &day,
                                &hour,
                                &minute,
                                &second,
                                &millis,
                                &zone) };
  if (fields != 8 || zone != 'Z') {
    throw std::runtime_error("util_parse_timestamp: malformed timestamp: " + str);
  }

  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_sec = second;

  std::time_t const seconds_since_epoch{ utc_tm_to_time_t(&tm) };
  if (seconds_since_epoch == static_cast<std::time_t>(-1)) {
    throw std::runtime_error("util_parse_timestamp: timestamp out of range: " + str);
  }

  return std::chrono::system_clock::from_time_t(seconds_since_epoch) +
         std::chrono::milliseconds{ millis };
}

std::chrono::steady_clock::duration util_seconds_to_duration(double seconds) {
  using steady_duration = std::chrono::steady_clock::duration;
  constexpr auto kMax{ std::chrono::duration_cast<steady_duration>(kUtilMaxWait) };
  if (!(seconds > 0.0)) { return steady_duration::zero(); }
  if (seconds >= std::chrono::duration<double>(kMax).count()) { return kMax; }
  return std::chrono::duration_cast<steady_duration>(std::chrono::duration<double>(seconds));
}

std::string util_format_seconds(double seconds) {
  char buffer[64]{};
  int const written{ std::snprintf(buffer, sizeof buffer, "%.3fs", seconds) };
  if (written <= 0) { return {}; }
  return std::string{ buffer, static_cast<std::size_t>(written) };
}

}  // namespace sous
