#include "platform.h"

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <io.h>
#include <windows.h>
#elif defined(__APPLE__)
#include <mach-o/dyld.h>
#include <unistd.h>
#else
#include <unistd.h>
#endif

namespace sous::platform {

#ifdef _WIN32

bool is_tty() { return ::_isatty(::_fileno(stderr)) != 0; }

std::filesystem::path get_exe_path() {
  std::vector<wchar_t> buf(MAX_PATH);
  for (;;) {
    DWORD const len{ ::GetModuleFileNameW(nullptr,
                                          buf.data(),
                                          static_cast<DWORD>(buf.size())) };
    if (len == 0) { throw std::runtime_error("GetModuleFileNameW failed"); }
    if (len < buf.size()) { return std::filesystem::path{ std::wstring{ buf.data(), len } }; }
    buf.resize(buf.size() * 2);
  }
}

#else

bool is_tty() { return ::isatty(::fileno(stderr)) != 0; }

std::filesystem::path get_exe_path() {
#ifdef __APPLE__
  uint32_t size{ 0 };
  _NSGetExecutablePath(nullptr, &size);
  std::vector<char> buf(size);
  if (_NSGetExecutablePath(buf.data(), &size) != 0) {
    throw std::runtime_error("_NSGetExecutablePath failed");
  }
  return std::filesystem::canonical(buf.data());
#else
  std::vector<char> buf(4096);
  ssize_t const len{ ::readlink("/proc/self/exe", buf.data(), buf.size() - 1) };
  if (len == -1) { throw std::runtime_error("readlink(/proc/self/exe) failed"); }
  return std::filesystem::path{ std::string{ buf.data(), static_cast<size_t>(len) } };
#endif
}

#endif

std::optional<std::string> get_env_var(char const *name) {
  if (char const *value{ std::getenv(name) }) { return std::string{ value }; }
  return std::nullopt;
}

}  // namespace sous::platform
