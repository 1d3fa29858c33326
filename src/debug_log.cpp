#include "debug_log.hpp"
#include "config.hpp"
#include "posix_fd.hpp"
#include <cstdlib>
#include <ctime>

static const char* log_path() {
  const char* p = std::getenv(MP_LOG_ENV);
  return (p && *p) ? p : nullptr;
}

void debug_log(const std::string& line) {
  const char* p = log_path();
  if (!p) return;
  UniqueFd fd = UniqueFd::open_path(p, O_WRONLY | O_CREAT | O_APPEND);
  if (!fd.valid()) return;
  char stamp[32];
  std::time_t now = std::time(nullptr);
  std::tm tmv{};
  localtime_r(&now, &tmv);
  size_t k = std::strftime(stamp, sizeof(stamp), "%H:%M:%S ", &tmv);
  std::string rec(stamp, k);
  rec += line;
  rec += '\n';
  // best-effort
  size_t off = 0;
  while (off < rec.size()) {
    ssize_t w = ::write(fd.get(), rec.data() + off, rec.size() - off);
    if (w < 0 && errno == EINTR) continue;
    if (w <= 0) return;
    off += static_cast<size_t>(w);
  }
}
