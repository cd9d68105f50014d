#include "gitrelay/log.hpp"

namespace gitrelay {

void Logger::log(Level level, std::string_view message) {
  if (!enabled(level)) {
    return;
  }
  std::string_view prefix = "debug: ";
  if (level == Level::Error) {
    prefix = "error: ";
  } else if (level == Level::Info) {
    prefix = "info: ";
  }
  const std::scoped_lock lock(mutex_);
  *out_ << prefix << message << '\n';
  out_->flush();
}

} // namespace gitrelay
