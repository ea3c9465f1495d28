#include "InterruptSignals.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

namespace {
std::atomic<bool> done{false};
void term_handler(int) { done.store(true); }

void cpperror(const char* msg) {
  std::string err(msg);
  err += ": ";
  err += strerror(errno);
  throw std::runtime_error(err);
}
} // namespace

void InterruptSignals::setup() {
  struct sigaction act;
  memset(&act, '\0', sizeof(act));
  act.sa_handler = term_handler;
  if (sigaction(SIGINT, &act, &actionInt) == -1 ||
      sigaction(SIGTERM, &act, &actionTerm) == -1)
    cpperror("Error redirecting termination signals");
}

void InterruptSignals::reset() {
  sigaction(SIGINT, &actionInt, nullptr);
  sigaction(SIGTERM, &actionTerm, nullptr);
}

const std::atomic<bool>& InterruptSignals::interrupted() { return done; }
