#ifndef __UMICLUST_INTERRUPT_SIGNALS_HPP__
#define __UMICLUST_INTERRUPT_SIGNALS_HPP__

#include <atomic>
#include <signal.h>

// Routes SIGINT and SIGTERM to a flag that long running steps poll, instead
// of killing the process while outputs are half written. reset() restores
// the previous handlers.
struct InterruptSignals {
  struct sigaction actionInt, actionTerm;

  void setup();
  void reset();

  static const std::atomic<bool>& interrupted();
};

#endif // __UMICLUST_INTERRUPT_SIGNALS_HPP__
