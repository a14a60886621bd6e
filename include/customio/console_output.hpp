#pragma once

#include <cstddef>
#include <iostream>
#include <ostream>

namespace customio {

// User-facing output for the CLI. Results go to `out`; diagnostics go to
// `err` and are gated by the verbosity level
// (0 silent, 1 error, 2 warning, 3 info, 4 debug, 5 trace).
class ConsoleOutput {
  std::ostream &out_;
  std::ostream &err_;
  std::size_t verbosity_;

  class NullBuffer : public std::streambuf {
  protected:
    int overflow(int c) override { return c; }
  };

  std::ostream &gated(std::size_t level) {
    static NullBuffer null_buffer;
    static std::ostream null_stream(&null_buffer);
    return verbosity_ >= level ? err_ : null_stream;
  }

public:
  explicit ConsoleOutput(std::size_t verbosity)
      : out_(std::cout), err_(std::cerr), verbosity_(verbosity) {}
  ConsoleOutput(std::ostream &out, std::ostream &err, std::size_t verbosity)
      : out_(out), err_(err), verbosity_(verbosity) {}

  std::size_t verbosity() const { return verbosity_; }

  // Command results; printed regardless of verbosity.
  std::ostream &out() { return out_; }

  std::ostream &error() { return gated(1); }
  std::ostream &warning() { return gated(2); }
  std::ostream &info() { return gated(3); }
  std::ostream &debug() { return gated(4); }
  std::ostream &trace() { return gated(5); }
};

} // namespace customio
