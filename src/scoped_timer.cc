#include "ruta/scoped_timer.h"

#include "ruta/logging.h"

namespace ruta {

scoped_timer::scoped_timer(std::string name)
    : name_{std::move(name)}, start_{std::chrono::steady_clock::now()} {
  log(log_lvl::debug, name_.c_str(), "starting {}", name_);
}

scoped_timer::~scoped_timer() {
  using namespace std::chrono;
  auto const stop = steady_clock::now();
  auto const t =
      static_cast<double>(duration_cast<microseconds>(stop - start_).count()) /
      1000.0;
  log(log_lvl::debug, name_.c_str(), "finished {} {}ms", name_, t);
}

}  // namespace ruta
