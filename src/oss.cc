#include "oss.hh"

#include <atomic>

namespace undup {

inline namespace detail_v1 {

namespace {

std::atomic<std::ostream *> log_os{&std::cerr};

}  // namespace

std::ostream &log_stream() noexcept { return *log_os.load(); }

void set_log_stream(std::ostream &os) noexcept { log_os.store(&os); }

}  // namespace detail_v1

}  // namespace undup
