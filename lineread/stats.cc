#include "lineread/stats.hh"

#include <iomanip>
#include <ostream>

namespace lineread {

double Stats::LinesPerSecond() const {
  return seconds > 0.0 ? static_cast<double>(lines) / seconds : 0.0;
}

double Stats::MegabytesPerSecond() const {
  return seconds > 0.0 ? static_cast<double>(bytes) / (1024.0 * 1024.0) / seconds : 0.0;
}

std::ostream &operator<<(std::ostream &out, const Stats &stats) {
  std::ios_base::fmtflags flags = out.flags();
  std::streamsize precision = out.precision();
  out << stats.file
      << "\tmode=" << (stats.strategy.empty() ? "unstarted" : stats.strategy)
      << "\tlines=" << stats.lines
      << "\tbytes=" << stats.bytes
      << std::fixed << std::setprecision(2)
      << "\ttime=" << stats.seconds << 's'
      << std::setprecision(0) << "\tlines/s=" << stats.LinesPerSecond()
      << std::setprecision(2) << "\tMB/s=" << stats.MegabytesPerSecond();
  out.flags(flags);
  out.precision(precision);
  return out;
}

} // namespace lineread
