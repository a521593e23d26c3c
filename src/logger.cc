#include "logger.hh"

namespace tcombine {

inline namespace detail_v1 {

namespace {

constexpr std::string_view lv_tag(const log_lv lv) noexcept {
  switch (lv) {
    case log_lv::dbg:
      return "[dbg] ";
    case log_lv::info:
      return "[log] ";
    case log_lv::warn:
      return "[warn] ";
    case log_lv::err:
      return "[err] ";
  }
  return "";
}

}  // namespace

logger_t::line_t::line_t(logger_t *logger, const log_lv lv)
    : _logger(logger) {
  // debug lines are dropped unless verbose
  if (lv == log_lv::dbg && !_logger->verbose()) {
    _logger = nullptr;
    return;
  }
  _buf << lv_tag(lv);
}

logger_t::line_t::~line_t() {
  if (_logger != nullptr) {
    _buf << '\n';
    _logger->write(_buf.view());
  }
}

void logger_t::write(std::string_view line) {
  std::lock_guard lk(_mtx);
  _os.write(line.data(), (std::streamsize)line.size());
  _os.flush();
}

}  // namespace detail_v1

}  // namespace tcombine
