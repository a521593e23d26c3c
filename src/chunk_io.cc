#include "chunk_io.hh"

#include <stdlib.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <system_error>
#include <utility>

#include "error.hh"

namespace tcombine {

inline namespace detail_v1 {

namespace {

inline std::error_code last_error() noexcept {
  return {errno, std::generic_category()};
}

}  // namespace

chunk_reader_t::chunk_reader_t(file_entry_t file_entry,
                               const std::size_t chunk_sz)
    : _file_entry(std::move(file_entry)), _buf(chunk_sz) {
  std::error_code ec;
  const auto cur_sz = std::filesystem::file_size(path(), ec);
  if (ec) {
    throw io_error_t("can't stat", path(), ec);
  }
  if (cur_sz != size()) {
    throw size_mismatch_error_t(path(), size(), cur_sz);
  }
  _file_stream.open(path(), std::ios::binary);
  if (!_file_stream.is_open()) {
    throw io_error_t("can't open", path(), last_error());
  }
}

void chunk_reader_t::throw_short_read(const uint64_t got) const {
  if (_file_stream.bad()) {
    throw io_error_t("read error", path(), last_error());
  }
  // hit eof early, the file was truncated
  std::error_code ec;
  auto cur_sz = std::filesystem::file_size(path(), ec);
  throw size_mismatch_error_t(path(), size(), ec ? got : cur_sz);
}

std::span<const uint8_t> chunk_reader_t::next() {
  const auto want = std::min((uint64_t)_buf.size(), size() - _offset);
  if (want == 0) {
    // the file must not have grown either
    if (_file_stream.peek() != std::ifstream::traits_type::eof()) {
      std::error_code ec;
      auto cur_sz = std::filesystem::file_size(path(), ec);
      throw size_mismatch_error_t(path(), size(), ec ? size() + 1 : cur_sz);
    }
    return {};
  }
  _file_stream.read(_buf.data(), (std::streamsize)want);
  const auto got = (uint64_t)_file_stream.gcount();
  if (got != want) {
    throw_short_read(_offset + got);
  }
  _offset += got;
  return {reinterpret_cast<const uint8_t *>(_buf.data()), got};
}

chunk_writer_t::chunk_writer_t(std::filesystem::path path, int fd) noexcept
    : _path(std::move(path)), _fd(fd) {}

chunk_writer_t::~chunk_writer_t() noexcept {
  // only reached open on error paths, the content is discarded
  if (_fd >= 0) {
    ::close(_fd);
  }
}

chunk_writer_t::chunk_writer_t(chunk_writer_t &&rhs) noexcept
    : _path(std::move(rhs._path)),
      _fd(std::exchange(rhs._fd, -1)),
      _written(std::exchange(rhs._written, 0)) {}

chunk_writer_t &chunk_writer_t::operator=(chunk_writer_t &&rhs) noexcept {
  if (this != &rhs) {
    if (_fd >= 0) {
      ::close(_fd);
    }
    _path = std::move(rhs._path);
    _fd = std::exchange(rhs._fd, -1);
    _written = std::exchange(rhs._written, 0);
  }
  return *this;
}

void chunk_writer_t::write(std::span<const uint8_t> data) {
  if (_fd < 0) {
    throw io_error_t("write to closed file", _path,
                     std::make_error_code(std::errc::bad_file_descriptor));
  }
  while (!data.empty()) {
    const auto ret = ::write(_fd, data.data(), data.size());
    if (ret < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw io_error_t("write error", _path, last_error());
    }
    data = data.subspan((std::size_t)ret);
    _written += (uint64_t)ret;
  }
}

void chunk_writer_t::close() {
  if (_fd < 0) {
    return;
  }
  if (::fsync(_fd) != 0) {
    throw io_error_t("fsync error", _path, last_error());
  }
  // a failed close must not be retried
  const auto fd = std::exchange(_fd, -1);
  if (::close(fd) != 0) {
    throw io_error_t("close error", _path, last_error());
  }
}

temp_file_t::temp_file_t(const std::filesystem::path &dir,
                         const std::string &basename, logger_t &log)
    : _log(log) {
  auto tmpl = (dir / ("." + basename + std::string(config::tmp_infix) +
                      "XXXXXX"))
                  .string();
  const auto fd = ::mkstemp(tmpl.data());
  if (fd < 0) {
    throw io_error_t("can't create temp file", tmpl, last_error());
  }
  _path = tmpl;
  _writer = chunk_writer_t(_path, fd);
}

temp_file_t::~temp_file_t() noexcept {
  if (_persisted) {
    return;
  }
  _writer = chunk_writer_t();
  std::error_code ec;
  std::filesystem::remove(_path, ec);
  if (ec) {
    _log.warn() << "can't remove temp file: " << _path << " - "
                << ec.message();
  }
}

void temp_file_t::finish() { _writer.close(); }

void temp_file_t::persist(const std::filesystem::path &dest,
                          const std::filesystem::perms perms) {
  finish();
  std::error_code ec;
  std::filesystem::permissions(_path, perms,
                               std::filesystem::perm_options::replace, ec);
  if (ec) {
    throw io_error_t("can't set permissions", _path, ec);
  }
  std::filesystem::rename(_path, dest, ec);
  if (ec) {
    throw io_error_t("can't rename onto " + dest.string(), _path, ec);
  }
  _persisted = true;
}

void copy_chunks(chunk_reader_t &src, chunk_writer_t &dst,
                 const std::filesystem::path &dest,
                 const progress_fn &progress) {
  for (auto chunk = src.next(); !chunk.empty(); chunk = src.next()) {
    dst.write(chunk);
    if (progress) {
      progress(dest, dst.written(), src.size());
    }
  }
}

}  // namespace detail_v1

}  // namespace tcombine
