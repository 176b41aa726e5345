#include "procvisor/pipe.hpp"

#include <unistd.h>

#include <array>
#include <cerrno>
#include <memory>
#include <utility>

#include "procvisor/internal/fd.hpp"

namespace procvisor {

namespace {

constexpr std::size_t kPipeBufferSize = 8192;

}  // namespace

PipeReader::PipeReader(PipeReader&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

PipeReader& PipeReader::operator=(PipeReader&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
  }
  return *this;
}

PipeReader::~PipeReader() { close(); }

void PipeReader::close() noexcept {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

Stdio PipeReader::into_stdin() && { return Stdio::from_pipe(std::move(*this)); }

Result<std::size_t> PipeReader::read_some(void* data, std::size_t n) const {
  if (fd_ < 0) {
    return Error{.code = make_error_code(errc::invalid_stdio), .context = "read"};
  }
  while (true) {
    ssize_t rv = ::read(fd_, data, n);
    if (rv >= 0) {
      return static_cast<std::size_t>(rv);
    }
    if (errno != EINTR) {
      return internal::errno_error("read");
    }
  }
}

Result<std::string> PipeReader::read_all() const {
  std::string out;
  std::array<char, kPipeBufferSize> buffer{};
  while (true) {
    auto count = read_some(buffer.data(), buffer.size());
    if (!count) {
      return count.error();
    }
    if (count.value() == 0) {
      return out;
    }
    out.append(buffer.data(), count.value());
  }
}

Stdio Stdio::from_pipe(PipeReader reader) {
  return Stdio{Pipe{std::make_shared<PipeReader>(std::move(reader))}};
}

PipeWriter::PipeWriter(PipeWriter&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

PipeWriter& PipeWriter::operator=(PipeWriter&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
  }
  return *this;
}

PipeWriter::~PipeWriter() { close(); }

void PipeWriter::close() noexcept {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

Result<std::size_t> PipeWriter::write_some(const void* data, std::size_t n) const {
  if (fd_ < 0) {
    return Error{.code = make_error_code(errc::invalid_stdio), .context = "write"};
  }
  while (true) {
    ssize_t rv = ::write(fd_, data, n);
    if (rv >= 0) {
      return static_cast<std::size_t>(rv);
    }
    if (errno != EINTR) {
      return internal::errno_error("write");
    }
  }
}

Result<void> PipeWriter::write_all(std::string_view data) const {
  std::size_t offset = 0;
  while (offset < data.size()) {
    auto written = write_some(data.data() + offset, data.size() - offset);
    if (!written) {
      return written.error();
    }
    if (written.value() == 0) {
      return Error{.code = make_error_code(errc::write_failed), .context = "write"};
    }
    offset += written.value();
  }
  return {};
}

}  // namespace procvisor
