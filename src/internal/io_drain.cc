#include "procvisor/internal/io_drain.hpp"

#include <poll.h>
#include <unistd.h>

#include <array>
#include <cerrno>

#include "procvisor/internal/fd.hpp"

namespace procvisor::internal {

namespace {

constexpr std::size_t kReadChunk = 8192;

struct Stream {
  PipeReader* pipe = nullptr;
  std::string* sink = nullptr;

  [[nodiscard]] bool open() const { return pipe != nullptr && pipe->is_open(); }
};

enum class ReadState { pending, eof };

// Read whatever is buffered right now. The descriptor is non-blocking.
Result<ReadState> read_available(Stream& stream) {
  std::array<char, kReadChunk> chunk{};
  while (true) {
    ssize_t count = ::read(stream.pipe->native_handle(), chunk.data(), chunk.size());
    if (count > 0) {
      stream.sink->append(chunk.data(), static_cast<std::size_t>(count));
      continue;
    }
    if (count == 0) {
      stream.pipe->close();
      return ReadState::eof;
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return ReadState::pending;
    }
    return errno_error("read");
  }
}

}  // namespace

Result<DrainResult> drain_pipes(PipeReader* stdout_pipe, PipeReader* stderr_pipe) {
  DrainResult result;
  std::array<Stream, 2> streams{Stream{stdout_pipe, &result.stdout_data},
                                Stream{stderr_pipe, &result.stderr_data}};

  for (auto& stream : streams) {
    if (!stream.open()) {
      continue;
    }
    auto nonblocking = set_nonblocking(stream.pipe->native_handle());
    if (!nonblocking) {
      return nonblocking.error();
    }
  }

  while (true) {
    std::array<pollfd, 2> watched{};
    std::array<Stream*, 2> owners{};
    nfds_t count = 0;
    for (auto& stream : streams) {
      if (!stream.open()) {
        continue;
      }
      watched[count] = pollfd{stream.pipe->native_handle(), POLLIN, 0};
      owners[count] = &stream;
      ++count;
    }
    if (count == 0) {
      return result;
    }

    if (::poll(watched.data(), count, -1) == -1) {
      if (errno == EINTR) {
        continue;
      }
      return errno_error("poll");
    }

    for (nfds_t i = 0; i < count; ++i) {
      if ((watched[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
        continue;
      }
      auto state = read_available(*owners[i]);
      if (!state) {
        return state.error();
      }
    }
  }
}

}  // namespace procvisor::internal
