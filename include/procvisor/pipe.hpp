#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "procvisor/result.hpp"
#include "procvisor/stdio.hpp"

namespace procvisor {

/// @brief Read end of a pipe owned by procvisor.
class PipeReader {
 public:
  PipeReader() = default;
  /// @brief Adopt a native file descriptor.
  explicit PipeReader(int fd) : fd_(fd) {}
  PipeReader(PipeReader&& other) noexcept;
  PipeReader& operator=(PipeReader&& other) noexcept;
  PipeReader(const PipeReader&) = delete;
  PipeReader& operator=(const PipeReader&) = delete;
  ~PipeReader();

  /// @brief Native file descriptor handle, or -1.
  [[nodiscard]] int native_handle() const noexcept { return fd_; }
  /// @brief True while a descriptor is owned.
  [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
  void close() noexcept;

  /// @brief Hand the descriptor to the next process as its stdin.
  ///
  /// Leaves this reader empty, so the descriptor can be wired only once.
  [[nodiscard]] Stdio into_stdin() &&;

  /// @brief Read all bytes until EOF.
  [[nodiscard]] Result<std::string> read_all() const;
  /// @brief Read up to n bytes into data; 0 means EOF.
  [[nodiscard]] Result<std::size_t> read_some(void* data, std::size_t n) const;

 private:
  int fd_{-1};
};

/// @brief Write end of a pipe owned by procvisor.
class PipeWriter {
 public:
  PipeWriter() = default;
  /// @brief Adopt a native file descriptor.
  explicit PipeWriter(int fd) : fd_(fd) {}
  PipeWriter(PipeWriter&& other) noexcept;
  PipeWriter& operator=(PipeWriter&& other) noexcept;
  PipeWriter(const PipeWriter&) = delete;
  PipeWriter& operator=(const PipeWriter&) = delete;
  ~PipeWriter();

  [[nodiscard]] int native_handle() const noexcept { return fd_; }
  void close() noexcept;

  /// @brief Write all data to the pipe.
  [[nodiscard]] Result<void> write_all(std::string_view data) const;
  /// @brief Write up to n bytes from data.
  [[nodiscard]] Result<std::size_t> write_some(const void* data, std::size_t n) const;

 private:
  int fd_{-1};
};

}  // namespace procvisor
