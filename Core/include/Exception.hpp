#pragma once

#include "Logger.hpp"

#include <cstddef>
#include <exception>
#include <string>

namespace DnD {

class BaseException : public std::exception {
public:
  explicit BaseException(const std::string &input) : message(input) {
    debug("Exception: {}", input);
  }

  [[nodiscard]] auto what() const noexcept -> const char * override {
    return message.c_str();
  }

private:
  std::string message;
};

class NotFoundException : public BaseException {
public:
  using BaseException::BaseException;
};

class WindowException : public BaseException {
public:
  using BaseException::BaseException;
};

class InvalidIndicesException : public BaseException {
public:
  InvalidIndicesException(std::size_t source, std::size_t target,
                          std::size_t length)
      : BaseException(fmt::format("Failed to move item from index {} to "
                                  "index {}. Sequence has {} elements",
                                  source, target, length)),
        source_index(source), target_index(target), sequence_length(length) {}

  [[nodiscard]] auto get_source() const { return source_index; }
  [[nodiscard]] auto get_target() const { return target_index; }
  [[nodiscard]] auto get_length() const { return sequence_length; }

private:
  std::size_t source_index;
  std::size_t target_index;
  std::size_t sequence_length;
};

} // namespace DnD
