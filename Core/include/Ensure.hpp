#pragma once

#include "Exception.hpp"
#include "Logger.hpp"

#include <utility>

namespace DnD {

template <typename... Args>
void ensure(bool condition, fmt::format_string<Args...> message,
            Args &&...args) {
  if (!condition) {
    auto formatted_message = fmt::format(message, std::forward<Args>(args)...);
    error("{}", formatted_message);
    throw BaseException{formatted_message};
  }
}

} // namespace DnD
