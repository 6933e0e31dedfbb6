#pragma once

#include "Exception.hpp"
#include "Logger.hpp"

#include <fmt/core.h>
#include <string>
#include <string_view>
#include <vulkan/vulkan.h>

namespace DnD {

class VulkanResultException : public BaseException {
public:
  VulkanResultException(VkResult result, const std::string &message)
      : BaseException(message), vulkan_result(result) {}

  [[nodiscard]] auto get_result() const { return vulkan_result; }

private:
  VkResult vulkan_result;
};

auto vk_result_to_string(VkResult result) -> std::string_view;

template <typename... Args>
void verify(VkResult result, std::string_view function_name,
            fmt::format_string<Args...> format, Args &&...args) {
  if (result != VK_SUCCESS) {
    const auto message = fmt::format("{} failed with VkResult: {}, {}",
                                      function_name, vk_result_to_string(result),
                                      fmt::format(format, std::forward<Args>(args)...));
    error("{}", message);
    throw VulkanResultException(result, message);
  }
}

} // namespace DnD

template <> struct fmt::formatter<VkResult> : formatter<std::string_view> {
  auto format(const VkResult &result, format_context &ctx) const
      -> decltype(ctx.out());
};
