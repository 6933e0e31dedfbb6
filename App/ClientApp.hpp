#pragma once

#include "App.hpp"
#include "InterfaceSystem.hpp"
#include "Types.hpp"

#include <vector>

#include "widgets/Widget.hpp"

using namespace DnD;

class ClientApp : public App {
public:
  explicit ClientApp(const ApplicationProperties &props);
  ~ClientApp() override = default;

  void on_update(floating ts) override;
  void on_interface(InterfaceSystem &) override;
  void on_create() override;
  void on_destroy() override;

private:
  std::vector<Scope<Widget>> widgets{};

  auto statistics() -> void;
};
