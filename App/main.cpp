#include "ClientApp.hpp"

#define DND_ENTRY
#include "Entry.hpp"

auto DnD::make_application(const DnD::ApplicationProperties &props)
    -> DnD::Scope<DnD::App, DnD::AppDeleter> {
  return DnD::make_scope<ClientApp, DnD::AppDeleter>(props);
}
