#include "Types.hpp"

#include <catch2/catch_test_macros.hpp>
#include <imgui.h>

#include "common/ImGuiHarness.hpp"
#include "dnd/DragDropStore.hpp"

using namespace DnD;
using Testing::ImGuiHarness;

TEST_CASE("The store hands out one list per id", "[drag_drop_store]") {
  ImGuiHarness harness;
  DragDropStore store;

  harness.frame([&store] {
    auto &first = store.get("children");
    auto &again = store.get("children");
    REQUIRE(&first == &again);

    ImGui::PushID("e");
    auto &nested = store.get("children");
    ImGui::PopID();
    REQUIRE(&nested != &first);

    REQUIRE(&store.get(ImGui::GetID("children")) == &first);
  });

  REQUIRE(store.size() == 2);
  REQUIRE_FALSE(store.any_dragging());
}

TEST_CASE("New lists use the default options", "[drag_drop_store]") {
  ImGuiHarness harness;
  DragDropStore store{DragDropOptions{.draw_drop_preview = false, .margin = 8.0F}};

  const auto &options = store.get(ImGuiID{42}).get_options();
  REQUIRE_FALSE(options.draw_drop_preview);
  REQUIRE(options.margin == 8.0F);

  store.get_default_options().draw_drop_preview = true;
  REQUIRE(store.get(ImGuiID{43}).get_options().draw_drop_preview);
  REQUIRE_FALSE(store.get(ImGuiID{42}).get_options().draw_drop_preview);
}

TEST_CASE("Idle lists are collected", "[drag_drop_store]") {
  ImGuiHarness harness;
  DragDropStore store;

  harness.frame([&store] {
    static_cast<void>(store.get(ImGuiID{1}));
    static_cast<void>(store.get(ImGuiID{2}));
  });

  for (int i = 0; i < 4; ++i) {
    harness.frame([&store] { static_cast<void>(store.get(ImGuiID{2})); });
  }

  REQUIRE(store.collect_garbage(10) == 0);
  REQUIRE(store.collect_garbage(2) == 1);
  REQUIRE(store.size() == 1);
  REQUIRE(store.contains(ImGuiID{2}));
  REQUIRE_FALSE(store.contains(ImGuiID{1}));
}

TEST_CASE("Lists can be reset and cleared", "[drag_drop_store]") {
  ImGuiHarness harness;
  DragDropStore store;

  static_cast<void>(store.get(ImGuiID{7}));
  static_cast<void>(store.get(ImGuiID{8}));

  REQUIRE(store.reset(ImGuiID{7}));
  REQUIRE_FALSE(store.reset(ImGuiID{7}));
  REQUIRE(store.size() == 1);

  store.clear();
  REQUIRE(store.size() == 0);
}
