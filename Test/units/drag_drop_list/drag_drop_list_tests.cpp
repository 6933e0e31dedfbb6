#include "Containers.hpp"
#include "Math.hpp"
#include "Types.hpp"

#include <catch2/catch_test_macros.hpp>
#include <imgui.h>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#include "common/ImGuiHarness.hpp"
#include "dnd/DragDropList.hpp"

using namespace DnD;
using Testing::ImGuiHarness;

namespace {

auto draw_row(DragHandle &handle, usize, const std::string &name) -> void {
  handle.ui([] { ImGui::TextUnformatted("::"); });
  ImGui::SameLine();
  ImGui::TextUnformatted(name.c_str());
}

struct ListScene {
  ImGuiHarness harness;
  DragDropList list;
  std::vector<std::string> items;
  DragDropResponse response{};
  bool fail_in_placeholder{false};

  explicit ListScene(std::vector<std::string> names,
                     DragDropOptions options = {})
      : list(options), items(std::move(names)) {
    harness.move_mouse({790.0F, 590.0F});
    harness.warm_up([this] { draw_contents(); });
  }

  auto draw_contents() -> void {
    response = list.list_ui(
        "names", items,
        [this](DragHandle &handle, usize index, const std::string &name) {
          if (fail_in_placeholder && handle.is_placeholder()) {
            throw std::runtime_error("row failed to draw");
          }
          draw_row(handle, index, name);
        });
  }

  auto draw() -> DragDropResponse {
    harness.frame([this] { draw_contents(); });
    return response;
  }

  [[nodiscard]] auto rows() const -> std::vector<Math::Rect> {
    const auto rects = list.item_rects();
    return {rects.begin(), rects.end()};
  }

  // Presses the handle of `index` and returns the response of that frame.
  auto grab(usize index) -> DragDropResponse {
    const auto handle = ImGuiHarness::handle_of(rows().at(index));
    harness.move_mouse(handle);
    draw();
    harness.press_mouse();
    return draw();
  }
};

} // namespace

TEST_CASE("Dragging a row past another completes on release",
          "[drag_drop_list]") {
  ListScene scene{{"a", "b", "c", "d"}};
  const auto rows = scene.rows();
  REQUIRE(rows.size() == 4);

  auto response = scene.grab(0);
  REQUIRE(response.is_dragging());
  REQUIRE(response.indices() == DragIndices{.source = 0, .target = 0});
  REQUIRE(scene.list.is_dragging());

  scene.harness.move_mouse(ImGuiHarness::past_midpoint(rows[2]));
  response = scene.draw();
  REQUIRE(response.indices() == DragIndices{.source = 0, .target = 2});

  // The visual order changed, the target must not.
  response = scene.draw();
  REQUIRE(response.indices() == DragIndices{.source = 0, .target = 2});

  scene.harness.release_mouse();
  response = scene.draw();
  REQUIRE(response.completed_indices() ==
          DragIndices{.source = 0, .target = 2});
  REQUIRE_FALSE(scene.list.is_dragging());

  Container::shift(0, 2, scene.items);
  REQUIRE(scene.items == std::vector<std::string>{"b", "c", "a", "d"});

  REQUIRE(scene.draw().kind() == ResponseKind::NoDrag);
}

TEST_CASE("Dragging upwards", "[drag_drop_list]") {
  ListScene scene{{"a", "b", "c", "d"}};
  const auto rows = scene.rows();

  REQUIRE(scene.grab(3).is_dragging());

  scene.harness.move_mouse(
      {rows[1].min.x + 3.0F, rows[1].center().y - 1.0F});
  scene.draw();
  REQUIRE(scene.draw().indices() == DragIndices{.source = 3, .target = 1});

  scene.harness.release_mouse();
  REQUIRE(scene.draw().completed_indices() ==
          DragIndices{.source = 3, .target = 1});
}

TEST_CASE("Releasing without moving does not reorder", "[drag_drop_list]") {
  ListScene scene{{"a", "b", "c"}};

  const auto response = scene.grab(1);
  REQUIRE(response.indices() == DragIndices{.source = 1, .target = 1});

  scene.harness.release_mouse();
  REQUIRE(scene.draw().kind() == ResponseKind::NoDrag);
  REQUIRE_FALSE(scene.list.is_dragging());
}

TEST_CASE("Releasing outside the list does not reorder", "[drag_drop_list]") {
  ListScene scene{{"a", "b", "c"}};
  const auto rows = scene.rows();

  REQUIRE(scene.grab(0).is_dragging());
  scene.harness.move_mouse(ImGuiHarness::past_midpoint(rows[2]));
  REQUIRE(scene.draw().indices() == DragIndices{.source = 0, .target = 2});

  scene.harness.move_mouse({790.0F, 590.0F});
  REQUIRE(scene.draw().indices() == DragIndices{.source = 0, .target = 0});

  scene.harness.release_mouse();
  REQUIRE(scene.draw().kind() == ResponseKind::NoDrag);
}

TEST_CASE("Escape cancels a drag", "[drag_drop_list]") {
  ListScene scene{{"a", "b", "c", "d"}};
  const auto rows = scene.rows();

  REQUIRE(scene.grab(0).is_dragging());
  scene.harness.move_mouse(ImGuiHarness::past_midpoint(rows[2]));
  REQUIRE(scene.draw().is_dragging());

  scene.harness.key(ImGuiKey_Escape, true);
  REQUIRE(scene.draw().kind() == ResponseKind::NoDrag);
  REQUIRE_FALSE(scene.list.is_dragging());

  scene.harness.key(ImGuiKey_Escape, false);
  scene.harness.release_mouse();
  REQUIRE(scene.draw().kind() == ResponseKind::NoDrag);
  REQUIRE(scene.items == std::vector<std::string>{"a", "b", "c", "d"});
}

TEST_CASE("Losing focus cancels a drag", "[drag_drop_list]") {
  ListScene scene{{"a", "b", "c"}};

  REQUIRE(scene.grab(2).is_dragging());
  scene.harness.focus(false);
  REQUIRE(scene.draw().kind() == ResponseKind::NoDrag);
  REQUIRE_FALSE(scene.list.is_dragging());
}

TEST_CASE("A dragged row that disappears cancels the drag",
          "[drag_drop_list]") {
  ListScene scene{{"a", "b", "c"}};

  REQUIRE(scene.grab(0).is_dragging());
  scene.items.erase(scene.items.begin());

  REQUIRE(scene.draw().kind() == ResponseKind::NoDrag);
  REQUIRE_FALSE(scene.list.is_dragging());
}

TEST_CASE("The source follows the dragged row when the host inserts rows",
          "[drag_drop_list]") {
  ListScene scene{{"a", "b", "c"}};

  REQUIRE(scene.grab(1).is_dragging());
  scene.items.insert(scene.items.begin(), "z");

  const auto response = scene.draw();
  REQUIRE(response.is_dragging());
  REQUIRE(response.indices()->source == 2);
}

TEST_CASE("An empty list never drags", "[drag_drop_list]") {
  ListScene scene{{}};

  REQUIRE(scene.draw().kind() == ResponseKind::NoDrag);
  REQUIRE(scene.list.item_rects().empty());

  scene.harness.press_mouse();
  REQUIRE(scene.draw().kind() == ResponseKind::NoDrag);
  REQUIRE_FALSE(scene.list.is_dragging());
}

TEST_CASE("A list emptied mid drag cancels it", "[drag_drop_list]") {
  ListScene scene{{"a", "b"}};

  REQUIRE(scene.grab(0).is_dragging());
  scene.items.clear();

  REQUIRE(scene.draw().kind() == ResponseKind::NoDrag);
  REQUIRE_FALSE(scene.list.is_dragging());
}

TEST_CASE("Without a drop preview the gap keeps the layout",
          "[drag_drop_list]") {
  ListScene scene{{"a", "b", "c", "d"}, DragDropOptions{.draw_drop_preview = false}};
  const auto rows = scene.rows();

  REQUIRE(scene.grab(0).is_dragging());
  scene.harness.move_mouse(ImGuiHarness::past_midpoint(rows[2]));
  scene.draw();
  REQUIRE(scene.draw().indices() == DragIndices{.source = 0, .target = 2});
  REQUIRE(scene.list.item_rects()[0].height() == rows[0].height());

  scene.harness.release_mouse();
  REQUIRE(scene.draw().completed_indices() ==
          DragIndices{.source = 0, .target = 2});
}

TEST_CASE("Rows are laid out top to bottom inside the list bounds",
          "[drag_drop_list]") {
  ListScene scene{{"a", "b", "c"}};
  const auto rows = scene.rows();
  const auto &bounds = scene.list.bounds();

  for (usize i = 0; i < rows.size(); ++i) {
    REQUIRE(bounds.contains(rows[i].min));
    if (i > 0) {
      REQUIRE(rows[i].min.y > rows[i - 1].max.y);
    }
  }
}

TEST_CASE("Rows are drawn in their drop order while dragging",
          "[drag_drop_list]") {
  const auto check_visual_order = [](DragDropOptions options) {
    ListScene scene{{"a", "b", "c", "d"}, options};
    const auto idle = scene.rows();

    REQUIRE(scene.grab(0).is_dragging());
    scene.harness.move_mouse(ImGuiHarness::past_midpoint(idle[2]));
    scene.draw();
    REQUIRE(scene.draw().indices() == DragIndices{.source = 0, .target = 2});

    // Drawn as b, c, a, d.
    const auto rows = scene.rows();
    REQUIRE(rows[1].min.y < rows[0].min.y);
    REQUIRE(rows[2].min.y < rows[0].min.y);
    REQUIRE(rows[0].min.y < rows[3].min.y);
    REQUIRE(rows[1].min.y == idle[0].min.y);
    REQUIRE(rows[3].min.y == idle[3].min.y);
  };

  SECTION("With a drop preview") {
    check_visual_order(DragDropOptions{.draw_drop_preview = true});
  }

  SECTION("With an empty gap") {
    check_visual_order(DragDropOptions{.draw_drop_preview = false});
  }
}

TEST_CASE("Lists keep drawing after being moved", "[drag_drop_list]") {
  STATIC_REQUIRE_FALSE(std::is_copy_constructible_v<DragDropList>);
  STATIC_REQUIRE(std::is_move_constructible_v<DragDropList>);

  ImGuiHarness harness;
  const std::vector<std::string> items{"a", "b", "c"};
  std::vector<DragDropList> lists;
  lists.emplace_back();

  const auto draw_all = [&] {
    for (usize i = 0; i < lists.size(); ++i) {
      ImGui::PushID(static_cast<i32>(i));
      static_cast<void>(lists[i].list_ui("names", items, draw_row));
      ImGui::PopID();
    }
  };

  harness.move_mouse({790.0F, 590.0F});
  harness.warm_up(draw_all);
  const auto first_row = lists.front().item_rects()[0];

  // Several reallocations move the list that has already split its channels.
  for (usize i = 0; i < 8; ++i) {
    lists.emplace_back();
  }
  harness.warm_up(draw_all);

  REQUIRE(lists.size() == 9);
  REQUIRE(lists.front().item_rects().size() == 3);
  REQUIRE(lists.front().item_rects()[0] == first_row);
  REQUIRE(lists.back().item_rects().size() == 3);

  DragDropList moved{std::move(lists.front())};
  harness.frame([&] {
    static_cast<void>(moved.list_ui("names", items, draw_row));
    static_cast<void>(lists.front().list_ui("emptied", items, draw_row));
  });
  REQUIRE(moved.item_rects().size() == 3);
  REQUIRE(lists.front().item_rects().size() == 3);
}

TEST_CASE("A row that throws does not leave lists passive",
          "[drag_drop_list]") {
  ListScene scene{{"a", "b", "c"}};
  REQUIRE(scene.grab(0).is_dragging());

  scene.fail_in_placeholder = true;
  REQUIRE_THROWS_AS(scene.draw(), std::runtime_error);
  REQUIRE_FALSE(DragDropList::is_rendering_passively());
}
