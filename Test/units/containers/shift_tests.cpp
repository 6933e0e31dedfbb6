#include "Containers.hpp"
#include "Exception.hpp"
#include "Types.hpp"

#include <algorithm>
#include <array>
#include <catch2/catch_test_macros.hpp>
#include <numeric>
#include <string>
#include <vector>

using namespace DnD;
using namespace DnD::Container;

TEST_CASE("Shift moves an element to its final position", "[shift]") {
  std::vector<std::string> items{"a", "b", "c", "d"};

  SECTION("Forwards") {
    shift(0, 2, items);
    REQUIRE(items == std::vector<std::string>{"b", "c", "a", "d"});
  }

  SECTION("Backwards") {
    shift(3, 1, items);
    REQUIRE(items == std::vector<std::string>{"a", "d", "b", "c"});
  }

  SECTION("To the end") {
    shift(0, 3, items);
    REQUIRE(items == std::vector<std::string>{"b", "c", "d", "a"});
  }

  SECTION("To the front") {
    shift(3, 0, items);
    REQUIRE(items == std::vector<std::string>{"d", "a", "b", "c"});
  }

  SECTION("Neighbours swap") {
    shift(1, 2, items);
    REQUIRE(items == std::vector<std::string>{"a", "c", "b", "d"});
  }
}

TEST_CASE("Shift with equal indices changes nothing", "[shift]") {
  std::vector<int> items{4, 8, 15, 16, 23, 42};
  const auto original = items;

  for (usize i = 0; i < items.size(); ++i) {
    shift(i, i, items);
    REQUIRE(items == original);
  }
}

TEST_CASE("Shift is undone by the reverse shift", "[shift]") {
  std::vector<int> items(7);
  std::iota(items.begin(), items.end(), 0);
  const auto original = items;

  for (usize source = 0; source < items.size(); ++source) {
    for (usize target = 0; target < items.size(); ++target) {
      shift(source, target, items);
      REQUIRE(items[target] == original[source]);
      shift(target, source, items);
      REQUIRE(items == original);
    }
  }
}

TEST_CASE("Shift keeps every element", "[shift]") {
  std::vector<int> items{5, 1, 5, 3, 9, 1};
  auto sorted_original = items;
  std::ranges::sort(sorted_original);

  shift(4, 1, items);
  shift(0, 5, items);

  auto sorted_after = items;
  std::ranges::sort(sorted_after);
  REQUIRE(sorted_after == sorted_original);
}

TEST_CASE("Shift works on spans and arrays", "[shift]") {
  std::array<char, 4> letters{'w', 'x', 'y', 'z'};
  shift(2, 0, std::span<char>{letters});
  REQUIRE(letters == std::array<char, 4>{'y', 'w', 'x', 'z'});

  shift(0, 2, letters);
  REQUIRE(letters == std::array<char, 4>{'w', 'x', 'y', 'z'});
}

TEST_CASE("Checked shift rejects indices outside the sequence", "[shift]") {
  std::vector<int> items{1, 2, 3};

  SECTION("Source out of range") {
    REQUIRE_THROWS_AS(shift_checked(3, 0, items), InvalidIndicesException);
    REQUIRE(items == std::vector<int>{1, 2, 3});
  }

  SECTION("Target out of range") {
    try {
      shift_checked(0, 7, items);
      FAIL("Expected an exception");
    } catch (const InvalidIndicesException &exc) {
      REQUIRE(exc.get_source() == 0);
      REQUIRE(exc.get_target() == 7);
      REQUIRE(exc.get_length() == 3);
    }
  }

  SECTION("Empty sequence") {
    std::vector<int> empty{};
    REQUIRE_THROWS_AS(shift_checked(0, 0, empty), InvalidIndicesException);
  }

  SECTION("Valid indices behave like shift") {
    shift_checked(2, 0, items);
    REQUIRE(items == std::vector<int>{3, 1, 2});
  }
}
