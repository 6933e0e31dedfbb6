#include "FiniteStateMachine.hpp"

#include <catch2/catch_test_macros.hpp>
#include <magic_enum.hpp>
#include <string>
#include <vector>

using namespace DnD;

enum class LifecycleStates { Created, Initialized, Running, Terminated };

enum class TrafficLight { Red, Yellow, Green };

// TestFSM to track on_enter_state and on_leave_state calls
template <typename StateEnum>
class TestFSM : public FiniteStateMachine<StateEnum> {
public:
  std::vector<std::string> log;

  explicit TestFSM(StateEnum initial_state)
      : FiniteStateMachine<StateEnum>(initial_state) {}

protected:
  void on_enter_state(StateEnum state) override {
    log.push_back("Enter: " + std::string(magic_enum::enum_name(state)));
  }

  void on_leave_state(StateEnum state) override {
    log.push_back("Leave: " + std::string(magic_enum::enum_name(state)));
  }
};

TEST_CASE("LifecycleStates transitions", "[FSM]") {
  FiniteStateMachine<LifecycleStates> fsm(LifecycleStates::Created);

  SECTION("Initial state is Created") {
    REQUIRE(fsm.get_current_state() == LifecycleStates::Created);
    REQUIRE_FALSE(fsm.get_previous_state().has_value());
    REQUIRE(fsm.get_transition_count() == 0);
  }

  SECTION("Transition from Created to Initialized") {
    fsm.transition_to(LifecycleStates::Initialized);
    REQUIRE(fsm.get_current_state() == LifecycleStates::Initialized);
    REQUIRE(fsm.get_previous_state() == LifecycleStates::Created);
  }

  SECTION("Transition from Initialized to Running") {
    fsm.transition_to(LifecycleStates::Initialized); // Setup
    fsm.transition_to(LifecycleStates::Running);
    REQUIRE(fsm.is(LifecycleStates::Running));
    REQUIRE(fsm.get_transition_count() == 2);
  }
}

TEST_CASE("TrafficLight transitions", "[FSM]") {
  FiniteStateMachine<TrafficLight> fsm(TrafficLight::Red);

  SECTION("Transition from Green to Yellow") {
    fsm.transition_to(TrafficLight::Green);
    fsm.transition_to(TrafficLight::Yellow);
    REQUIRE(fsm.get_current_state() == TrafficLight::Yellow);
    REQUIRE(fsm.get_previous_state() == TrafficLight::Green);
  }

  SECTION("Transition to the current state still counts") {
    fsm.transition_to(TrafficLight::Red);
    REQUIRE(fsm.is(TrafficLight::Red));
    REQUIRE(fsm.get_transition_count() == 1);
  }
}

TEST_CASE("FSM on_leave_state and on_enter_state Calls", "[FSM]") {
  TestFSM<LifecycleStates> fsm(LifecycleStates::Created);

  fsm.transition_to(LifecycleStates::Initialized);
  fsm.transition_to(LifecycleStates::Running);
  fsm.transition_to(LifecycleStates::Terminated);

  const std::vector<std::string> expected_log = {
      "Leave: Created", "Enter: Initialized", "Leave: Initialized",
      "Enter: Running", "Leave: Running",     "Enter: Terminated"};
  REQUIRE(fsm.log == expected_log);
}
