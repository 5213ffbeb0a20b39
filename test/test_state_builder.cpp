#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

#include "fsmkit/state/builder.hpp"
#include <string>
#include <vector>

using namespace fsmkit;

enum class Door { Closed, Opened, Locked };
enum class Action { Open, Close, Lock, Knock };

struct Room {
    bool open = false;
    std::vector<std::string> log;
};

using DoorBuilder = state::Builder<Door, Action, Room>;

template <typename F> static core::ErrorKind errorKindOf(F &&f) {
    try {
        f();
    } catch (const core::Error &e) {
        return e.kind();
    }
    FAIL("expected fsmkit::core::Error");
    return core::ErrorKind::ActionFailed;
}

TEST_CASE("Builder: Basic state machine construction") {
    auto machine = DoorBuilder::create(Door::Closed, Room{})
                       .onEnterMut([](Room &room) { room.log.push_back("closed"); })
                       .build();

    CHECK(machine != nullptr);
    CHECK_FALSE(machine->running());
    machine->start();
    CHECK(machine->running());
    CHECK(machine->currentState() == Door::Closed);
    CHECK(machine->model().log == std::vector<std::string>{"closed"});
}

TEST_CASE("Builder: Simple transition") {
    auto machine = DoorBuilder::create(Door::Closed, Room{})
                       .on(Action::Open, [] {})
                       .transitionTo(Door::Opened)
                       .inState(Door::Opened)
                       .onEnterMut([](Room &room) { room.open = true; })
                       .build();

    machine->start();
    machine->fire(Action::Open);
    CHECK(machine->currentState() == Door::Opened);
    CHECK(machine->model().open);
}

TEST_CASE("Builder: Reopening a state appends actions") {
    auto machine = DoorBuilder::create(Door::Closed, Room{})
                       .onEnterMut([](Room &room) { room.log.push_back("a"); })
                       .inState(Door::Opened)
                       .inState(Door::Closed)
                       .onEnterMut([](Room &room) { room.log.push_back("b"); })
                       .build();

    machine->start();
    CHECK(machine->model().log == std::vector<std::string>{"a", "b"});
}

TEST_CASE("Builder: Transition binds to the most recent event") {
    auto machine = DoorBuilder::create(Door::Closed, Room{})
                       .on(Action::Knock, [] {})
                       .on(Action::Open, [] {})
                       .transitionTo(Door::Opened)
                       .build();

    machine->start();
    machine->fire(Action::Knock);
    CHECK(machine->currentState() == Door::Closed);
    machine->fire(Action::Open);
    CHECK(machine->currentState() == Door::Opened);
}

TEST_CASE("Builder: Multiple transitions from same state") {
    auto machine = DoorBuilder::create(Door::Closed, Room{})
                       .on(Action::Open, [] {})
                       .transitionTo(Door::Opened)
                       .on(Action::Lock, [] {})
                       .transitionTo(Door::Locked)
                       .inState(Door::Opened)
                       .on(Action::Close, [] {})
                       .transitionTo(Door::Closed)
                       .build();

    CHECK(machine->table().transitionCount() == 3);
    machine->start();
    machine->fire(Action::Lock);
    CHECK(machine->currentState() == Door::Locked);
}

TEST_CASE("Builder: Target states need no definition") {
    auto machine = DoorBuilder::create(Door::Closed, Room{}).on(Action::Lock, [] {}).transitionTo(Door::Locked).build();

    CHECK(machine->table().stateCount() == 1);
    machine->start();
    machine->fire(Action::Lock);
    CHECK(machine->currentState() == Door::Locked);
    machine->fire(Action::Open);
    CHECK(machine->currentState() == Door::Locked);
}

TEST_CASE("Builder: Error handling - transition without event") {
    CHECK(errorKindOf([] { DoorBuilder::create(Door::Closed, Room{}).transitionTo(Door::Opened); }) ==
          core::ErrorKind::NoEventInScope);

    // inState() clears the event scope
    CHECK(errorKindOf([] {
              DoorBuilder::create(Door::Closed, Room{}).on(Action::Open, [] {}).inState(Door::Opened).transitionTo(
                  Door::Closed);
          }) == core::ErrorKind::NoEventInScope);
}

TEST_CASE("Builder: Error handling - duplicate transition") {
    SUBCASE("Second transitionTo for the same event") {
        CHECK(errorKindOf([] {
                  DoorBuilder::create(Door::Closed, Room{})
                      .on(Action::Open, [] {})
                      .transitionTo(Door::Opened)
                      .transitionTo(Door::Locked);
              }) == core::ErrorKind::DuplicateTransition);
    }

    SUBCASE("Same pair registered again after reopening the state") {
        CHECK(errorKindOf([] {
                  DoorBuilder::create(Door::Closed, Room{})
                      .on(Action::Open, [] {})
                      .transitionTo(Door::Opened)
                      .inState(Door::Locked)
                      .inState(Door::Closed)
                      .on(Action::Open, [] {})
                      .transitionTo(Door::Locked);
              }) == core::ErrorKind::DuplicateTransition);
    }
}

TEST_CASE("Builder: Construction error discards the builder") {
    auto builder = DoorBuilder::create(Door::Closed, Room{});
    builder.on(Action::Open, [] {}).transitionTo(Door::Opened);

    CHECK(errorKindOf([&] { builder.transitionTo(Door::Locked); }) == core::ErrorKind::DuplicateTransition);
    CHECK(errorKindOf([&] { builder.on(Action::Close, [] {}); }) == core::ErrorKind::BuilderConsumed);
    CHECK(errorKindOf([&] { builder.build(); }) == core::ErrorKind::BuilderConsumed);
}

TEST_CASE("Builder: Building consumes the builder") {
    auto builder = DoorBuilder::create(Door::Closed, Room{});
    builder.on(Action::Open, [] {}).transitionTo(Door::Opened);

    auto machine = builder.build();
    CHECK(machine != nullptr);

    CHECK_THROWS_WITH(builder.onEnter([] {}), "Builder can no longer be used. Rejected call to onEnter");
    CHECK(errorKindOf([&] { builder.build(); }) == core::ErrorKind::BuilderConsumed);
    CHECK(errorKindOf([&] { builder.buildActive(); }) == core::ErrorKind::BuilderConsumed);
}

TEST_CASE("Builder: Copies build independent machines") {
    auto base = DoorBuilder::create(Door::Closed, Room{});
    base.on(Action::Open, [] {}).transitionTo(Door::Opened);

    auto extended = base;
    extended.inState(Door::Opened).on(Action::Close, [] {}).transitionTo(Door::Closed);

    auto small = base.build();
    auto large = extended.build();
    CHECK(small->table().transitionCount() == 1);
    CHECK(large->table().transitionCount() == 2);
}

TEST_CASE("Builder: Default model") {
    int entered = 0;
    auto machine = state::Builder<Door, Action>::create(Door::Closed, {}).onEnter([&entered] { ++entered; }).buildPassive();

    machine->start();
    CHECK(entered == 1);
}

TEST_CASE("Builder: Active machine configuration") {
    auto machine = DoorBuilder::create(Door::Closed, Room{})
                       .name("door")
                       .shutdownPolicy(state::ShutdownPolicy::Discard)
                       .idleInterval(std::chrono::milliseconds(5))
                       .on(Action::Open, [] {})
                       .transitionTo(Door::Opened)
                       .buildActive();

    CHECK(machine != nullptr);
    CHECK_FALSE(machine->running());
    CHECK(machine->table().transitionCount() == 1);
    machine->start();
    CHECK(machine->running());
    machine->stop();
    CHECK_FALSE(machine->running());
}
