#pragma once
#include "../core/error.hpp"
#include "active_machine.hpp"
#include "machine.hpp"
#include "options.hpp"
#include "structure/transition.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace fsmkit::state {

    // Fluent description of a machine, one state at a time:
    //
    //   auto machine = Builder<Door, Knock, Room>::create(Door::Closed, Room{})
    //                      .on(Knock::Open, [] {})
    //                      .transitionTo(Door::Opened)
    //                      .inState(Door::Opened)
    //                      .onEnterMut([](Room &room) { room.open = true; })
    //                      .build();
    //
    // build()/buildActive() consume the builder. A construction error discards
    // the partial table and leaves the builder unusable.
    template <typename State, typename Event, typename Model = std::monostate> class Builder {
      public:
        using Table = TransitionTable<State, Event, Model>;
        using Action = typename ActionList<Model>::Func;
        using MutAction = typename ActionList<Model>::MutFunc;
        using Passive = PassiveMachine<State, Event, Model>;
        using Active = ActiveMachine<State, Event, Model>;
        using IdleTick = typename Active::IdleTick;

        Builder(State initial, Model model)
            : initial_(initial), scope_(std::move(initial)), model_(std::move(model)) {
            table_.define(scope_);
        }

        static Builder create(State initial, Model model) { return Builder(std::move(initial), std::move(model)); }

        // Scope subsequent calls to `state`
        Builder &inState(const State &state) {
            ensureUsable("inState");
            scope_ = state;
            scopeEvent_.reset();
            table_.define(scope_);
            return *this;
        }

        Builder &onEnter(Action func) {
            ensureUsable("onEnter");
            table_.define(scope_).enter.add(std::move(func));
            return *this;
        }

        Builder &onEnterMut(MutAction func) {
            ensureUsable("onEnterMut");
            table_.define(scope_).enter.addMut(std::move(func));
            return *this;
        }

        Builder &onLeave(Action func) {
            ensureUsable("onLeave");
            table_.define(scope_).leave.add(std::move(func));
            return *this;
        }

        Builder &onLeaveMut(MutAction func) {
            ensureUsable("onLeaveMut");
            table_.define(scope_).leave.addMut(std::move(func));
            return *this;
        }

        // Run `func` when `event` fires in the current state; `event` becomes
        // the event the next transitionTo() binds to
        Builder &on(const Event &event, Action func) {
            ensureUsable("on");
            table_.define(scope_).events[event].add(std::move(func));
            scopeEvent_ = event;
            return *this;
        }

        Builder &onMut(const Event &event, MutAction func) {
            ensureUsable("onMut");
            table_.define(scope_).events[event].addMut(std::move(func));
            scopeEvent_ = event;
            return *this;
        }

        Builder &transitionTo(const State &target) {
            ensureUsable("transitionTo");
            if (!scopeEvent_) {
                poison();
                throw core::Error(core::ErrorKind::NoEventInScope,
                                  "No event in scope. Call on() or onMut() before transitionTo");
            }
            try {
                table_.addTransition(scope_, *scopeEvent_, target);
            } catch (const core::Error &) {
                poison();
                throw;
            }
            return *this;
        }

        // Active machine configuration, ignored by build()
        Builder &name(std::string value) {
            ensureUsable("name");
            options_.name = std::move(value);
            return *this;
        }

        Builder &onError(ErrorHook hook) {
            ensureUsable("onError");
            options_.onError = std::move(hook);
            return *this;
        }

        Builder &shutdownPolicy(ShutdownPolicy policy) {
            ensureUsable("shutdownPolicy");
            options_.shutdown = policy;
            return *this;
        }

        Builder &idleInterval(std::chrono::milliseconds interval) {
            ensureUsable("idleInterval");
            options_.idleInterval = interval;
            return *this;
        }

        std::unique_ptr<Passive> build() {
            ensureUsable("build");
            auto table = finish();
            return std::make_unique<Passive>(std::move(table), std::move(initial_), takeModel());
        }

        std::unique_ptr<Passive> buildPassive() { return build(); }

        std::unique_ptr<Active> buildActive(IdleTick tick = nullptr) {
            ensureUsable("buildActive");
            auto table = finish();
            return std::make_unique<Active>(std::move(table), std::move(initial_), takeModel(), std::move(options_),
                                            std::move(tick));
        }

      private:
        void ensureUsable(const char *context) const {
            if (consumed_) {
                throw core::Error(core::ErrorKind::BuilderConsumed,
                                  std::string("Builder can no longer be used. Rejected call to ") + context);
            }
        }

        void poison() {
            consumed_ = true;
            table_ = Table{};
        }

        std::shared_ptr<const Table> finish() {
            consumed_ = true;
            return std::make_shared<const Table>(std::move(table_));
        }

        Model takeModel() {
            Model model = std::move(*model_);
            model_.reset();
            return model;
        }

        Table table_;
        State initial_;
        State scope_;
        std::optional<Event> scopeEvent_;
        std::optional<Model> model_;
        ActiveOptions options_;
        bool consumed_ = false;
    };

} // namespace fsmkit::state
