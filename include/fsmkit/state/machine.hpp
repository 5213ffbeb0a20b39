#pragma once
#include "../core/error.hpp"
#include "../core/log.hpp"
#include "structure/transition.hpp"
#include <memory>
#include <stdexcept>
#include <utility>

namespace fsmkit::state {

    // Synchronous machine: fire() runs the whole step on the calling thread and
    // returns once event, leave and enter actions are done. Owns its model.
    template <typename State, typename Event, typename Model> class PassiveMachine {
      public:
        using Table = TransitionTable<State, Event, Model>;

        PassiveMachine(std::shared_ptr<const Table> table, State initial, Model model)
            : table_(std::move(table)), current_(std::move(initial)), model_(std::move(model)) {
            if (!table_) {
                throw std::invalid_argument("Transition table cannot be null");
            }
        }

        // Runs the initial state's enter actions. The machine only counts as
        // started when all of them succeeded.
        void start() {
            if (running_) {
                throw core::Error(core::ErrorKind::AlreadyStarted, "State machine is already started");
            }
            table_->enter(current_, model_);
            running_ = true;
            core::logger()->debug("passive machine started");
        }

        // On failure the state is left at the source of the step and the
        // ActionFailed error propagates.
        void fire(const Event &event) {
            if (!running_) {
                throw core::Error(core::ErrorKind::NotStarted, "State machine is not running");
            }
            auto log = core::logger();
            if (log->should_log(spdlog::level::debug) && !table_->target(current_, event)) {
                log->debug("no transition for fired event, state unchanged");
            }
            current_ = table_->dispatch(current_, event, model_);
            log->trace("passive machine step complete");
        }

        const Model &model() const { return model_; }
        const State &currentState() const { return current_; }
        bool running() const { return running_; }
        const Table &table() const { return *table_; }

      private:
        std::shared_ptr<const Table> table_;
        State current_;
        Model model_;
        bool running_ = false;
    };

} // namespace fsmkit::state
