#pragma once
#include "../../core/error.hpp"
#include "action_set.hpp"
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace fsmkit::state {

    // Per-state actions plus the (state, event) -> target map. Filled by the
    // Builder, then shared read-only by the machine built from it.
    template <typename State, typename Event, typename Model> class TransitionTable {
      public:
        using Actions = ActionSet<Event, Model>;

        // Entry for `state`, created on first use
        Actions &define(const State &state) { return entries_[state].actions; }

        bool defines(const State &state) const { return entries_.find(state) != entries_.end(); }

        void addTransition(const State &from, const Event &event, const State &to) {
            auto entry = entries_.find(from);
            if (entry == entries_.end()) {
                throw std::invalid_argument("Cannot add a transition from an undefined state");
            }
            if (!entry->second.transitions.emplace(event, to).second) {
                throw core::Error(core::ErrorKind::DuplicateTransition,
                                  "A transition for this state and event is already registered");
            }
        }

        std::optional<State> target(const State &from, const Event &event) const {
            auto entry = entries_.find(from);
            if (entry == entries_.end()) {
                return std::nullopt;
            }
            auto it = entry->second.transitions.find(event);
            if (it == entry->second.transitions.end()) {
                return std::nullopt;
            }
            return it->second;
        }

        const Actions *actions(const State &state) const {
            auto entry = entries_.find(state);
            return entry == entries_.end() ? nullptr : &entry->second.actions;
        }

        std::size_t stateCount() const { return entries_.size(); }

        std::size_t transitionCount() const {
            std::size_t count = 0;
            for (const auto &[state, entry] : entries_) {
                count += entry.transitions.size();
            }
            return count;
        }

        // Step execution shared by both machines. None of these touch the
        // caller's current state; they return the state the step ends in and
        // throw without returning when an action fails.

        void enter(const State &state, Model &model) const {
            if (const Actions *acts = actions(state)) {
                acts->enter.run(model, "onEnter");
            }
        }

        State transfer(const State &from, const State &to, Model &model) const {
            if (const Actions *acts = actions(from)) {
                acts->leave.run(model, "onLeave");
            }
            enter(to, model);
            return to;
        }

        // Event actions run even when no transition exists for the pair.
        State dispatch(const State &current, const Event &event, Model &model) const {
            auto entry = entries_.find(current);
            if (entry == entries_.end()) {
                return current;
            }
            if (const ActionList<Model> *handlers = entry->second.actions.forEvent(event)) {
                handlers->run(model, "on");
            }
            auto next = entry->second.transitions.find(event);
            if (next == entry->second.transitions.end()) {
                return current;
            }
            return transfer(current, next->second, model);
        }

      private:
        struct Entry {
            Actions actions;
            std::unordered_map<Event, State> transitions;
        };

        std::unordered_map<State, Entry> entries_;
    };

} // namespace fsmkit::state
