#pragma once
#include "../../core/error.hpp"
#include <cstddef>
#include <exception>
#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fsmkit::state {

    // Append-only list of callbacks for one hook. Plain actions are stored
    // wrapped so both kinds keep their relative registration order.
    template <typename Model> class ActionList {
      public:
        using Func = std::function<void()>;
        using MutFunc = std::function<void(Model &)>;

        void add(Func func) {
            actions_.push_back([f = std::move(func)](Model &) { f(); });
        }

        void addMut(MutFunc func) { actions_.push_back(std::move(func)); }

        // Runs every action in order. The first failure stops the list and is
        // rethrown as ActionFailed with the original exception nested.
        void run(Model &model, const char *hook) const {
            for (std::size_t i = 0; i < actions_.size(); ++i) {
                try {
                    actions_[i](model);
                } catch (...) {
                    std::throw_with_nested(core::Error(core::ErrorKind::ActionFailed,
                                                       std::string(hook) + " action #" + std::to_string(i + 1) +
                                                           " failed"));
                }
            }
        }

        std::size_t size() const { return actions_.size(); }
        bool empty() const { return actions_.empty(); }

      private:
        std::vector<MutFunc> actions_;
    };

    template <typename Event, typename Model> struct ActionSet {
        ActionList<Model> enter;
        ActionList<Model> leave;
        std::unordered_map<Event, ActionList<Model>> events;

        // Null when nothing is registered for the event
        const ActionList<Model> *forEvent(const Event &event) const {
            auto it = events.find(event);
            return it == events.end() ? nullptr : &it->second;
        }
    };

} // namespace fsmkit::state
