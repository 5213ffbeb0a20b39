#pragma once
#include "../core/error.hpp"
#include "../core/event_queue.hpp"
#include "../core/log.hpp"
#include "options.hpp"
#include "structure/transition.hpp"
#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>

namespace fsmkit::state {

    // Asynchronous machine: fire() only enqueues; one worker thread processes
    // messages in FIFO order using the same step algorithm as PassiveMachine.
    // The model and current state are shared with the worker behind a mutex
    // held for each whole step.
    template <typename State, typename Event, typename Model> class ActiveMachine {
      public:
        using Table = TransitionTable<State, Event, Model>;
        // Polled while the queue is idle; a returned state is transitioned to
        using IdleTick = std::function<std::optional<State>(const State &, const Model &)>;

        ActiveMachine(std::shared_ptr<const Table> table, State initial, Model model, ActiveOptions options = {},
                      IdleTick tick = nullptr)
            : table_(std::move(table)), shared_(std::make_shared<Shared>(std::move(initial), std::move(model))),
              queue_(std::make_shared<Queue>()), options_(std::move(options)), tick_(std::move(tick)) {
            if (!table_) {
                throw std::invalid_argument("Transition table cannot be null");
            }
        }

        ActiveMachine(const ActiveMachine &) = delete;
        ActiveMachine &operator=(const ActiveMachine &) = delete;

        ~ActiveMachine() {
            try {
                stop();
            } catch (const std::exception &e) {
                core::logger()->error("[{}] shutdown failed: {}", options_.name, e.what());
            }
        }

        // Spawns the worker. The initial enter actions are its first message,
        // ahead of anything fired afterwards.
        void start() {
            std::lock_guard<std::mutex> lock(lifecycle_);
            if (stopped_.load(std::memory_order_acquire)) {
                throw core::Error(core::ErrorKind::Stopped, "State machine has been stopped");
            }
            if (started_.load(std::memory_order_acquire)) {
                throw core::Error(core::ErrorKind::AlreadyStarted, "State machine is already started");
            }
            queue_->push(Message{Message::Kind::Start, std::nullopt});
            worker_ = std::thread(&ActiveMachine::run, table_, shared_, queue_, options_, tick_);
            started_.store(true, std::memory_order_release);
            core::logger()->debug("[{}] worker started", options_.name);
        }

        // Never waits for processing; failures surface through the error hook.
        void fire(Event event) {
            if (!started_.load(std::memory_order_acquire)) {
                if (queue_->sealed()) {
                    throw core::Error(core::ErrorKind::Stopped, "State machine has been stopped");
                }
                throw core::Error(core::ErrorKind::NotStarted, "State machine is not running");
            }
            if (!queue_->push(Message{Message::Kind::Fire, std::move(event)})) {
                throw core::Error(core::ErrorKind::Stopped, "State machine has been stopped");
            }
        }

        // Refuses new events, drains or discards the queue per ShutdownPolicy
        // and joins the worker. Safe to call more than once.
        void stop() {
            std::lock_guard<std::mutex> lock(lifecycle_);
            if (stopped_.exchange(true, std::memory_order_acq_rel)) {
                return;
            }
            // Discard only drops fired events; a pending Start still runs the initial enter actions
            const bool discard = options_.shutdown == ShutdownPolicy::Discard;
            std::size_t dropped = queue_->seal(Message{Message::Kind::Stop, std::nullopt}, [discard](const Message &msg) {
                return discard && msg.kind == Message::Kind::Fire;
            });
            if (dropped > 0) {
                core::logger()->warn("[{}] discarded {} queued event(s) on shutdown", options_.name, dropped);
            }
            if (worker_.joinable()) {
                worker_.join();
                core::logger()->debug("[{}] worker joined", options_.name);
            }
        }

        bool running() const {
            return started_.load(std::memory_order_acquire) && !stopped_.load(std::memory_order_acquire);
        }

        // Model, readModel and currentState take the lock the worker holds for
        // a whole step: calling them from an action or idle tick of the same
        // machine deadlocks.

        // Copy of the model taken between steps
        Model model() const {
            std::lock_guard<std::mutex> lock(shared_->mutex);
            return shared_->model;
        }

        // `read` runs under the model lock, so its result must not refer into the model.
        template <typename F> auto readModel(F &&read) const -> decltype(read(std::declval<const Model &>())) {
            static_assert(!std::is_reference_v<decltype(read(std::declval<const Model &>()))>,
                          "readModel must return a value, the lock is released on return");
            std::lock_guard<std::mutex> lock(shared_->mutex);
            return read(static_cast<const Model &>(shared_->model));
        }

        State currentState() const {
            std::lock_guard<std::mutex> lock(shared_->mutex);
            return shared_->current;
        }

        std::size_t pending() const { return queue_->size(); }
        std::size_t failures() const { return shared_->failures.load(); }
        const Table &table() const { return *table_; }

      private:
        struct Message {
            enum class Kind { Start, Fire, Stop };

            Kind kind;
            std::optional<Event> event;
        };

        struct Shared {
            Shared(State initial, Model m) : current(std::move(initial)), model(std::move(m)) {}

            mutable std::mutex mutex;
            State current;
            Model model;
            std::atomic<std::size_t> failures{0};
        };

        using Queue = core::EventQueue<Message>;

        // Worker body. Owns references to everything it touches, never `this`.
        static void run(std::shared_ptr<const Table> table, std::shared_ptr<Shared> shared,
                        std::shared_ptr<Queue> queue, ActiveOptions options, IdleTick tick) {
            bool entered = false;
            for (;;) {
                std::optional<Message> msg = tick ? queue->popFor(options.idleInterval) : queue->pop();
                if (!msg) {
                    if (queue->sealed() && queue->size() == 0) {
                        return;
                    }
                    if (entered) {
                        step(*shared, options, [&] {
                            std::optional<State> next = tick(shared->current, shared->model);
                            if (next) {
                                shared->current = table->transfer(shared->current, *next, shared->model);
                            }
                        });
                    }
                    continue;
                }

                switch (msg->kind) {
                case Message::Kind::Stop:
                    return;
                case Message::Kind::Start:
                    step(*shared, options, [&] { table->enter(shared->current, shared->model); });
                    entered = true;
                    break;
                case Message::Kind::Fire:
                    step(*shared, options,
                         [&] { shared->current = table->dispatch(shared->current, *msg->event, shared->model); });
                    break;
                }
            }
        }

        // Runs one step under the model lock; a failure is reported once the lock is released.
        template <typename Body> static void step(Shared &shared, const ActiveOptions &options, Body &&body) {
            std::exception_ptr failure;
            {
                std::lock_guard<std::mutex> lock(shared.mutex);
                try {
                    body();
                } catch (...) {
                    failure = std::current_exception();
                }
            }
            if (failure) {
                report(shared, options, failure);
            }
        }

        static void report(Shared &shared, const ActiveOptions &options, std::exception_ptr failure) {
            shared.failures.fetch_add(1);
            core::logger()->error("[{}] step failed: {}", options.name, core::describe(failure));
            if (!options.onError) {
                return;
            }
            try {
                options.onError(failure);
            } catch (const std::exception &e) {
                core::logger()->error("[{}] error hook threw: {}", options.name, e.what());
            } catch (...) {
                core::logger()->error("[{}] error hook threw a non-standard exception", options.name);
            }
        }

        std::shared_ptr<const Table> table_;
        std::shared_ptr<Shared> shared_;
        std::shared_ptr<Queue> queue_;
        ActiveOptions options_;
        IdleTick tick_;

        std::mutex lifecycle_; // serializes start() and stop()
        std::atomic<bool> started_{false};
        std::atomic<bool> stopped_{false};
        std::thread worker_;
    };

} // namespace fsmkit::state
