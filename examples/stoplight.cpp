#include <fsmkit/fsmkit.hpp>
#include <chrono>
#include <iostream>
#include <thread>

using namespace fsmkit;
using Clock = std::chrono::steady_clock;

enum class Light { Red, Yellow, Green };
enum class Sensor { CarDetected };

struct Crossing {
    bool carWaiting = false;
    Clock::time_point changedAt = Clock::now();

    Clock::duration elapsed() const { return Clock::now() - changedAt; }
};

int main() {
    using namespace std::chrono_literals;

    auto machine =
        state::Builder<Light, Sensor, Crossing>::create(Light::Red, Crossing{})
            .name("stoplight")
            .idleInterval(50ms)
            .onEnterMut([](Crossing &c) {
                c.changedAt = Clock::now();
                std::cout << "Red light!" << std::endl;
            })
            .onMut(Sensor::CarDetected, [](Crossing &c) { c.carWaiting = true; })
            .inState(Light::Green)
            .onEnterMut([](Crossing &c) {
                c.carWaiting = false;
                c.changedAt = Clock::now();
                std::cout << "Green light!" << std::endl;
            })
            .inState(Light::Yellow)
            .onEnterMut([](Crossing &c) {
                c.changedAt = Clock::now();
                std::cout << "Yellow light!" << std::endl;
            })
            .buildActive([](const Light &light, const Crossing &c) -> std::optional<Light> {
                switch (light) {
                case Light::Red:
                    if (c.carWaiting && c.elapsed() > 1s)
                        return Light::Green;
                    break;
                case Light::Green:
                    if (c.elapsed() > 3s)
                        return Light::Yellow;
                    break;
                case Light::Yellow:
                    if (c.elapsed() > 1s)
                        return Light::Red;
                    break;
                }
                return std::nullopt;
            });

    machine->start();
    for (int cycle = 0; cycle < 2; ++cycle) {
        machine->fire(Sensor::CarDetected);
        std::this_thread::sleep_for(6s);
    }
    machine->stop();
    return 0;
}
