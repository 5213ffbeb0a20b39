#include <fsmkit/fsmkit.hpp>
#include <iostream>
#include <string>

using namespace fsmkit;

enum class Turnstile { Locked, Unlocked };
enum class Input { Coin, Push };

struct Revenue {
    int coins = 0;
    int riders = 0;

    void printRevenue() const { std::cout << "revenue: $" << coins * 0.25 << std::endl; }
    void printRidership() const { std::cout << "ridership: " << riders << std::endl; }
};

int main() {
    auto machine = state::Builder<Turnstile, Input, Revenue>::create(Turnstile::Locked, Revenue{})
                       .onEnter([] { std::cout << "turnstile is locked" << std::endl; })
                       .onMut(Input::Coin,
                              [](Revenue &r) {
                                  ++r.coins;
                                  r.printRevenue();
                              })
                       .transitionTo(Turnstile::Unlocked)
                       .on(Input::Push, [] { std::cout << "turnstile won't budge, maybe try a coin" << std::endl; })
                       .inState(Turnstile::Unlocked)
                       .onEnter([] { std::cout << "turnstile clicks" << std::endl; })
                       .on(Input::Push, [] { std::cout << "enjoy your ride!" << std::endl; })
                       .onMut(Input::Push,
                              [](Revenue &r) {
                                  ++r.riders;
                                  r.printRidership();
                              })
                       .transitionTo(Turnstile::Locked)
                       .on(Input::Coin, [] { std::cout << "you already paid! Try pushing." << std::endl; })
                       .build();

    machine->start();

    std::string line;
    std::cout << "add a coin with (c), push with (p), quit with (q): ";
    while (std::getline(std::cin, line)) {
        if (line == "c") {
            machine->fire(Input::Coin);
        } else if (line == "p") {
            machine->fire(Input::Push);
        } else if (line == "q") {
            break;
        }
        std::cout << "add a coin with (c), push with (p), quit with (q): ";
    }
    return 0;
}
