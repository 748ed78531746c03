#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include <SFML/Graphics/RenderWindow.hpp>
#include <SFML/System/Clock.hpp>
#include <SFML/Window/Event.hpp>

#include "App.h"
#include "CommandLine.h"
#include "Config.h"
#include "ConsoleView.h"
#include "MultiplicationProgram.h"
#include "TuringMachine.h"

static int runWindow(const RunOptions& options) {
    App app(options);
    if (!app.fontLoaded()) {
        return 1;
    }

    sf::RenderWindow window(sf::VideoMode({kWindowWidth, kWindowHeight}), "Turing Machine: unary multiplication");
    window.setFramerateLimit(60);

    sf::Clock clock;

    // Главный цикл
    while (window.isOpen()) {
        while (const std::optional event = window.pollEvent()) {
            app.handleEvent(*event, window);
        }

        const float dt = clock.restart().asSeconds();
        app.update(dt);

        app.render(window);
    }

    return 0;
}

static void printReport(const TuringMachine& tm, const RunOptions& options) {
    if (options.clearScreen) {
        clearScreen(std::cout);
    }
    std::cout << "\n" << formatReport(tm, options.multiplier, options.multiplicand, kPrintPadding);
    if (options.diagram) {
        std::cout << "\n" << formatDiagram(tm.table(), tm.lastTransition());
    }
    std::cout << std::flush;
}

static int runConsole(const RunOptions& options) {
    TuringMachine tm(multiplicationTable(options.variant), options.multiplier, options.multiplicand);

    const bool render = options.printSteps || options.diagram;
    if (render) {
        printReport(tm, options);
    }

    const StepResult result = tm.run([&](const TuringMachine& machine) {
        if (render) {
            printReport(machine, options);
        }
        if (options.sleep) {
            std::this_thread::sleep_for(options.delay);
        }
        if (options.interactive) {
            std::string line;
            std::getline(std::cin, line);
        }
    });

    if (result != StepResult::Halted) {
        const Diagnostic& error = tm.error();
        std::cerr << "Error: " << error.message << " at step " << error.step << std::endl;
        return 1;
    }

    std::cout << "\n" << formatSummary(options.multiplier, options.multiplicand, tm.result(), tm.steps())
              << std::endl;
    return 0;
}

int main(int argc, char* argv[]) {
    const std::string program = argc > 0 ? argv[0] : "tm-multiply";

    RunOptions options;
    std::string error;
    if (!parseCommandLine(argc, argv, options, error)) {
        std::cerr << "Error: " << error << "\n" << usage(program);
        return 1;
    }

    if (options.help) {
        std::cout << usage(program);
        return 0;
    }

    return options.gui ? runWindow(options) : runConsole(options);
}
