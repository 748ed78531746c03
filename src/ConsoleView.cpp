#include "ConsoleView.h"

#include <algorithm>
#include <sstream>
#include <vector>

namespace {

constexpr std::size_t kBoxInner = 6;

std::string stateName(StateId state) {
    return state == kHaltState ? std::string("HALT") : "q" + std::to_string(state);
}

// Активное состояние: куда ведёт последний переход
StateId activeState(const TransitionTable& table, const Transition* last) {
    return last ? last->nextState : table.startState;
}

std::vector<std::string> boxLines(StateId state, bool active) {
    const char corner = active ? '#' : '+';
    const char hline = active ? '#' : '-';
    const char vline = active ? '#' : '|';

    std::string name = stateName(state);
    name.resize(std::max(name.size(), kBoxInner - 2), ' ');

    std::vector<std::string> out;
    out.push_back(std::string(1, corner) + std::string(kBoxInner, hline) + corner);
    out.push_back(std::string(1, vline) + " " + name + " " + vline);
    out.push_back(std::string(1, corner) + std::string(kBoxInner, hline) + corner);
    return out;
}

} // namespace

std::string formatTape(const Tape& tape, std::size_t padding) {
    const std::string cells = tape.window(padding);
    std::string out = "|";
    for (char c : cells) {
        out += c;
        out += '|';
    }
    return out;
}

std::string formatTransition(const Transition* transition) {
    std::ostringstream ss;
    ss << "Current State:\n";
    if (transition) {
        ss << " Number: " << transition->state << "\n";
        ss << " Read:   " << transition->readKey() << "\n";
        ss << " Write:  " << transition->writeKey() << "\n";
        ss << " Move:   " << transition->moveKey() << "\n";
        ss << " Next:   " << (transition->halts() ? std::string("HALT") : std::to_string(transition->nextState))
           << "\n";
    } else {
        ss << " Number: \n Read:   \n Write:  \n Move:   \n Next:   \n";
    }
    return ss.str();
}

std::string formatReport(const TuringMachine& tm, unsigned multiplier, unsigned multiplicand,
                         std::size_t padding) {
    std::ostringstream ss;
    ss << "Computing " << multiplier << " x " << multiplicand << "\n\n";
    ss << formatTransition(tm.lastTransition()) << "\n";
    ss << "Step #" << tm.steps() << "\n\n";

    // Маркер над ячейкой головки
    ss << std::string(padding * 2 + 1, ' ') << "R\n";
    for (const auto& tape : tm.tapes()) {
        ss << formatTape(tape, padding) << "\n";
    }
    return ss.str();
}

std::string formatDiagram(const TransitionTable& table, const Transition* last) {
    const StateId active = activeState(table, last);

    std::vector<StateId> states = table.states();
    states.push_back(kHaltState);

    std::ostringstream ss;
    for (StateId state : states) {
        // Строки таблицы, принадлежащие состоянию
        std::vector<std::string> edges;
        for (const auto& row : table.rows()) {
            if (row.state != state) {
                continue;
            }
            const bool fired = (&row == last);
            edges.push_back(std::string(fired ? "> " : "  ") + row.readKey() + "/" + row.writeKey() + "," +
                            row.moveKey() + " -> " + stateName(row.nextState));
        }

        const auto box = boxLines(state, state == active);
        const std::size_t lines = std::max(box.size(), edges.size());
        for (std::size_t i = 0; i < lines; i++) {
            std::string line = i < box.size() ? box[i] : std::string(box.front().size(), ' ');
            if (i < edges.size()) {
                line += "  " + edges[i];
            }
            ss << line << "\n";
        }
    }
    return ss.str();
}

std::string formatSummary(unsigned multiplier, unsigned multiplicand, std::size_t result, uint64_t steps) {
    std::ostringstream ss;
    ss << "Computing done: " << multiplier << " x " << multiplicand << " = " << result << " in " << steps
       << " steps.";
    return ss.str();
}

void clearScreen(std::ostream& out) {
    out << "\x1b[2J\x1b[H" << std::flush;
}
