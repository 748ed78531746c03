#include "TransitionTable.h"

#include <algorithm>
#include <functional>
#include <unordered_set>
#include <utility>

std::string Transition::readKey() const {
    return std::string(read.begin(), read.end());
}

std::string Transition::writeKey() const {
    return std::string(write.begin(), write.end());
}

std::string Transition::moveKey() const {
    std::string out;
    out.reserve(kTapeCount);
    for (Move m : move) {
        out += moveChar(m);
    }
    return out;
}

bool parseMove(char c, Move& out) {
    switch (c) {
    case 'L':
        out = Move::Left;
        return true;
    case 'R':
        out = Move::Right;
        return true;
    case 'N':
        out = Move::Stay;
        return true;
    default:
        return false;
    }
}

char moveChar(Move move) {
    switch (move) {
    case Move::Left:
        return 'L';
    case Move::Right:
        return 'R';
    case Move::Stay:
        return 'N';
    }
    return '?';
}

bool isTapeSymbol(char c) {
    return c == '0' || c == '1' || c == kBlank;
}

bool TransitionTable::add(const Transition& transition) {
    if (transition.state < 0 || (transition.nextState < 0 && transition.nextState != kHaltState)) {
        return false;
    }

    Key key{transition.state, transition.readKey()};

    // Детерминированность: только один переход на пару (состояние, ключ).
    auto [it, inserted] = index_.emplace(key, rows_.size());
    if (!inserted) {
        return false;
    }

    // Без предыдущего перехода побеждает первая строка с этим ключом.
    index_.emplace(Key{kAnyState, key.read}, rows_.size());

    rows_.push_back(transition);
    return true;
}

bool TransitionTable::addRow(StateId state, std::string_view read, std::string_view write,
                             std::string_view move, StateId next, std::vector<Diagnostic>& out) {
    auto fail = [&](DiagnosticKind kind, std::string message) {
        Diagnostic diag;
        diag.kind = kind;
        diag.key = std::string(read);
        diag.expectedState = state;
        diag.message = std::move(message);
        out.push_back(std::move(diag));
        return false;
    };

    if (state < 0 || (next < 0 && next != kHaltState)) {
        return fail(DiagnosticKind::InvalidRow, "Invalid state number in row " + std::to_string(state));
    }

    if (read.size() != kTapeCount || write.size() != kTapeCount || move.size() != kTapeCount) {
        return fail(DiagnosticKind::InvalidRow,
                    "Row of state " + std::to_string(state) + " must have " +
                        std::to_string(kTapeCount) + " symbols per pattern");
    }

    Transition t;
    t.state = state;
    t.nextState = next;
    for (std::size_t i = 0; i < kTapeCount; i++) {
        if (!isTapeSymbol(read[i]) || !isTapeSymbol(write[i])) {
            return fail(DiagnosticKind::InvalidRow,
                        "Unknown tape symbol in row " + std::string(read) + " of state " + std::to_string(state));
        }
        if (!parseMove(move[i], t.move[i])) {
            return fail(DiagnosticKind::InvalidDirection,
                        std::string("Unknown direction ") + move[i] + " in row " + std::string(read) +
                            " of state " + std::to_string(state));
        }
        t.read[i] = read[i];
        t.write[i] = write[i];
    }

    if (!add(t)) {
        return fail(DiagnosticKind::DuplicateRow,
                    "Duplicate row " + std::string(read) + " for state " + std::to_string(state));
    }
    return true;
}

const Transition* TransitionTable::find(StateId requiredState, const std::string& key) const {
    auto it = index_.find(Key{requiredState, key});
    if (it == index_.end()) {
        return nullptr;
    }
    return &rows_[it->second];
}

bool TransitionTable::has(StateId requiredState, const std::string& key) const {
    return find(requiredState, key) != nullptr;
}

int TransitionTable::indexOf(const Transition* transition) const {
    if (transition == nullptr || rows_.empty()) {
        return -1;
    }
    const std::less<const Transition*> before;
    if (before(transition, rows_.data()) || !before(transition, rows_.data() + rows_.size())) {
        return -1;
    }
    return static_cast<int>(transition - rows_.data());
}

std::vector<StateId> TransitionTable::states() const {
    std::unordered_set<StateId> s;

    s.insert(startState);

    for (const auto& row : rows_) {
        s.insert(row.state);
        if (!row.halts()) {
            s.insert(row.nextState);
        }
    }

    std::vector<StateId> out(s.begin(), s.end());
    std::sort(out.begin(), out.end());
    return out;
}

bool TransitionTable::validate(std::vector<Diagnostic>& out) const {
    bool ok = true;

    std::unordered_set<StateId> owners;
    for (const auto& row : rows_) {
        owners.insert(row.state);
    }

    if (owners.find(startState) == owners.end()) {
        ok = false;
        Diagnostic diag;
        diag.kind = DiagnosticKind::UndefinedState;
        diag.expectedState = startState;
        diag.message = "Start state " + std::to_string(startState) + " has no rows";
        out.push_back(std::move(diag));
    }

    // Каждый преемник должен быть остановом или иметь строки
    for (const auto& row : rows_) {
        if (row.halts() || owners.count(row.nextState) != 0) {
            continue;
        }
        ok = false;
        Diagnostic diag;
        diag.kind = DiagnosticKind::UndefinedState;
        diag.key = row.readKey();
        diag.expectedState = row.nextState;
        diag.message = "Row " + row.readKey() + " of state " + std::to_string(row.state) +
                       " leads to undefined state " + std::to_string(row.nextState);
        out.push_back(std::move(diag));
    }

    return ok;
}
