#include "TuringMachine.h"

#include <algorithm>
#include <utility>

#include "MultiplicationProgram.h"

// Лента

Tape::Tape(std::string_view initial) {
    for (std::size_t i = 0; i < initial.size(); i++) {
        set(static_cast<long long>(i), initial[i]);
    }
}

Symbol Tape::get(long long position) const {
    auto it = cells_.find(position);
    if (it == cells_.end()) {
        return kBlank;
    }
    return it->second;
}

void Tape::set(long long position, Symbol value) {
    if (value == kBlank) {
        cells_.erase(position);
        return;
    }
    cells_[position] = value;
}

bool Tape::move(Move move) {
    switch (move) {
    case Move::Left:
        head_--;
        return true;
    case Move::Right:
        head_++;
        return true;
    case Move::Stay:
        return true;
    }
    return false;
}

void Tape::clear() {
    cells_.clear();
    head_ = 0;
}

std::size_t Tape::occupiedCount() const {
    return static_cast<std::size_t>(std::count_if(cells_.begin(), cells_.end(), [](const auto& kv) {
        return kv.second != kBlank && kv.second != ' ' && kv.second != '\0';
    }));
}

std::string Tape::window(std::size_t padding) const {
    const long long span = static_cast<long long>(padding);
    std::string out;
    out.reserve(padding * 2 + 1);
    for (long long pos = head_ - span; pos <= head_ + span; pos++) {
        const Symbol sym = get(pos);
        out += (sym == kBlank) ? ' ' : sym;
    }
    return out;
}

// Машина Тьюринга

TuringMachine::TuringMachine(const TransitionTable& table, unsigned multiplier, unsigned multiplicand)
    : TuringMachine(table, multiplicationInput(multiplier, multiplicand)) {}

TuringMachine::TuringMachine(const TransitionTable& table, std::string_view initialTape)
    : table_(&table), initial_(initialTape) {
    reset();
}

void TuringMachine::reset() {
    for (auto& tape : tapes_) {
        tape.clear();
    }
    tapes_[0] = Tape(initial_);
    last_ = nullptr;
    steps_ = 0;
    failed_ = false;
    failure_ = StepResult::Ok;
    error_ = Diagnostic{};
}

std::string TuringMachine::readKey() const {
    std::string key;
    key.reserve(kTapeCount);
    for (const auto& tape : tapes_) {
        key += tape.read();
    }
    return key;
}

const Transition* TuringMachine::findMatchingTransition(const Transition* previous) const {
    const StateId required = previous ? previous->nextState : kAnyState;
    return table_->find(required, readKey());
}

bool TuringMachine::applyTransition(const Transition& transition) {
    // Направления проверяются до записи: ленты не меняются частично
    for (Move move : transition.move) {
        if (move != Move::Left && move != Move::Right && move != Move::Stay) {
            return false;
        }
    }

    for (std::size_t i = 0; i < kTapeCount; i++) {
        tapes_[i].write(transition.write[i]);
        tapes_[i].move(transition.move[i]);
    }
    return true;
}

StepResult TuringMachine::step() {
    // Ошибка фатальна: повторные вызовы ничего не меняют
    if (failed_) {
        return failure_;
    }

    // Уже остановлена
    if (isHalted()) {
        return StepResult::Halted;
    }

    steps_++;

    const Transition* transition = findMatchingTransition(last_);
    if (!transition) {
        const StateId expected = last_ ? last_->nextState : kAnyState;
        const std::string key = readKey();
        std::string message = "No transition for key " + key;
        if (expected != kAnyState) {
            message += " and state " + std::to_string(expected);
        }
        return fail(DiagnosticKind::NoMatchingTransition, expected, key, std::move(message));
    }

    // Применить переход
    if (!applyTransition(*transition)) {
        return fail(DiagnosticKind::InvalidDirection, transition->state, transition->readKey(),
                    "Invalid direction in row " + transition->readKey() + " of state " +
                        std::to_string(transition->state));
    }

    last_ = transition;
    return isHalted() ? StepResult::Halted : StepResult::Ok;
}

StepResult TuringMachine::run(const StepCallback& onEachStep) {
    if (failed_) {
        return failure_;
    }

    StepResult result = isHalted() ? StepResult::Halted : StepResult::Ok;
    while (result == StepResult::Ok) {
        result = step();
        if (onEachStep && !failed_) {
            onEachStep(*this);
        }
    }
    return result;
}

bool TuringMachine::isHalted() const {
    return last_ != nullptr && last_->halts();
}

std::size_t TuringMachine::result() const {
    return tapes_[2].occupiedCount();
}

StepResult TuringMachine::fail(DiagnosticKind kind, StateId expected, const std::string& key, std::string message) {
    failed_ = true;
    failure_ = kind == DiagnosticKind::InvalidDirection ? StepResult::InvalidMove : StepResult::NoTransition;

    error_ = Diagnostic{};
    error_.level = DiagnosticLevel::Error;
    error_.kind = kind;
    error_.step = steps_;
    error_.key = key;
    error_.expectedState = expected;
    error_.message = std::move(message);
    return failure_;
}
