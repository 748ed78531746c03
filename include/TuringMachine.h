#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "Diagnostics.h"
#include "TransitionTable.h"
#include "Types.h"

/** @brief Модель бесконечной ленты машины Тьюринга с головкой */
class Tape {
public:
    Tape() = default;

    /** @brief Лента с начальным содержимым, записанным с позиции 0 */
    explicit Tape(std::string_view initial);

    /** @brief Прочитать символ в позиции */
    Symbol get(long long position) const;

    /** @brief Записать символ в позицию */
    void set(long long position, Symbol value);

    /** @brief Прочитать символ под головкой */
    Symbol read() const { return get(head_); }

    /** @brief Записать символ под головку */
    void write(Symbol value) { set(head_, value); }

    /** @brief Переместить головку (false для неизвестного направления) */
    bool move(Move move);

    /** @brief Очистить ленту и вернуть головку в 0 */
    void clear();

    /** @brief Получить позицию головки */
    long long head() const { return head_; }

    /** @brief Количество непустых ячеек */
    std::size_t occupiedCount() const;

    /**
     * @brief Окно ячеек вокруг головки для отображения
     * @param padding Число ячеек слева и справа от головки
     * @return 2 * padding + 1 символов, пустые ячейки как пробел
     */
    std::string window(std::size_t padding) const;

private:
    long long head_{0};
    std::unordered_map<long long, Symbol> cells_;
};

/** @brief Результат выполнения одного шага машины */
enum class StepResult {
    Ok,            ///< Шаг выполнен успешно
    Halted,        ///< Машина достигла состояния останова
    NoTransition,  ///< Нет перехода для ключа и требуемого состояния
    InvalidMove    ///< Неизвестное направление в строке таблицы
};

/** @brief Трёхленточная машина Тьюринга, исполняющая статическую таблицу */
class TuringMachine {
public:
    using Tapes = std::array<Tape, kTapeCount>;

    /** @brief Вызывается после каждого шага */
    using StepCallback = std::function<void(const TuringMachine&)>;

    /**
     * @brief Создать машину для вычисления multiplier * multiplicand
     * @param table Таблица переходов, должна жить дольше машины
     */
    TuringMachine(const TransitionTable& table, unsigned multiplier, unsigned multiplicand);

    /** @brief Создать машину с произвольным содержимым первой ленты */
    TuringMachine(const TransitionTable& table, std::string_view initialTape);

    /** @brief Сбросить машину в начальное состояние */
    void reset();

    /** @brief Составной ключ чтения со всех лент */
    std::string readKey() const;

    /**
     * @brief Найти переход для текущих символов под головками
     * @param previous Предыдущий переход или nullptr перед первым шагом
     * @return nullptr если подходящей строки нет
     */
    const Transition* findMatchingTransition(const Transition* previous) const;

    /** @brief Записать и сдвинуть головки согласно переходу */
    bool applyTransition(const Transition& transition);

    /** @brief Выполнить один шаг */
    StepResult step();

    /**
     * @brief Выполнять шаги до останова или ошибки
     * @param onEachStep Необязательный обработчик после каждого шага
     */
    StepResult run(const StepCallback& onEachStep = {});

    /** @brief Проверить, остановлена ли машина */
    bool isHalted() const;

    /** @brief Шаг завершился фатальной ошибкой */
    bool isFailed() const { return failed_; }

    /** @brief Последняя ошибка (kind == None если ошибок нет) */
    const Diagnostic& error() const { return error_; }

    /** @brief Последний выполненный переход (nullptr до первого шага) */
    const Transition* lastTransition() const { return last_; }

    /** @brief Получить количество шагов */
    uint64_t steps() const { return steps_; }

    /** @brief Результат: число непустых ячеек третьей ленты */
    std::size_t result() const;

    const Tapes& tapes() const { return tapes_; }
    const Tape& tape(std::size_t index) const { return tapes_.at(index); }
    const TransitionTable& table() const { return *table_; }
    const std::string& initialTape() const { return initial_; }

private:
    StepResult fail(DiagnosticKind kind, StateId expected, const std::string& key, std::string message);

    const TransitionTable* table_;
    std::string initial_;
    Tapes tapes_{};
    const Transition* last_{nullptr};
    uint64_t steps_{0};
    bool failed_{false};
    StepResult failure_{StepResult::Ok};
    Diagnostic error_{};
};
