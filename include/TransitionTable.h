#pragma once

#include <array>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "Diagnostics.h"
#include "Types.h"

/** @brief Одно правило перехода многоленточной машины Тьюринга */
struct Transition {
    StateId state{0};
    std::array<Symbol, kTapeCount> read{kBlank, kBlank, kBlank};
    std::array<Symbol, kTapeCount> write{kBlank, kBlank, kBlank};
    std::array<Move, kTapeCount> move{Move::Stay, Move::Stay, Move::Stay};
    StateId nextState{kHaltState};

    /** @brief Составной ключ чтения ("0BB") */
    std::string readKey() const;

    /** @brief Шаблон записи ("B0B") */
    std::string writeKey() const;

    /** @brief Шаблон движения ("RRN") */
    std::string moveKey() const;

    /** @brief Переход ведёт в останов */
    bool halts() const { return nextState == kHaltState; }
};

/** @brief Разобрать символ направления (L, R, N) */
bool parseMove(char c, Move& out);

/** @brief Символ направления для вывода */
char moveChar(Move move);

/** @brief Проверить принадлежность символа алфавиту {0, 1, B} */
bool isTapeSymbol(char c);

/**
 * @brief Таблица переходов (программа) машины Тьюринга
 *
 * Строки хранятся в порядке определения. Поиск идёт по ключу
 * (требуемое состояние, составной ключ чтения); без предыдущего
 * перехода подходит любое состояние, и побеждает первая строка
 * в порядке определения.
 */
class TransitionTable {
public:
    StateId startState{0};

    /** @brief Добавить правило перехода (false при повторе пары состояние/ключ) */
    bool add(const Transition& transition);

    /**
     * @brief Добавить правило из текстовых шаблонов
     * @param state Номер состояния строки
     * @param read Ключ чтения, по символу на ленту ("0BB")
     * @param write Шаблон записи ("B0B")
     * @param move Шаблон движения ("RRN")
     * @param next Следующее состояние или kHaltState
     * @param out Сюда добавляется диагностика при ошибке
     */
    bool addRow(StateId state, std::string_view read, std::string_view write,
                std::string_view move, StateId next, std::vector<Diagnostic>& out);

    /**
     * @brief Найти переход
     * @param requiredState Номер состояния или kAnyState
     * @param key Составной ключ чтения
     * @return nullptr если не найден
     */
    const Transition* find(StateId requiredState, const std::string& key) const;

    /** @brief Проверить наличие перехода */
    bool has(StateId requiredState, const std::string& key) const;

    /** @brief Строки таблицы в порядке определения */
    const std::vector<Transition>& rows() const { return rows_; }

    /** @brief Индекс строки в rows() (или -1) */
    int indexOf(const Transition* transition) const;

    /** @brief Получить все состояния (без останова) */
    std::vector<StateId> states() const;

    /** @brief Проверить корректность таблицы */
    bool validate(std::vector<Diagnostic>& out) const;

    std::size_t size() const { return rows_.size(); }
    bool empty() const { return rows_.empty(); }

private:
    struct Key {
        StateId state;
        std::string read;
        bool operator==(const Key& other) const {
            return state == other.state && read == other.read;
        }
    };

    struct KeyHash {
        std::size_t operator()(const Key& key) const noexcept {
            const std::size_t hs = std::hash<StateId>{}(key.state);
            const std::size_t hread = std::hash<std::string>{}(key.read);
            return hs ^ (hread << 1);
        }
    };

    std::vector<Transition> rows_;
    std::unordered_map<Key, std::size_t, KeyHash> index_;
};
