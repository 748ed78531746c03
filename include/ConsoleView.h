#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

#include "TransitionTable.h"
#include "TuringMachine.h"

/** @brief Лента в виде |c|c|...| вокруг головки */
std::string formatTape(const Tape& tape, std::size_t padding);

/** @brief Блок с описанием перехода (пустые поля до первого шага) */
std::string formatTransition(const Transition* transition);

/**
 * @brief Полный отчёт о состоянии машины
 *
 * Операнды, последний переход, номер шага, маркер головки
 * и все три ленты.
 */
std::string formatReport(const TuringMachine& tm, unsigned multiplier, unsigned multiplicand,
                         std::size_t padding);

/**
 * @brief ASCII-диаграмма состояний таблицы
 *
 * Активное состояние (преемник последнего перехода) обведено '#',
 * последний выполненный переход помечен '>'.
 */
std::string formatDiagram(const TransitionTable& table, const Transition* last);

/** @brief Итоговая строка вычисления */
std::string formatSummary(unsigned multiplier, unsigned multiplicand, std::size_t result, uint64_t steps);

/** @brief Очистить экран терминала (ANSI) */
void clearScreen(std::ostream& out);
