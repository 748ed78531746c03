#pragma once

#include <string>

#include "TransitionTable.h"

/** @brief Вариант программы унарного умножения */
enum class ProgramVariant {
    Base,     ///< 8 строк, останов прямо из состояния 1
    Extended  ///< 9 строк, останов через служебное состояние 4
};

/** @brief Статическая таблица переходов унарного умножения (строится один раз) */
const TransitionTable& multiplicationTable(ProgramVariant variant = ProgramVariant::Base);

/** @brief Начальное содержимое первой ленты: 0^multiplier 1 0^multiplicand */
std::string multiplicationInput(unsigned multiplier, unsigned multiplicand);
