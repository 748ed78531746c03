#pragma once

#include <cstddef>
#include <cstdint>

/** @brief Идентификатор состояния машины Тьюринга */
using StateId = int;

/** @brief Символ алфавита ленты: '0', '1' или 'B' (пусто) */
using Symbol = char;

/** @brief Пустой символ ленты */
constexpr Symbol kBlank = 'B';

/** @brief Терминальное состояние (останов) */
constexpr StateId kHaltState = -1;

/** @brief Требуемое состояние не задано (первый шаг) */
constexpr StateId kAnyState = -2;

/** @brief Количество лент машины */
constexpr std::size_t kTapeCount = 3;

/** @brief Направление движения головки */
enum class Move { Left, Right, Stay };
