#pragma once

#include <chrono>
#include <string>

#include "MultiplicationProgram.h"

/** @brief Параметры запуска из командной строки */
struct RunOptions {
    unsigned multiplier{0};
    unsigned multiplicand{0};
    bool interactive{false};            ///< Ждать Enter после каждого шага
    bool sleep{false};                  ///< Пауза между шагами
    std::chrono::milliseconds delay{0}; ///< Длительность паузы
    bool printSteps{false};             ///< Печатать отчёт перед каждым шагом
    bool clearScreen{false};            ///< Очищать экран перед отчётом
    bool diagram{false};                ///< Добавлять диаграмму состояний
    bool gui{false};                    ///< Запустить окно SFML
    bool help{false};
    ProgramVariant variant{ProgramVariant::Base};
    std::string fontPath;
};

/**
 * @brief Разобрать аргументы командной строки
 * @param error Описание ошибки, если разбор не удался
 * @return false при неверных или отсутствующих аргументах
 */
bool parseCommandLine(int argc, const char* const* argv, RunOptions& out, std::string& error);

/** @brief Текст справки */
std::string usage(const std::string& program);
