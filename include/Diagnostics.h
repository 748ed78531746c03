#pragma once

#include <cstdint>
#include <string>

#include "Types.h"

/** @brief Уровень диагностического сообщения */
enum class DiagnosticLevel { Error, Warning, Info };

/** @brief Вид ошибки машины или таблицы переходов */
enum class DiagnosticKind {
    None,
    InvalidDirection,      ///< Направление вне {L, R, N}
    NoMatchingTransition,  ///< Нет строки для ключа и требуемого состояния
    InvalidRow,            ///< Некорректная строка таблицы
    DuplicateRow,          ///< Повтор пары (состояние, ключ)
    UndefinedState         ///< Переход в состояние без строк
};

/** @brief Диагностическое сообщение от таблицы переходов или машины */
struct Diagnostic {
    DiagnosticLevel level{DiagnosticLevel::Error};
    DiagnosticKind kind{DiagnosticKind::None};
    uint64_t step{0};
    std::string key;
    StateId expectedState{kHaltState};
    std::string message;
};
