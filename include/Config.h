#pragma once

#include <array>
#include <chrono>
#include <cstddef>

/** @brief Число ячеек слева и справа от головки при выводе ленты */
constexpr std::size_t kPrintPadding = 15;

/** @brief Пауза между шагами по умолчанию */
constexpr std::chrono::milliseconds kDefaultStepDelay{100};

/** @brief Размер окна визуализатора */
constexpr unsigned kWindowWidth = 1280;
constexpr unsigned kWindowHeight = 720;

/** @brief Моноширинные шрифты, которые пробуются по очереди */
constexpr std::array<const char*, 4> kFontCandidates = {
    "/usr/share/fonts/truetype/dejavu/DejaVuSansMono.ttf",
    "/usr/share/fonts/TTF/DejaVuSansMono.ttf",
    "/usr/share/fonts/dejavu/DejaVuSansMono.ttf",
    "C:/Windows/Fonts/consola.ttf",
};
