#pragma once

#include <string>
#include <vector>

#include <SFML/Graphics/Font.hpp>
#include <SFML/Graphics/RenderWindow.hpp>
#include <SFML/Graphics/Text.hpp>
#include <SFML/Window/Event.hpp>

#include "CommandLine.h"
#include "TuringMachine.h"

enum class AppMode {
    Ready,
    Running,
    Paused,
    Halted,
    Failed
};

/** @brief Окно визуализации трёхленточной машины */
class App {
public:
    explicit App(const RunOptions& options);

    /** @brief Шрифт загружен (без него ничего не рисуется) */
    bool fontLoaded() const { return fontLoaded_; }

    /**
     * @brief Обработать событие SFML (ввод пользователя)
     * @param event Событие (нажатие клавиши, клик мыши и т.д.)
     * @param window Окно для закрытия при необходимости
     */
    void handleEvent(const sf::Event& event, sf::RenderWindow& window);

    /**
     * @brief Обновить состояние приложения
     * @param dt Время с предыдущего кадра в секундах
     *
     * В режиме Running выполняет шаги с заданной паузой.
     */
    void update(float dt);

    /**
     * @brief Отрисовать весь интерфейс
     * @param window Окно для отрисовки
     */
    void render(sf::RenderWindow& window);

    /** @brief Сбросить машину в начальное состояние */
    void requestReset();

    /** @brief Выполнить один шаг машины */
    void requestStep();

    /** @brief Запустить автоматическое выполнение */
    void requestRun();

    /** @brief Приостановить автоматическое выполнение */
    void requestPause();

private:
    /** @brief Прямоугольная область экрана */
    struct Region {
        sf::Vector2f pos;
        sf::Vector2f size;
    };

    /** @brief Раскладка всех областей интерфейса */
    struct Layout {
        Region tapes;
        Region controls;
        Region table;
    };

    /** @brief Описание кнопки управления */
    struct ControlButtonSpec {
        sf::FloatRect rect;
        std::string label;
        bool enabled{true};
    };

    /** @brief Вычислить раскладку на основе размера окна */
    Layout computeLayout(const sf::Vector2u& size) const;

    /** @brief Отрисовать три ленты */
    void renderTapes(sf::RenderWindow& window, const Layout& layout);

    /** @brief Отрисовать панель управления с кнопками и статусом */
    void renderControls(sf::RenderWindow& window, const Layout& layout);

    /** @brief Отрисовать таблицу переходов */
    void renderTable(sf::RenderWindow& window, const Layout& layout);

    /** @brief Обработать клик по панели управления */
    void handleControlClick(const sf::Vector2f& pos, const Layout& layout);

    /** @brief Построить список кнопок управления */
    std::vector<ControlButtonSpec> buildControlButtons(const Layout& layout) const;

    /** @brief Строка статуса */
    std::string statusLine() const;

    RunOptions options_;
    TuringMachine tm_;
    AppMode mode_{AppMode::Ready};
    float sinceStep_{0.f};

    sf::Font font_;
    bool fontLoaded_{false};
    float lineHeight_{18.f};

    // Параметры отображения ленты
    float tapeCellWidth_{36.f};
    float tapeCellHeight_{40.f};
    float tapePadding_{8.f};

    float tableRowHeight_{24.f};
};
