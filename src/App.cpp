#include "App.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

#include <SFML/Graphics/Color.hpp>
#include <SFML/Graphics/RectangleShape.hpp>

#include "Config.h"
#include "ConsoleView.h"
#include "MultiplicationProgram.h"


App::App(const RunOptions& options)
    : options_(options),
      tm_(multiplicationTable(options.variant), options.multiplier, options.multiplicand) {
    // Явно заданный шрифт или первый найденный моноширинный
    if (!options_.fontPath.empty()) {
        fontLoaded_ = font_.openFromFile(options_.fontPath);
    }
    for (const char* path : kFontCandidates) {
        if (fontLoaded_) {
            break;
        }
        fontLoaded_ = font_.openFromFile(path);
    }

    if (!fontLoaded_) {
        std::cerr << "Error: no usable font found, pass one with --font" << std::endl;
    }
}


App::Layout App::computeLayout(const sf::Vector2u& size) const {
    const float w = static_cast<float>(size.x);
    const float h = static_cast<float>(size.y);

    const float minTableH = 120.f;

    float controlH = std::max(48.f, h * 0.1f);

    float tapesH = h * 0.45f;
    if (tapesH > h - controlH - minTableH) {
        tapesH = std::max(80.f, h - controlH - minTableH);
    }

    Layout layout{};
    layout.tapes = {{0.f, 0.f}, {w, tapesH}};
    layout.controls = {{0.f, tapesH}, {w, controlH}};
    layout.table = {{0.f, tapesH + controlH}, {w, h - tapesH - controlH}};

    return layout;
}

void App::handleEvent(const sf::Event& event, sf::RenderWindow& window) {
    // Закрытие окна
    if (event.is<sf::Event::Closed>()) {
        window.close();
        return;
    }

    // Горячие клавиши
    if (const auto* key = event.getIf<sf::Event::KeyPressed>()) {
        switch (key->code) {
        case sf::Keyboard::Key::Escape:
            window.close();
            break;
        case sf::Keyboard::Key::Space:
            requestStep();
            break;
        case sf::Keyboard::Key::R:
            requestReset();
            break;
        case sf::Keyboard::Key::P:
            if (mode_ == AppMode::Running) {
                requestPause();
            } else {
                requestRun();
            }
            break;
        default:
            break;
        }
        return;
    }

    // ЛКМ
    if (const auto* mouse = event.getIf<sf::Event::MouseButtonPressed>()) {
        if (mouse->button == sf::Mouse::Button::Left) {
            const auto layout = computeLayout(window.getSize());
            const sf::Vector2f pos{static_cast<float>(mouse->position.x), static_cast<float>(mouse->position.y)};
            const sf::FloatRect controlsRect(layout.controls.pos, layout.controls.size);

            if (controlsRect.contains(pos)) {
                handleControlClick(pos, layout);
            }
        }
    }
}


void App::update(float dt) {
    if (mode_ != AppMode::Running) {
        return;
    }

    // Пауза между шагами (0 - шаг на каждый кадр)
    sinceStep_ += dt;
    const float delay = static_cast<float>(options_.delay.count()) / 1000.f;
    if (sinceStep_ < delay) {
        return;
    }
    sinceStep_ = 0.f;
    requestStep();
}


void App::render(sf::RenderWindow& window) {
    const auto layout = computeLayout(window.getSize());

    // Фон лент
    sf::RectangleShape tapesBg;
    tapesBg.setPosition(layout.tapes.pos);
    tapesBg.setSize(layout.tapes.size);
    tapesBg.setFillColor(sf::Color(45, 55, 70));

    // Фон панели управления
    sf::RectangleShape controlsBg;
    controlsBg.setPosition(layout.controls.pos);
    controlsBg.setSize(layout.controls.size);
    controlsBg.setFillColor(sf::Color(60, 55, 75));

    // Фон таблицы
    sf::RectangleShape tableBg;
    tableBg.setPosition(layout.table.pos);
    tableBg.setSize(layout.table.size);
    tableBg.setFillColor(sf::Color(50, 45, 60));

    window.clear(sf::Color(25, 25, 30));

    window.draw(tableBg);
    renderTable(window, layout);

    window.draw(controlsBg);
    renderControls(window, layout);

    window.draw(tapesBg);
    renderTapes(window, layout);

    window.display();
}


// renderTapes - Отрисовка трёх лент с головками по центру
void App::renderTapes(sf::RenderWindow& window, const Layout& layout) {
    if (!fontLoaded_) {
        return;
    }

    const float padding = tapePadding_;
    const float cellW = tapeCellWidth_;
    const float cellH = tapeCellHeight_;
    const float labelW = 80.f;

    const std::size_t visibleCells =
        static_cast<std::size_t>(std::max(1.f, std::floor((layout.tapes.size.x - 2.f * padding - labelW) / cellW)));
    const float rowH = (layout.tapes.size.y - 2.f * padding) / static_cast<float>(kTapeCount);

    sf::Text label(font_, "", static_cast<unsigned>(lineHeight_));
    label.setFillColor(sf::Color(200, 200, 210));

    sf::Text cellText(font_, "", static_cast<unsigned>(cellH * 0.55f));
    cellText.setFillColor(sf::Color(230, 230, 230));

    static const char* const kTapeLabels[kTapeCount] = {"Input", "Copy", "Product"};

    for (std::size_t t = 0; t < kTapeCount; t++) {
        const Tape& tape = tm_.tape(t);
        const float rowY = layout.tapes.pos.y + padding + rowH * static_cast<float>(t);
        const float startX = layout.tapes.pos.x + padding + labelW;
        const float startY = rowY + (rowH - cellH) * 0.5f;

        label.setString(kTapeLabels[t]);
        label.setPosition({layout.tapes.pos.x + padding, startY + (cellH - lineHeight_) * 0.5f});
        window.draw(label);

        // Головка всегда в центре видимой области
        const long long first = tape.head() - static_cast<long long>(visibleCells / 2);

        for (std::size_t i = 0; i < visibleCells; i++) {
            const long long cellIndex = first + static_cast<long long>(i);
            const Symbol sym = tape.get(cellIndex);
            const float x = startX + static_cast<float>(i) * cellW;

            sf::RectangleShape box;
            box.setPosition({x, startY});
            box.setSize({cellW - 4.f, cellH});

            // Головка выделяется оранжевым цветом
            const bool isHead = (cellIndex == tape.head());
            box.setFillColor(isHead ? sf::Color(200, 120, 60) : sf::Color(70, 80, 100));
            box.setOutlineThickness(1.f);
            box.setOutlineColor(sf::Color(30, 30, 40));
            window.draw(box);

            if (sym == kBlank) {
                continue;
            }

            cellText.setString(std::string(1, sym));
            const sf::FloatRect bounds = cellText.getLocalBounds();
            const float tx = x + (cellW - bounds.size.x) * 0.5f - bounds.position.x;
            const float ty = startY + (cellH - bounds.size.y) * 0.5f - bounds.position.y;
            cellText.setPosition({tx, ty});
            window.draw(cellText);
        }
    }
}


// buildControlButtons - Создание спецификаций кнопок управления
std::vector<App::ControlButtonSpec> App::buildControlButtons(const Layout& layout) const {
    const float padding = 8.f;
    const float spacing = 8.f;
    const float btnW = 96.f;
    const float btnH = 32.f;
    float x = layout.controls.pos.x + padding;
    const float y = layout.controls.pos.y + padding;

    std::vector<ControlButtonSpec> out;
    out.reserve(3);

    auto push = [&](std::string label, bool enabled) {
        ControlButtonSpec spec{};
        spec.rect = sf::FloatRect{sf::Vector2f{x, y}, sf::Vector2f{btnW, btnH}};
        spec.label = std::move(label);
        spec.enabled = enabled;
        out.push_back(std::move(spec));
        x += btnW + spacing;
    };

    const bool running = (mode_ == AppMode::Running);
    const bool finished = (mode_ == AppMode::Halted || mode_ == AppMode::Failed);

    push("Step", !running && !finished);
    push(running ? "Pause" : "Run", !finished);
    push("Reset", true);

    return out;
}


// handleControlClick - Обработка клика по кнопке управления
void App::handleControlClick(const sf::Vector2f& pos, const Layout& layout) {
    const auto buttons = buildControlButtons(layout);
    for (std::size_t i = 0; i < buttons.size(); i++) {
        if (!buttons[i].enabled || !buttons[i].rect.contains(pos)) {
            continue;
        }

        switch (i) {
        case 0:
            requestStep();
            return;
        case 1:
            if (mode_ == AppMode::Running) {
                requestPause();
            } else {
                requestRun();
            }
            return;
        case 2:
            requestReset();
            return;
        default:
            break;
        }
    }
}


void App::renderControls(sf::RenderWindow& window, const Layout& layout) {
    if (!fontLoaded_) {
        return;
    }

    const float padding = 8.f;
    const auto buttons = buildControlButtons(layout);

    sf::Text text(font_, "", static_cast<unsigned>(lineHeight_));
    text.setFillColor(sf::Color(230, 230, 240));

    for (const auto& btn : buttons) {
        sf::RectangleShape box;
        box.setPosition(btn.rect.position);
        box.setSize(btn.rect.size);

        const bool isRun = (btn.label == "Run");
        const bool isPause = (btn.label == "Pause");
        const sf::Color base = isRun ? sf::Color(70, 120, 90) : (isPause ? sf::Color(140, 110, 70) : sf::Color(80, 90, 110));
        const sf::Color disabled(60, 60, 70);

        box.setFillColor(btn.enabled ? base : disabled);
        box.setOutlineThickness(1.f);
        box.setOutlineColor(sf::Color(30, 30, 40));
        window.draw(box);

        text.setString(btn.label);
        const auto bounds = text.getLocalBounds();
        const float tx = btn.rect.position.x + (btn.rect.size.x - bounds.size.x) * 0.5f - bounds.position.x;
        const float ty = btn.rect.position.y + (btn.rect.size.y - bounds.size.y) * 0.5f - bounds.position.y;
        text.setPosition({tx, ty});
        window.draw(text);
    }

    // Статус справа
    text.setString(statusLine());
    if (mode_ == AppMode::Failed) {
        text.setFillColor(sf::Color(230, 120, 120));
    }
    const auto bounds = text.getLocalBounds();
    const float statusX = layout.controls.pos.x + layout.controls.size.x - padding - bounds.size.x - bounds.position.x;
    const float statusY = layout.controls.pos.y + padding - bounds.position.y;
    text.setPosition({statusX, statusY});
    window.draw(text);
}


// renderTable - Таблица переходов с подсветкой последнего перехода
void App::renderTable(sf::RenderWindow& window, const Layout& layout) {
    if (!fontLoaded_) {
        return;
    }

    const float padding = 8.f;
    const float headerH = 28.f;
    const float colW = 140.f;

    static const char* const kHeaders[] = {"State", "Read", "Write", "Move", "Next"};

    sf::Text text(font_, "", static_cast<unsigned>(lineHeight_));
    text.setFillColor(sf::Color(220, 220, 230));

    // Фон заголовка
    sf::RectangleShape headerBg;
    headerBg.setPosition(layout.table.pos);
    headerBg.setSize({layout.table.size.x, headerH + padding});
    headerBg.setFillColor(sf::Color(70, 65, 85));
    window.draw(headerBg);

    text.setStyle(sf::Text::Bold);
    const float baseY = layout.table.pos.y + padding + (headerH - lineHeight_) * 0.5f;
    for (std::size_t col = 0; col < 5; col++) {
        text.setString(kHeaders[col]);
        text.setPosition({layout.table.pos.x + padding + colW * static_cast<float>(col) + 6.f, baseY});
        window.draw(text);
    }

    const auto& rows = tm_.table().rows();
    const int active = tm_.table().indexOf(tm_.lastTransition());
    const std::size_t maxVisible = static_cast<std::size_t>(
        std::max(1.f, std::floor((layout.table.size.y - headerH - padding * 2.f) / tableRowHeight_)));

    // Прокрутка так, чтобы активная строка оставалась видимой
    std::size_t startRow = 0;
    if (active >= 0 && static_cast<std::size_t>(active) >= maxVisible) {
        startRow = static_cast<std::size_t>(active) + 1 - maxVisible;
    }
    const std::size_t endRow = std::min(rows.size(), startRow + maxVisible);

    float rowY = layout.table.pos.y + padding + headerH;
    text.setStyle(sf::Text::Regular);

    for (std::size_t r = startRow; r < endRow; r++) {
        const Transition& row = rows[r];
        const bool isActive = (static_cast<int>(r) == active);

        // Чередующийся фон, активная строка выделяется
        sf::RectangleShape rowBg;
        rowBg.setPosition({layout.table.pos.x, rowY});
        rowBg.setSize({layout.table.size.x, tableRowHeight_});
        if (isActive) {
            rowBg.setFillColor(sf::Color(200, 120, 60));
        } else {
            rowBg.setFillColor((r % 2) == 0 ? sf::Color(60, 55, 70) : sf::Color(55, 50, 65));
        }
        window.draw(rowBg);

        const std::string cells[] = {
            "q" + std::to_string(row.state),
            row.readKey(),
            row.writeKey(),
            row.moveKey(),
            row.halts() ? std::string("halt") : "q" + std::to_string(row.nextState),
        };
        for (std::size_t col = 0; col < 5; col++) {
            text.setString(cells[col]);
            text.setPosition({layout.table.pos.x + padding + colW * static_cast<float>(col) + 6.f,
                              rowY + (tableRowHeight_ - lineHeight_) * 0.5f});
            window.draw(text);
        }

        rowY += tableRowHeight_;
    }
}


std::string App::statusLine() const {
    std::string out = std::to_string(options_.multiplier) + " x " + std::to_string(options_.multiplicand) +
                      "  Step #" + std::to_string(tm_.steps()) + "  Mode: ";
    switch (mode_) {
    case AppMode::Ready: out += "Ready"; break;
    case AppMode::Running: out += "Running"; break;
    case AppMode::Paused: out += "Paused"; break;
    case AppMode::Halted: out += "Halted  Result: " + std::to_string(tm_.result()); break;
    case AppMode::Failed: out += "Error: " + tm_.error().message; break;
    }
    return out;
}


// requestReset - Сброс машины в начальное состояние
void App::requestReset() {
    tm_.reset();
    sinceStep_ = 0.f;
    mode_ = AppMode::Ready;
}

// requestStep - Выполнение одного шага машины
void App::requestStep() {
    if (mode_ == AppMode::Halted || mode_ == AppMode::Failed) {
        return;
    }

    const StepResult result = tm_.step();

    switch (result) {
    case StepResult::Ok:
        // Шаг успешен - сохраняем текущий режим
        if (mode_ != AppMode::Running && mode_ != AppMode::Paused) {
            mode_ = AppMode::Ready;
        }
        break;
    case StepResult::Halted:
        mode_ = AppMode::Halted;
        std::cout << formatSummary(options_.multiplier, options_.multiplicand, tm_.result(), tm_.steps())
                  << std::endl;
        break;
    case StepResult::NoTransition:
    case StepResult::InvalidMove:
        mode_ = AppMode::Failed;
        std::cerr << "Error: " << tm_.error().message << " at step " << tm_.error().step << std::endl;
        break;
    }
}

// requestRun - Запуск автоматического выполнения
void App::requestRun() {
    if (mode_ == AppMode::Halted || mode_ == AppMode::Failed) {
        return;
    }
    sinceStep_ = 0.f;
    mode_ = AppMode::Running;
}

// requestPause - Пауза автоматического выполнения
void App::requestPause() {
    if (mode_ == AppMode::Running) {
        mode_ = AppMode::Paused;
    }
}
