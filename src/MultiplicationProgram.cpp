#include "MultiplicationProgram.h"

#include <iostream>
#include <vector>

namespace {

struct RowSpec {
    StateId state;
    const char* read;
    const char* write;
    const char* move;
    StateId next;
};

// Ленты: 0 - множители, 1 - копия множителя, 2 - произведение
constexpr RowSpec kBaseRows[] = {
    {0, "0BB", "B0B", "RRN", 0},  // перенос множителя на ленту 1
    {0, "1BB", "BBB", "RNN", 1},  // разделитель
    {1, "0BB", "0BB", "NLN", 2},  // очередной ноль множимого
    {1, "BBB", "BBB", "NNN", kHaltState},
    {2, "00B", "00B", "NLN", 2},  // возврат к началу копии
    {2, "0BB", "0BB", "NRN", 3},
    {3, "0BB", "BBB", "RNN", 1},  // ноль множимого израсходован
    {3, "00B", "000", "NRR", 3},  // дописать копию в произведение
};

TransitionTable buildTable(ProgramVariant variant) {
    TransitionTable table;
    table.startState = 0;

    std::vector<Diagnostic> diags;
    bool ok = true;
    for (const auto& row : kBaseRows) {
        StateId next = row.next;
        if (variant == ProgramVariant::Extended && row.state == 1 && next == kHaltState) {
            next = 4;
        }
        ok = table.addRow(row.state, row.read, row.write, row.move, next, diags) && ok;

        if (variant == ProgramVariant::Extended && row.state == 1 && row.next == kHaltState) {
            // Служебное состояние перед остановом
            ok = table.addRow(4, "BBB", "BBB", "NNN", kHaltState, diags) && ok;
        }
    }

    ok = table.validate(diags) && ok;
    if (!ok) {
        for (const auto& diag : diags) {
            std::cerr << "Error: " << diag.message << std::endl;
        }
    }
    return table;
}

} // namespace

const TransitionTable& multiplicationTable(ProgramVariant variant) {
    if (variant == ProgramVariant::Extended) {
        static const TransitionTable extended = buildTable(ProgramVariant::Extended);
        return extended;
    }
    static const TransitionTable base = buildTable(ProgramVariant::Base);
    return base;
}

std::string multiplicationInput(unsigned multiplier, unsigned multiplicand) {
    std::string out(multiplier, '0');
    out += '1';
    out.append(multiplicand, '0');
    return out;
}
