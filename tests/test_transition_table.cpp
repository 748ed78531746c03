#include <gtest/gtest.h>

#include <vector>

#include "MultiplicationProgram.h"
#include "TransitionTable.h"

namespace {

TEST(TransitionTableTest, AddRowParsesPatterns) {
    TransitionTable table;
    std::vector<Diagnostic> diags;
    ASSERT_TRUE(table.addRow(0, "0BB", "B0B", "RRN", 0, diags));
    EXPECT_TRUE(diags.empty());

    const Transition* t = table.find(0, "0BB");
    ASSERT_NE(t, nullptr);
    EXPECT_EQ(t->state, 0);
    EXPECT_EQ(t->readKey(), "0BB");
    EXPECT_EQ(t->writeKey(), "B0B");
    EXPECT_EQ(t->moveKey(), "RRN");
    EXPECT_EQ(t->move[0], Move::Right);
    EXPECT_EQ(t->move[2], Move::Stay);
    EXPECT_FALSE(t->halts());
}

TEST(TransitionTableTest, UnknownDirectionIsReported) {
    TransitionTable table;
    std::vector<Diagnostic> diags;
    EXPECT_FALSE(table.addRow(0, "0BB", "B0B", "RXN", 0, diags));
    ASSERT_EQ(diags.size(), 1u);
    EXPECT_EQ(diags[0].kind, DiagnosticKind::InvalidDirection);
    EXPECT_EQ(diags[0].key, "0BB");
    EXPECT_TRUE(table.empty());
}

TEST(TransitionTableTest, MalformedRowsAreRejected) {
    TransitionTable table;
    std::vector<Diagnostic> diags;
    EXPECT_FALSE(table.addRow(0, "0B", "B0B", "RRN", 0, diags));
    EXPECT_FALSE(table.addRow(0, "0BX", "B0B", "RRN", 0, diags));
    EXPECT_FALSE(table.addRow(-5, "0BB", "B0B", "RRN", 0, diags));
    ASSERT_EQ(diags.size(), 3u);
    for (const auto& diag : diags) {
        EXPECT_EQ(diag.kind, DiagnosticKind::InvalidRow);
    }
}

TEST(TransitionTableTest, DuplicateStateAndKeyIsRejected) {
    TransitionTable table;
    std::vector<Diagnostic> diags;
    ASSERT_TRUE(table.addRow(1, "BBB", "BBB", "NNN", kHaltState, diags));
    EXPECT_FALSE(table.addRow(1, "BBB", "000", "NNN", 1, diags));
    ASSERT_EQ(diags.size(), 1u);
    EXPECT_EQ(diags[0].kind, DiagnosticKind::DuplicateRow);
    EXPECT_EQ(table.size(), 1u);
}

TEST(TransitionTableTest, AnyStateLookupPrefersDefinitionOrder) {
    TransitionTable table;
    std::vector<Diagnostic> diags;
    ASSERT_TRUE(table.addRow(3, "0BB", "BBB", "RNN", 1, diags));
    ASSERT_TRUE(table.addRow(1, "0BB", "0BB", "NLN", 3, diags));

    const Transition* any = table.find(kAnyState, "0BB");
    ASSERT_NE(any, nullptr);
    EXPECT_EQ(any->state, 3);

    const Transition* one = table.find(1, "0BB");
    ASSERT_NE(one, nullptr);
    EXPECT_EQ(one->state, 1);

    EXPECT_EQ(table.find(2, "0BB"), nullptr);
    EXPECT_FALSE(table.has(kAnyState, "1BB"));
}

TEST(TransitionTableTest, AddRejectsReservedSuccessor) {
    Transition t;
    t.state = 0;
    t.read = {'0', kBlank, kBlank};
    t.nextState = kAnyState;

    TransitionTable table;
    EXPECT_FALSE(table.add(t));
    EXPECT_TRUE(table.empty());
    EXPECT_FALSE(table.has(kAnyState, "0BB"));

    t.nextState = kHaltState;
    EXPECT_TRUE(table.add(t));
    t.state = 1;
    t.nextState = 0;
    EXPECT_TRUE(table.add(t));
    EXPECT_EQ(table.size(), 2u);
}

TEST(TransitionTableTest, IndexOfMatchesRows) {
    const TransitionTable& table = multiplicationTable();
    EXPECT_EQ(table.indexOf(nullptr), -1);
    EXPECT_EQ(table.indexOf(&table.rows()[3]), 3);

    Transition outside;
    EXPECT_EQ(table.indexOf(&outside), -1);
}

TEST(TransitionTableTest, ValidateFindsUndefinedSuccessor) {
    TransitionTable table;
    std::vector<Diagnostic> diags;
    ASSERT_TRUE(table.addRow(0, "0BB", "B0B", "RRN", 7, diags));
    EXPECT_FALSE(table.validate(diags));
    ASSERT_EQ(diags.size(), 1u);
    EXPECT_EQ(diags[0].kind, DiagnosticKind::UndefinedState);
    EXPECT_EQ(diags[0].expectedState, 7);
}

TEST(TransitionTableTest, ValidateFindsMissingStartState) {
    TransitionTable table;
    table.startState = 2;
    std::vector<Diagnostic> diags;
    ASSERT_TRUE(table.addRow(0, "BBB", "BBB", "NNN", kHaltState, diags));
    EXPECT_FALSE(table.validate(diags));
    ASSERT_EQ(diags.size(), 1u);
    EXPECT_EQ(diags[0].expectedState, 2);
}

TEST(MultiplicationProgramTest, BaseTableIsVerbatim) {
    const TransitionTable& table = multiplicationTable(ProgramVariant::Base);
    ASSERT_EQ(table.size(), 8u);

    struct Expected {
        StateId state;
        const char* read;
        const char* write;
        const char* move;
        StateId next;
    };
    const Expected rows[] = {
        {0, "0BB", "B0B", "RRN", 0},
        {0, "1BB", "BBB", "RNN", 1},
        {1, "0BB", "0BB", "NLN", 2},
        {1, "BBB", "BBB", "NNN", kHaltState},
        {2, "00B", "00B", "NLN", 2},
        {2, "0BB", "0BB", "NRN", 3},
        {3, "0BB", "BBB", "RNN", 1},
        {3, "00B", "000", "NRR", 3},
    };

    for (std::size_t i = 0; i < table.size(); i++) {
        const Transition& row = table.rows()[i];
        EXPECT_EQ(row.state, rows[i].state) << "row " << i;
        EXPECT_EQ(row.readKey(), rows[i].read) << "row " << i;
        EXPECT_EQ(row.writeKey(), rows[i].write) << "row " << i;
        EXPECT_EQ(row.moveKey(), rows[i].move) << "row " << i;
        EXPECT_EQ(row.nextState, rows[i].next) << "row " << i;
    }

    std::vector<Diagnostic> diags;
    EXPECT_TRUE(table.validate(diags));
}

TEST(MultiplicationProgramTest, ExtendedTableRoutesThroughStateFour) {
    const TransitionTable& table = multiplicationTable(ProgramVariant::Extended);
    ASSERT_EQ(table.size(), 9u);

    const Transition* done = table.find(1, "BBB");
    ASSERT_NE(done, nullptr);
    EXPECT_EQ(done->nextState, 4);

    const Transition* bookkeeping = table.find(4, "BBB");
    ASSERT_NE(bookkeeping, nullptr);
    EXPECT_TRUE(bookkeeping->halts());
    EXPECT_EQ(bookkeeping->moveKey(), "NNN");

    std::vector<Diagnostic> diags;
    EXPECT_TRUE(table.validate(diags));
}

TEST(MultiplicationProgramTest, EachVariantIsBuiltOnce) {
    const TransitionTable& extended = multiplicationTable(ProgramVariant::Extended);
    const TransitionTable& base = multiplicationTable(ProgramVariant::Base);
    EXPECT_EQ(&extended, &multiplicationTable(ProgramVariant::Extended));
    EXPECT_EQ(&base, &multiplicationTable());
    EXPECT_NE(&base, &extended);
}

TEST(MultiplicationProgramTest, InputEncodesOperandsInUnary) {
    EXPECT_EQ(multiplicationInput(0, 0), "1");
    EXPECT_EQ(multiplicationInput(2, 3), "001000");
    EXPECT_EQ(multiplicationInput(0, 2), "100");
}

TEST(MultiplicationProgramTest, StatesExcludeHalt) {
    const auto states = multiplicationTable().states();
    EXPECT_EQ(states, (std::vector<StateId>{0, 1, 2, 3}));
}

}  // namespace
