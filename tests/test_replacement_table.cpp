#include <gtest/gtest.h>
#include "core/replacement/replacement_table.hpp"

using namespace wordguard;

TEST(ReplacementTableTest, SpecialCharactersOnly) {
    auto table = ReplacementTable::build(true, false);

    EXPECT_EQ(table.size(), 21u);
    EXPECT_TRUE(table.is_special(U'-'));
    EXPECT_TRUE(table.is_special(U'_'));
    EXPECT_TRUE(table.is_special(U'$'));
    EXPECT_FALSE(table.is_leet(U'$'));
    EXPECT_FALSE(table.is_leet(U'4'));

    char32_t replacement = 0;
    EXPECT_FALSE(table.lookup(U'4', replacement));
}

TEST(ReplacementTableTest, LeetSpeakOnly) {
    auto table = ReplacementTable::build(false, true);

    EXPECT_EQ(table.size(), 12u);
    EXPECT_FALSE(table.is_special(U'-'));

    char32_t replacement = 0;
    ASSERT_TRUE(table.lookup(U'4', replacement));
    EXPECT_EQ(replacement, U'a');
    ASSERT_TRUE(table.lookup(U'$', replacement));
    EXPECT_EQ(replacement, U's');
    ASSERT_TRUE(table.lookup(U'<', replacement));
    EXPECT_EQ(replacement, U'c');
}

TEST(ReplacementTableTest, LeetSpeakOverridesSharedKeys) {
    auto table = ReplacementTable::build(true, true);

    // 21 special + 12 leet, 6 keys shared
    EXPECT_EQ(table.size(), 27u);
    for (char32_t shared : {U'$', U'!', U'+', U'#', U'@', U'<'}) {
        EXPECT_TRUE(table.is_leet(shared));
        EXPECT_FALSE(table.is_special(shared));
    }
    EXPECT_TRUE(table.is_special(U'.'));
    EXPECT_TRUE(table.is_special(U'('));
}

TEST(ReplacementTableTest, NothingEnabled) {
    EXPECT_TRUE(ReplacementTable::build(false, false).empty());
}

TEST(ReplacementTableTest, DefaultsMatchFullBuild) {
    EXPECT_EQ(ReplacementTable::defaults(), ReplacementTable::build(true, true));
    EXPECT_NE(ReplacementTable::defaults(), ReplacementTable::build(true, false));
}

TEST(ReplacementTableTest, ClassificationDependsOnValueOnly) {
    ReplacementTable table({{U'9', U'g'}, {U'^', U' '}});

    EXPECT_TRUE(table.is_leet(U'9'));
    EXPECT_TRUE(table.is_special(U'^'));

    table.set(U'9', U' ');
    EXPECT_TRUE(table.is_special(U'9'));
    EXPECT_FALSE(table.is_leet(U'9'));
}

TEST(ReplacementTableTest, KeysAreLowercased) {
    ReplacementTable table(ReplacementTable::Map{{U'A', U'4'}});

    char32_t replacement = 0;
    EXPECT_TRUE(table.lookup(U'a', replacement));
    EXPECT_FALSE(table.lookup(U'A', replacement));

    table.set(U'B', U'8');
    EXPECT_TRUE(table.lookup(U'b', replacement));
    EXPECT_EQ(replacement, U'8');

    table.erase(U'B');
    EXPECT_FALSE(table.lookup(U'b', replacement));
    EXPECT_EQ(table.size(), 1u);
}
