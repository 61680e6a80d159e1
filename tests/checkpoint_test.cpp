#include <gtest/gtest.h>

#include <filesystem>

#include "extensions/checkpoint.hpp"
#include "test_helpers.hpp"

using rcopy::extensions::CheckpointStore;
using rcopy::extensions::parse_offset;
using rcopy::infra::ErrorCode;

TEST(ParseOffsetTest, AcceptsPlainDecimal)
{
    auto v = parse_offset("10485760");
    ASSERT_TRUE(v);
    EXPECT_EQ(*v, 10485760u);
}

TEST(ParseOffsetTest, IgnoresWhitespaceAndTrailingLines)
{
    EXPECT_EQ(parse_offset("  42\r\n").value(), 42u);
    EXPECT_EQ(parse_offset("\t7\nrest of file").value(), 7u);
    EXPECT_EQ(parse_offset("+15").value(), 15u);
}

TEST(ParseOffsetTest, RejectsAnythingElse)
{
    for (const char* text : {"", "   ", "abc", "12abc", "-5", "1.5", "+", "18446744073709551616"}) {
        auto v = parse_offset(text);
        ASSERT_FALSE(v) << "'" << text << "' parsed as " << *v;
        EXPECT_EQ(v.error().code, ErrorCode::ResumeState) << text;
    }
}

TEST(CheckpointStoreTest, LoadCreatesFileWithZero)
{
    rcopy::test::TempDir dir;
    CheckpointStore store{dir / "dst.offset"};

    auto offset = store.load();
    ASSERT_TRUE(offset);
    EXPECT_EQ(*offset, 0u);
    EXPECT_TRUE(store.created());
    ASSERT_TRUE(store.close());

    EXPECT_EQ(rcopy::test::read_text(dir / "dst.offset"), "0");
}

TEST(CheckpointStoreTest, LoadReadsExistingOffset)
{
    rcopy::test::TempDir dir;
    rcopy::test::write_text(dir / "dst.offset", "12345");

    CheckpointStore store{dir / "dst.offset"};
    auto offset = store.load();
    ASSERT_TRUE(offset);
    EXPECT_EQ(*offset, 12345u);
    EXPECT_FALSE(store.created());
    EXPECT_EQ(store.last_persisted(), 12345u);
}

TEST(CheckpointStoreTest, LoadRejectsCorruptContent)
{
    rcopy::test::TempDir dir;
    rcopy::test::write_text(dir / "dst.offset", "not a number");

    CheckpointStore store{dir / "dst.offset"};
    auto offset = store.load();
    ASSERT_FALSE(offset);
    EXPECT_EQ(offset.error().code, ErrorCode::ResumeState);
    EXPECT_NE(offset.error().message.find("dst.offset"), std::string::npos);

    // содержимое не трогаем
    EXPECT_EQ(rcopy::test::read_text(dir / "dst.offset"), "not a number");
}

TEST(CheckpointStoreTest, PersistReplacesWholeContent)
{
    rcopy::test::TempDir dir;
    rcopy::test::write_text(dir / "dst.offset", "00000000000000000007\n");

    CheckpointStore store{dir / "dst.offset"};
    ASSERT_EQ(store.load().value(), 7u);

    ASSERT_TRUE(store.persist(8));
    EXPECT_EQ(rcopy::test::read_text(dir / "dst.offset"), "8");

    ASSERT_TRUE(store.persist(123456));
    EXPECT_EQ(rcopy::test::read_text(dir / "dst.offset"), "123456");
    EXPECT_EQ(store.last_persisted(), 123456u);
}

TEST(CheckpointStoreTest, PersistNeverMovesBackwards)
{
    rcopy::test::TempDir dir;
    rcopy::test::write_text(dir / "dst.offset", "100");

    CheckpointStore store{dir / "dst.offset"};
    ASSERT_TRUE(store.load());

    auto res = store.persist(50);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::InvariantViolation);
    EXPECT_EQ(rcopy::test::read_text(dir / "dst.offset"), "100");

    // то же значение допустимо
    EXPECT_TRUE(store.persist(100));
}

TEST(CheckpointStoreTest, PersistBeforeLoadFails)
{
    rcopy::test::TempDir dir;
    CheckpointStore store{dir / "dst.offset"};

    auto res = store.persist(1);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::InvariantViolation);
    EXPECT_FALSE(std::filesystem::exists(dir / "dst.offset"));
}
