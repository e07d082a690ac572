#include "gtest/gtest.h"
#include "record_decoder.hpp"
#include "fake_journal_store.hpp"

#include <cerrno>
#include <memory>
#include <string>
#include <vector>

TEST(SplitFieldTest, SplitsOnFirstSeparatorOnly) {
    std::string name;
    std::string value;
    Result res = SplitField(Slice("MESSAGE=hello=world"), &name, &value);
    ASSERT_TRUE(res.ok()) << res.ToString();
    ASSERT_EQ(name, "MESSAGE");
    ASSERT_EQ(value, "hello=world");
}

TEST(SplitFieldTest, EmptyValue) {
    std::string name;
    std::string value = "stale";
    ASSERT_TRUE(SplitField(Slice("SYSLOG_IDENTIFIER="), &name, &value).ok());
    ASSERT_EQ(name, "SYSLOG_IDENTIFIER");
    ASSERT_EQ(value, "");
}

TEST(SplitFieldTest, MissingSeparatorIsCorruption) {
    std::string name;
    std::string value;
    Result res = SplitField(Slice("NOSEPARATOR"), &name, &value);
    ASSERT_FALSE(res.ok());
    ASSERT_EQ(res.code(), ResultCode::kCorruption);
}

TEST(SplitFieldTest, NullOutputs) {
    std::string name;
    ASSERT_EQ(SplitField(Slice("A=b"), &name, nullptr).code(), ResultCode::kInvalidArgument);
}

class RecordDecoderTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeJournalState> state_ = std::make_shared<FakeJournalState>();
    std::unique_ptr<FakeJournalStore> store_;

    // Opens the fake and moves onto its first entry.
    void OpenAtFirstEntry() {
        store_ = std::make_unique<FakeJournalStore>(state_);
        ASSERT_EQ(store_->Open(0), 0);
        ASSERT_EQ(store_->SeekHead(), 0);
        ASSERT_EQ(store_->Next(), 1);
    }
};

TEST_F(RecordDecoderTest, DecodesEveryField) {
    AddEntry(*state_, {"MESSAGE=hello", "PRIORITY=6", "_PID=42", "SYSLOG_IDENTIFIER=test"});
    OpenAtFirstEntry();

    JournalRecord record;
    Result res = DecodeRecord(*store_, &record);
    ASSERT_TRUE(res.ok()) << res.ToString();
    ASSERT_EQ(record.size(), 4u);
    ASSERT_EQ(record["MESSAGE"], "hello");
    ASSERT_EQ(record["PRIORITY"], "6");
    ASSERT_EQ(record["_PID"], "42");
    ASSERT_EQ(record["SYSLOG_IDENTIFIER"], "test");
}

TEST_F(RecordDecoderTest, EntryCountMatchesBufferCount) {
    std::vector<std::string> fields;
    for (int i = 0; i < 25; ++i) {
        fields.push_back("FIELD_" + std::to_string(i) + "=value " + std::to_string(i));
    }
    AddEntry(*state_, fields);
    OpenAtFirstEntry();

    JournalRecord record;
    ASSERT_TRUE(DecodeRecord(*store_, &record).ok());
    ASSERT_EQ(record.size(), fields.size());
    for (int i = 0; i < 25; ++i) {
        ASSERT_EQ(record["FIELD_" + std::to_string(i)], "value " + std::to_string(i));
    }
}

TEST_F(RecordDecoderTest, ValueKeepsLaterSeparators) {
    AddEntry(*state_, {"MESSAGE=hello=world", "QUERY=a=1&b=2"});
    OpenAtFirstEntry();

    JournalRecord record;
    ASSERT_TRUE(DecodeRecord(*store_, &record).ok());
    ASSERT_EQ(record["MESSAGE"], "hello=world");
    ASSERT_EQ(record["QUERY"], "a=1&b=2");
}

TEST_F(RecordDecoderTest, BinaryValueSurvives) {
    std::string binary("BLOB=", 5);
    binary.push_back('\0');
    binary.push_back('\x7f');
    binary.push_back('\0');
    AddEntry(*state_, {binary});
    OpenAtFirstEntry();

    JournalRecord record;
    ASSERT_TRUE(DecodeRecord(*store_, &record).ok());
    ASSERT_EQ(record["BLOB"], std::string("\0\x7f\0", 3));
}

TEST_F(RecordDecoderTest, RestartsEnumerationEachTime) {
    AddEntry(*state_, {"A=1", "B=2"});
    OpenAtFirstEntry();

    JournalRecord first;
    JournalRecord second;
    ASSERT_TRUE(DecodeRecord(*store_, &first).ok());
    ASSERT_TRUE(DecodeRecord(*store_, &second).ok());
    ASSERT_EQ(first, second);
    ASSERT_EQ(second.size(), 2u);
}

TEST_F(RecordDecoderTest, DuplicateNameKeepsLastValue) {
    AddEntry(*state_, {"TAG=first", "OTHER=x", "TAG=second", "TAG=third"});
    OpenAtFirstEntry();

    JournalRecord record;
    ASSERT_TRUE(DecodeRecord(*store_, &record).ok());
    ASSERT_EQ(record.size(), 2u);
    ASSERT_EQ(record["TAG"], "third");
    ASSERT_EQ(record["OTHER"], "x");
}

TEST_F(RecordDecoderTest, MalformedBufferFailsRecordAndLeavesOutputAlone) {
    AddEntry(*state_, {"MESSAGE=ok", "GARBAGE"});
    OpenAtFirstEntry();

    JournalRecord record = {{"OLD", "value"}};
    Result res = DecodeRecord(*store_, &record);
    ASSERT_EQ(res.code(), ResultCode::kCorruption);
    ASSERT_EQ(record.size(), 1u);
    ASSERT_EQ(record["OLD"], "value");
}

TEST_F(RecordDecoderTest, EnumerationErrorIsReadError) {
    FakeEntry entry = MakeEntry(*state_, {"MESSAGE=partial"});
    entry.enumerate_error = -EBADMSG;
    state_->entries.push_back(entry);
    OpenAtFirstEntry();

    JournalRecord record;
    Result res = DecodeRecord(*store_, &record);
    ASSERT_EQ(res.code(), ResultCode::kReadError);
    ASSERT_EQ(res.native_status(), -EBADMSG);
}

TEST_F(RecordDecoderTest, NullOutput) {
    AddEntry(*state_, {"A=1"});
    OpenAtFirstEntry();
    ASSERT_EQ(DecodeRecord(*store_, nullptr).code(), ResultCode::kInvalidArgument);
}
