#include "srcfmt/application/file_processor.hpp"
#include "srcfmt/core/digest.hpp"
#include "srcfmt/errors.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

namespace srcfmt {

using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

class FileProcessorTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto formatter = std::make_unique<NiceMock<MockFormatter>>();
        formatter_ = formatter.get();
        ON_CALL(*formatter_, name()).WillByDefault(Return("Java"));
        ON_CALL(*formatter_, is_initialized()).WillByDefault(Return(true));
        ON_CALL(*formatter_, handles(_)).WillByDefault([](const std::filesystem::path& file) {
            return file.extension() == ".java";
        });
        formatters_.push_back(std::move(formatter));
    }

    auto process(const std::string& path, ProcessorSettings settings = {}) -> FormatOutcome {
        FileProcessor processor(fs_, logger_, settings);
        return processor.process(path, "src/" + path, cache_, formatters_);
    }

    NiceMock<MockFileSystem> fs_;
    RecordingLogger logger_;
    HashCache cache_;
    FormatterList formatters_;
    NiceMock<MockFormatter>* formatter_ = nullptr;
};

TEST_F(FileProcessorTest, CacheHitSkipsWithoutFormatting)
{
    cache_.put("src/A.java", digest::sha512_hex("class A {}\n"));
    EXPECT_CALL(fs_, read_file("A.java")).WillOnce(Return("class A {}\n"));
    EXPECT_CALL(*formatter_, format(_, _)).Times(0);
    EXPECT_CALL(fs_, write_file(_, _)).Times(0);

    EXPECT_EQ(process("A.java"), FormatOutcome::SKIPPED);
}

TEST_F(FileProcessorTest, StaleCacheEntryFormatsAgain)
{
    cache_.put("src/A.java", digest::sha512_hex("old"));
    EXPECT_CALL(fs_, read_file("A.java")).WillOnce(Return("new"));
    EXPECT_CALL(*formatter_, format("new", LineEnding::AUTO)).WillOnce(Return("formatted"));
    EXPECT_CALL(fs_, write_file("A.java", "formatted"));

    EXPECT_EQ(process("A.java"), FormatOutcome::SUCCESS);
}

TEST_F(FileProcessorTest, UnsupportedExtensionIsSkippedWithoutCacheEntry)
{
    EXPECT_CALL(fs_, read_file("notes.txt")).WillOnce(Return("text"));
    EXPECT_CALL(*formatter_, format(_, _)).Times(0);

    EXPECT_EQ(process("notes.txt"), FormatOutcome::SKIPPED);
    EXPECT_FALSE(cache_.get("src/notes.txt").has_value());
}

TEST_F(FileProcessorTest, UninitializedFormatterIsSkipped)
{
    ON_CALL(*formatter_, is_initialized()).WillByDefault(Return(false));
    EXPECT_CALL(fs_, read_file("A.java")).WillOnce(Return("class A {}"));
    EXPECT_CALL(*formatter_, format(_, _)).Times(0);

    EXPECT_EQ(process("A.java"), FormatOutcome::SKIPPED);
}

TEST_F(FileProcessorTest, CanonicalCodeIsSkippedAndCached)
{
    EXPECT_CALL(fs_, read_file("A.java")).WillOnce(Return("class A {}\n"));
    EXPECT_CALL(*formatter_, format(_, _)).WillOnce(Return(std::nullopt));
    EXPECT_CALL(fs_, write_file(_, _)).Times(0);

    EXPECT_EQ(process("A.java"), FormatOutcome::SKIPPED);
    EXPECT_EQ(cache_.get("src/A.java"), digest::sha512_hex("class A {}\n"));
}

TEST_F(FileProcessorTest, IdenticalOutputIsNotWritten)
{
    EXPECT_CALL(fs_, read_file("A.java")).WillOnce(Return("same"));
    EXPECT_CALL(*formatter_, format(_, _)).WillOnce(Return("same"));
    EXPECT_CALL(fs_, write_file(_, _)).Times(0);

    EXPECT_EQ(process("A.java"), FormatOutcome::SKIPPED);
    EXPECT_EQ(cache_.get("src/A.java"), digest::sha512_hex("same"));
}

TEST_F(FileProcessorTest, FormattedCodeIsWrittenAndItsDigestCached)
{
    EXPECT_CALL(fs_, read_file("A.java")).WillOnce(Return("class A{\nint x;}\n"));
    EXPECT_CALL(*formatter_, format(_, _)).WillOnce(Return("class A {\n    int x;\n}\n"));
    EXPECT_CALL(fs_, write_file("A.java", "class A {\n    int x;\n}\n"));

    EXPECT_EQ(process("A.java"), FormatOutcome::SUCCESS);
    EXPECT_EQ(cache_.get("src/A.java"), digest::sha512_hex("class A {\n    int x;\n}\n"));
}

TEST_F(FileProcessorTest, FormatErrorFailsWithoutTouchingFileOrCache)
{
    EXPECT_CALL(fs_, read_file("A.java")).WillOnce(Return("class A {"));
    EXPECT_CALL(*formatter_, format(_, _))
        .WillOnce(Throw(FormatError("Unclosed brace at end of input (1 still open)")));
    EXPECT_CALL(fs_, write_file(_, _)).Times(0);

    EXPECT_EQ(process("A.java"), FormatOutcome::FAIL);
    EXPECT_EQ(cache_.size(), 0u);
    EXPECT_TRUE(RecordingLogger::contains(logger_.warnings, "Unclosed brace"));
}

TEST_F(FileProcessorTest, WriteFailureFailsWithoutCacheEntry)
{
    EXPECT_CALL(fs_, read_file("A.java")).WillOnce(Return("a"));
    EXPECT_CALL(*formatter_, format(_, _)).WillOnce(Return("b"));
    EXPECT_CALL(fs_, write_file(_, _)).WillOnce(Throw(IoError("Cannot write to file: A.java")));

    EXPECT_EQ(process("A.java"), FormatOutcome::FAIL);
    EXPECT_FALSE(cache_.get("src/A.java").has_value());
}

TEST_F(FileProcessorTest, ReadFailurePropagates)
{
    EXPECT_CALL(fs_, read_file("A.java")).WillOnce(Throw(IoError("Cannot open file: A.java")));

    EXPECT_THROW(process("A.java"), IoError);
}

TEST_F(FileProcessorTest, InvalidEncodingIsIoError)
{
    EXPECT_CALL(fs_, read_file("A.java")).WillOnce(Return("caf\xE9"));
    EXPECT_CALL(*formatter_, format(_, _)).Times(0);

    EXPECT_THROW(process("A.java"), IoError);
}

TEST_F(FileProcessorTest, LatinOneContentIsAcceptedWhenConfigured)
{
    EXPECT_CALL(fs_, read_file("A.java")).WillOnce(Return("caf\xE9"));
    EXPECT_CALL(*formatter_, format(_, _)).WillOnce(Return(std::nullopt));

    ProcessorSettings settings;
    settings.encoding = Encoding::ISO_8859_1;
    EXPECT_EQ(process("A.java", settings), FormatOutcome::SKIPPED);
}

TEST_F(FileProcessorTest, DryRunReportsWithoutWriting)
{
    EXPECT_CALL(fs_, read_file("A.java")).WillOnce(Return("a"));
    EXPECT_CALL(*formatter_, format(_, _)).WillOnce(Return("b"));
    EXPECT_CALL(fs_, write_file(_, _)).Times(0);

    ProcessorSettings settings;
    settings.dry_run = true;
    EXPECT_EQ(process("A.java", settings), FormatOutcome::SUCCESS);
    EXPECT_FALSE(cache_.get("src/A.java").has_value());
    EXPECT_TRUE(RecordingLogger::contains(logger_.info_messages, "Would reformat A.java"));
}

TEST_F(FileProcessorTest, LineEndingPolicyIsPassedToFormatter)
{
    EXPECT_CALL(fs_, read_file("A.java")).WillOnce(Return("a"));
    EXPECT_CALL(*formatter_, format("a", LineEnding::CRLF)).WillOnce(Return(std::nullopt));

    ProcessorSettings settings;
    settings.line_ending = LineEnding::CRLF;
    process("A.java", settings);
}

TEST_F(FileProcessorTest, SelectsFirstFormatterHandlingThePath)
{
    auto second = std::make_unique<NiceMock<MockFormatter>>();
    ON_CALL(*second, handles(_)).WillByDefault(Return(true));
    ON_CALL(*second, is_initialized()).WillByDefault(Return(true));
    auto* second_ptr = second.get();
    formatters_.push_back(std::move(second));

    EXPECT_EQ(FileProcessor::select_formatter("A.java", formatters_), formatter_);
    EXPECT_EQ(FileProcessor::select_formatter("a.js", formatters_), second_ptr);
}

} // namespace srcfmt
