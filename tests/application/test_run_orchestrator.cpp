#include "srcfmt/application/run_orchestrator.hpp"
#include "srcfmt/core/digest.hpp"
#include "srcfmt/errors.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

namespace srcfmt {

using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

class RunOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto formatter = std::make_unique<NiceMock<MockFormatter>>();
        formatter_ = formatter.get();
        ON_CALL(*formatter_, is_initialized()).WillByDefault(Return(true));
        ON_CALL(*formatter_, handles(_)).WillByDefault([](const std::filesystem::path& file) {
            return file.extension() == ".java";
        });
        formatters_.push_back(std::move(formatter));

        ON_CALL(fs_, file_exists(_)).WillByDefault(Return(true));
        ON_CALL(fs_, is_writable(_)).WillByDefault(Return(true));
    }

    auto orchestrator(bool dry_run = false) -> RunOrchestrator {
        RunSettings settings;
        settings.basedir = "/project";
        settings.processor.dry_run = dry_run;
        return RunOrchestrator(fs_, logger_, std::move(formatters_), settings);
    }

    auto store() const -> std::filesystem::path { return temp_.path() / HashCache::store_file_name; }

    static auto counts(size_t success, size_t fail, size_t skipped, size_t read_only)
        -> RunStatistics {
        RunStatistics statistics;
        statistics.success_count = success;
        statistics.fail_count = fail;
        statistics.skipped_count = skipped;
        statistics.read_only_count = read_only;
        return statistics;
    }

    TempDirectory temp_;
    NiceMock<MockFileSystem> fs_;
    RecordingLogger logger_;
    FormatterList formatters_;
    NiceMock<MockFormatter>* formatter_ = nullptr;
};

TEST_F(RunOrchestratorTest, NoInitializedFormatterIsConfigErrorBeforeAnyFileAccess)
{
    ON_CALL(*formatter_, is_initialized()).WillByDefault(Return(false));
    EXPECT_CALL(fs_, file_exists(_)).Times(0);
    EXPECT_CALL(fs_, read_file(_)).Times(0);

    auto run_orchestrator = orchestrator();
    try {
        run_orchestrator.run({"/project/A.java"}, std::nullopt);
        FAIL() << "Expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_STREQ(e.what(), "You must provide a Java or Javascript configuration file.");
    }
}

TEST_F(RunOrchestratorTest, MissingFileCountsAsFailure)
{
    EXPECT_CALL(fs_, file_exists("/project/Gone.java")).WillOnce(Return(false));
    EXPECT_CALL(fs_, read_file(_)).Times(0);
    EXPECT_CALL(*formatter_, format(_, _)).Times(0);

    auto statistics = orchestrator().run({"/project/Gone.java"}, std::nullopt);

    EXPECT_EQ(statistics, counts(0, 1, 0, 0));
}

TEST_F(RunOrchestratorTest, ReadOnlyFileIsNeverFormatted)
{
    EXPECT_CALL(fs_, is_writable("/project/A.java")).WillOnce(Return(false));
    EXPECT_CALL(fs_, read_file(_)).Times(0);
    EXPECT_CALL(*formatter_, format(_, _)).Times(0);

    auto statistics = orchestrator().run({"/project/A.java"}, std::nullopt);

    EXPECT_EQ(statistics, counts(0, 0, 0, 1));
}

TEST_F(RunOrchestratorTest, ReadErrorCountsAsFailureAndRunContinues)
{
    EXPECT_CALL(fs_, read_file("/project/A.java")).WillOnce(Throw(IoError("Cannot open file")));
    EXPECT_CALL(fs_, read_file("/project/B.java")).WillOnce(Return("b"));
    EXPECT_CALL(*formatter_, format("b", _)).WillOnce(Return(std::nullopt));

    auto statistics = orchestrator().run({"/project/A.java", "/project/B.java"}, std::nullopt);

    EXPECT_EQ(statistics, counts(0, 1, 1, 0));
}

TEST_F(RunOrchestratorTest, AggregatesMixedOutcomes)
{
    ON_CALL(fs_, read_file(_)).WillByDefault(Return("code"));
    EXPECT_CALL(fs_, file_exists("/project/D.java")).WillOnce(Return(false));
    EXPECT_CALL(fs_, is_writable("/project/E.java")).WillOnce(Return(false));
    EXPECT_CALL(*formatter_, format(_, _))
        .WillOnce(Return("formatted"))
        .WillOnce(Throw(FormatError("Unmatched closing brace at line 1")));

    auto statistics = orchestrator().run(
        {"/project/A.java", "/project/B.java", "/project/C.txt", "/project/D.java",
         "/project/E.java"},
        std::nullopt);

    EXPECT_EQ(statistics, counts(1, 2, 1, 1));
    EXPECT_EQ(statistics.total(), 5u);
}

TEST_F(RunOrchestratorTest, CacheIsPersistedEvenWhenFilesFail)
{
    EXPECT_CALL(fs_, read_file("/project/A.java")).WillOnce(Return("a"));
    EXPECT_CALL(fs_, read_file("/project/B.java")).WillOnce(Return("b"));
    EXPECT_CALL(*formatter_, format("a", _)).WillOnce(Return("formatted a"));
    EXPECT_CALL(*formatter_, format("b", _)).WillOnce(Throw(FormatError("broken")));

    orchestrator().run({"/project/A.java", "/project/B.java"}, store());

    auto reloaded = HashCache::load(store(), logger_);
    EXPECT_EQ(reloaded.get("A.java"), digest::sha512_hex("formatted a"));
    EXPECT_FALSE(reloaded.get("B.java").has_value());
}

TEST_F(RunOrchestratorTest, SecondRunWithUnchangedFilesSkipsFormatter)
{
    HashCache cache;
    cache.put("A.java", digest::sha512_hex("formatted a"));
    ASSERT_TRUE(cache.persist(store()));

    EXPECT_CALL(fs_, read_file("/project/A.java")).WillOnce(Return("formatted a"));
    EXPECT_CALL(*formatter_, format(_, _)).Times(0);

    auto statistics = orchestrator().run({"/project/A.java"}, store());

    EXPECT_EQ(statistics, counts(0, 0, 1, 0));
}

TEST_F(RunOrchestratorTest, DryRunDoesNotPersistCache)
{
    EXPECT_CALL(fs_, read_file("/project/A.java")).WillOnce(Return("a"));
    EXPECT_CALL(*formatter_, format(_, _)).WillOnce(Return("b"));
    EXPECT_CALL(fs_, write_file(_, _)).Times(0);

    auto statistics = orchestrator(true).run({"/project/A.java"}, store());

    EXPECT_EQ(statistics, counts(1, 0, 0, 0));
    EXPECT_FALSE(std::filesystem::exists(store()));
}

TEST_F(RunOrchestratorTest, PersistFailureIsOnlyAWarning)
{
    EXPECT_CALL(fs_, read_file("/project/A.java")).WillOnce(Return("a"));
    EXPECT_CALL(*formatter_, format(_, _)).WillOnce(Return(std::nullopt));

    auto statistics =
        orchestrator().run({"/project/A.java"}, temp_.path() / "missing" / "cache.properties");

    EXPECT_EQ(statistics, counts(0, 0, 1, 0));
    EXPECT_TRUE(RecordingLogger::contains(logger_.warnings,
                                          "Cannot store file hash cache properties file"));
}

TEST_F(RunOrchestratorTest, CacheKeysAreRelativeToBasedir)
{
    auto run_orchestrator = orchestrator();

    EXPECT_EQ(run_orchestrator.cache_key("/project/src/main/java/A.java"), "src/main/java/A.java");
    EXPECT_EQ(run_orchestrator.cache_key("/project/src/../lib/B.java"), "lib/B.java");
    EXPECT_EQ(run_orchestrator.cache_key("/elsewhere/C.java"), "/elsewhere/C.java");
}

} // namespace srcfmt
