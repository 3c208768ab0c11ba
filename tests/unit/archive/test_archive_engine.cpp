/**
 * @file test_archive_engine.cpp
 * @brief Unit tests for archive compression and extraction
 */

#include <gtest/gtest.h>

#include <kcenon/ultracopy/archive/archive_engine.h>
#include <kcenon/ultracopy/archive/tar_format.h>

#include <zlib.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace kcenon::ultracopy::test {

namespace fs = std::filesystem;

class ArchiveEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        base_ = fs::temp_directory_path() /
                ("ultracopy_archive_" + std::to_string(std::random_device{}()));
        source_ = base_ / "project";
        fs::create_directories(source_ / "src");
        fs::create_directories(source_ / ".git");
        fs::create_directories(source_ / "build");

        write_file(source_ / "README.md", "# project\n");
        write_file(source_ / "src" / "main.cpp", repeated("int value = 42;\n", 200));
        write_file(source_ / "src" / "scratch.tmp", "temporary");
        write_file(source_ / ".git" / "HEAD", "ref: refs/heads/main\n");
        write_file(source_ / "build" / "out.o", "object");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(base_, ec);
    }

    static void write_file(const fs::path& path, const std::string& content) {
        std::ofstream(path, std::ios::binary) << content;
    }

    static auto read_file(const fs::path& path) -> std::string {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream oss;
        oss << in.rdbuf();
        return oss.str();
    }

    static auto repeated(const std::string& text, int count) -> std::string {
        std::string out;
        for (int i = 0; i < count; ++i) {
            out += text;
        }
        return out;
    }

    auto round_trip(archive_format format, const std::string& extension) -> fs::path {
        archive_engine engine;
        archive_options options;
        options.format = format;

        const auto archive = base_ / ("project" + extension);
        auto compressed = engine.compress(source_, archive, options);
        EXPECT_TRUE(compressed.has_value());
        if (!compressed) {
            return {};
        }
        EXPECT_EQ(compressed.value().total_files, 5u);
        EXPECT_EQ(compressed.value().processed_files, 5u);
        EXPECT_GT(compressed.value().compressed_bytes, 0u);

        const auto out = base_ / ("out_" + std::string(to_string(format)));
        auto extracted = engine.decompress(archive, out);
        EXPECT_TRUE(extracted.has_value());
        if (extracted) {
            EXPECT_EQ(extracted.value().processed_files, 5u);
        }
        return out;
    }

    void expect_tree(const fs::path& out) {
        EXPECT_EQ(read_file(out / "project" / "README.md"), "# project\n");
        EXPECT_EQ(read_file(out / "project" / "src" / "main.cpp"),
                  repeated("int value = 42;\n", 200));
        EXPECT_EQ(read_file(out / "project" / ".git" / "HEAD"), "ref: refs/heads/main\n");
    }

    fs::path base_;
    fs::path source_;
};

// =============================================================================
// Format helpers
// =============================================================================

TEST_F(ArchiveEngineTest, ParseFormatNames) {
    EXPECT_EQ(parse_archive_format("zip"), archive_format::zip);
    EXPECT_EQ(parse_archive_format("TAR"), archive_format::tar);
    EXPECT_EQ(parse_archive_format("tar.gz"), archive_format::tar_gz);
    EXPECT_EQ(parse_archive_format("tgz"), archive_format::tar_gz);
    EXPECT_EQ(parse_archive_format("tar.lz4"), archive_format::tar_lz4);
    EXPECT_FALSE(parse_archive_format("rar").has_value());
    EXPECT_STREQ(to_string(archive_format::tar_gz), "tar.gz");
}

TEST_F(ArchiveEngineTest, DetectFormatFromExtension) {
    EXPECT_EQ(detect_archive_format("backup.ZIP"), archive_format::zip);
    EXPECT_EQ(detect_archive_format("/tmp/a.tar"), archive_format::tar);
    EXPECT_EQ(detect_archive_format("a.tar.gz"), archive_format::tar_gz);
    EXPECT_EQ(detect_archive_format("a.tgz"), archive_format::tar_gz);
    EXPECT_EQ(detect_archive_format("a.tar.lz4"), archive_format::tar_lz4);
    EXPECT_FALSE(detect_archive_format("a.gz").has_value());
    EXPECT_FALSE(detect_archive_format("notes.txt").has_value());
}

TEST_F(ArchiveEngineTest, ExcludePatterns) {
    const std::vector<std::string> patterns{"*.tmp", ".git", "build"};

    EXPECT_TRUE(archive_engine::is_excluded("scratch.tmp", patterns));
    EXPECT_TRUE(archive_engine::is_excluded(".git", patterns));
    EXPECT_TRUE(archive_engine::is_excluded("build", patterns));
    EXPECT_FALSE(archive_engine::is_excluded("main.cpp", patterns));
    EXPECT_FALSE(archive_engine::is_excluded("builder", patterns));
    EXPECT_FALSE(archive_engine::is_excluded("anything", {}));
}

// =============================================================================
// Round trips
// =============================================================================

TEST_F(ArchiveEngineTest, ZipRoundTrip) {
    auto out = round_trip(archive_format::zip, ".zip");
    expect_tree(out);
}

TEST_F(ArchiveEngineTest, TarRoundTrip) {
    auto out = round_trip(archive_format::tar, ".tar");
    expect_tree(out);
}

TEST_F(ArchiveEngineTest, TarGzRoundTrip) {
    auto out = round_trip(archive_format::tar_gz, ".tar.gz");
    expect_tree(out);
}

TEST_F(ArchiveEngineTest, TarGzIsGzipFramed) {
    archive_engine engine;
    archive_options options;
    options.format = archive_format::tar_gz;
    const auto archive = base_ / "project.tar.gz";

    ASSERT_TRUE(engine.compress(source_, archive, options).has_value());

    const auto bytes = read_file(archive);
    ASSERT_GE(bytes.size(), 2u);
    EXPECT_EQ(static_cast<unsigned char>(bytes[0]), 0x1f);
    EXPECT_EQ(static_cast<unsigned char>(bytes[1]), 0x8b);

    // zlib's own gzip reader accepts it
    gzFile gz = gzopen(archive.string().c_str(), "rb");
    ASSERT_NE(gz, nullptr);
    std::vector<char> buffer(tar_block_size);
    EXPECT_EQ(gzread(gz, buffer.data(), static_cast<unsigned>(buffer.size())),
              static_cast<int>(tar_block_size));
    gzclose(gz);
}

TEST_F(ArchiveEngineTest, CompressionReducesRepetitiveData) {
    archive_engine engine;
    auto stats = engine.compress(source_ / "src" / "main.cpp", base_ / "main.zip");

    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats.value().total_files, 1u);
    EXPECT_EQ(stats.value().total_bytes, 3200u);
    EXPECT_LT(stats.value().compressed_bytes, stats.value().total_bytes);
    EXPECT_GT(stats.value().compression_ratio, 50.0);
}

TEST_F(ArchiveEngineTest, SingleFileArchiveHasBareName) {
    archive_engine engine;
    ASSERT_TRUE(engine.compress(source_ / "README.md", base_ / "readme.tar",
                                archive_options{archive_format::tar, 6, {}})
                    .has_value());

    auto extracted = engine.decompress(base_ / "readme.tar", base_ / "single");

    ASSERT_TRUE(extracted.has_value());
    EXPECT_EQ(read_file(base_ / "single" / "README.md"), "# project\n");
}

TEST_F(ArchiveEngineTest, ExcludedEntriesAreSkipped) {
    archive_engine engine;
    archive_options options;
    options.format = archive_format::tar;
    options.exclude_patterns = {"*.tmp", ".git", "build"};

    auto compressed = engine.compress(source_, base_ / "filtered.tar", options);
    ASSERT_TRUE(compressed.has_value());
    EXPECT_EQ(compressed.value().total_files, 2u);

    ASSERT_TRUE(engine.decompress(base_ / "filtered.tar", base_ / "filtered").has_value());
    EXPECT_TRUE(fs::exists(base_ / "filtered" / "project" / "README.md"));
    EXPECT_TRUE(fs::exists(base_ / "filtered" / "project" / "src" / "main.cpp"));
    EXPECT_FALSE(fs::exists(base_ / "filtered" / "project" / "src" / "scratch.tmp"));
    EXPECT_FALSE(fs::exists(base_ / "filtered" / "project" / ".git"));
    EXPECT_FALSE(fs::exists(base_ / "filtered" / "project" / "build"));
}

TEST_F(ArchiveEngineTest, ArchiveInsideSourceIsNotIncluded) {
    archive_engine engine;
    const auto archive = source_ / "self.zip";

    auto compressed = engine.compress(source_, archive);

    ASSERT_TRUE(compressed.has_value());
    EXPECT_EQ(compressed.value().total_files, 5u);
}

// =============================================================================
// Errors
// =============================================================================

TEST_F(ArchiveEngineTest, MissingSourceIsNotFound) {
    archive_engine engine;

    auto result = engine.compress(base_ / "missing", base_ / "x.zip");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::path_not_found);
    EXPECT_FALSE(engine.is_running());
}

TEST_F(ArchiveEngineTest, MissingArchiveIsNotFound) {
    archive_engine engine;

    auto result = engine.decompress(base_ / "missing.zip", base_ / "out");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::path_not_found);
}

TEST_F(ArchiveEngineTest, UnknownExtensionNeedsExplicitFormat) {
    archive_engine engine;
    ASSERT_TRUE(engine.compress(source_, base_ / "project.bin",
                                archive_options{archive_format::tar, 6, {}})
                    .has_value());

    auto guessed = engine.decompress(base_ / "project.bin", base_ / "out");
    ASSERT_FALSE(guessed.has_value());
    EXPECT_EQ(guessed.error().code, error_code::archive_format_unsupported);

    auto explicit_format =
        engine.decompress(base_ / "project.bin", base_ / "out", archive_format::tar);
    ASSERT_TRUE(explicit_format.has_value());
    expect_tree(base_ / "out");
}

TEST_F(ArchiveEngineTest, Lz4AvailabilityMatchesBuild) {
    archive_engine engine;
    archive_options options;
    options.format = archive_format::tar_lz4;

    auto result = engine.compress(source_, base_ / "project.tar.lz4", options);

    if (is_format_available(archive_format::tar_lz4)) {
        ASSERT_TRUE(result.has_value());
        ASSERT_TRUE(engine.decompress(base_ / "project.tar.lz4", base_ / "lz4").has_value());
        expect_tree(base_ / "lz4");
    } else {
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().code, error_code::archive_format_unsupported);
        EXPECT_FALSE(fs::exists(base_ / "project.tar.lz4"));
    }
}

TEST_F(ArchiveEngineTest, UnsafeEntryAbortsExtraction) {
    // Hand-built tar whose member climbs out of the output directory
    {
        auto file = make_file_sink(base_ / "evil.tar");
        ASSERT_TRUE(file.has_value());
        tar_writer writer(*file.value());

        const std::string payload = "owned";
        archive_entry entry;
        entry.name = "../escape.txt";
        entry.size = payload.size();

        std::ofstream(base_ / "payload.txt") << payload;
        auto content = make_file_source(base_ / "payload.txt");
        ASSERT_TRUE(content.has_value());
        ASSERT_TRUE(writer.add_file(entry, *content.value()).has_value());
        ASSERT_TRUE(writer.finish().has_value());
    }

    archive_engine engine;
    auto result = engine.decompress(base_ / "evil.tar", base_ / "jail");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::archive_unsafe_entry);
    EXPECT_FALSE(fs::exists(base_ / "escape.txt"));
}

TEST_F(ArchiveEngineTest, CorruptZipIsRejected) {
    write_file(base_ / "broken.zip", "PK this is not really a zip archive");
    archive_engine engine;

    auto result = engine.decompress(base_ / "broken.zip", base_ / "out");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::archive_corrupted);
}

// =============================================================================
// Progress and cancellation
// =============================================================================

TEST_F(ArchiveEngineTest, ProgressAndLogCallbacks) {
    archive_engine engine;
    std::vector<uint64_t> processed;
    std::vector<std::string> lines;
    engine.on_progress([&](const archive_stats& stats) { processed.push_back(stats.processed_files); });
    engine.on_log([&](const std::string& line) { lines.push_back(line); });

    ASSERT_TRUE(engine.compress(source_, base_ / "progress.zip").has_value());

    ASSERT_FALSE(processed.empty());
    EXPECT_EQ(processed.back(), 5u);
    EXPECT_TRUE(std::is_sorted(processed.begin(), processed.end()));
    EXPECT_EQ(engine.last_stats().processed_files, 5u);

    bool saw_completion = false;
    for (const auto& line : lines) {
        if (line.find("Compression completed") != std::string::npos) {
            saw_completion = true;
        }
    }
    EXPECT_TRUE(saw_completion);
}

TEST_F(ArchiveEngineTest, CancelRemovesPartialArchive) {
    archive_engine engine;
    engine.on_progress([&](const archive_stats& stats) {
        if (stats.processed_files == 1) {
            engine.cancel();
        }
    });

    const auto archive = base_ / "cancelled.zip";
    auto result = engine.compress(source_, archive);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::archive_cancelled);
    EXPECT_FALSE(fs::exists(archive));
    EXPECT_FALSE(engine.is_running());
}

TEST_F(ArchiveEngineTest, CancelWhenIdleIsIgnored) {
    archive_engine engine;
    engine.cancel();

    EXPECT_TRUE(engine.compress(source_, base_ / "after_cancel.zip").has_value());
}

}  // namespace kcenon::ultracopy::test
