#include "chanfs/events/event_bus.hpp"
#include "chanfs/events/events.hpp"
#include "chanfs/transfer/download.hpp"
#include "chanfs/transport/memory_transport.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using chanfs::ErrorCode;
using chanfs::events::EventBus;
using chanfs::transfer::DownloadEngine;
using chanfs::transfer::DownloadOptions;
using chanfs::transport::Container;
using chanfs::transport::MemoryTransport;
using std::chrono::milliseconds;

namespace {

fs::path create_temp_dir() {
    const auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = base / fs::path("chanfs_download_test_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

std::vector<std::uint8_t> bytes(std::size_t size, std::uint8_t fill) {
    return std::vector<std::uint8_t>(size, fill);
}

std::vector<std::uint8_t> read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
}

} // namespace

class DownloadEngineTest : public ::testing::Test {
protected:
    MemoryTransport remote{100};
    EventBus bus;
    DownloadEngine engine{remote, bus, [](milliseconds) {}};
    fs::path dir = create_temp_dir();

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    Container make_container(const std::string& topic) {
        auto created = remote.create_container("c4", "guild");
        EXPECT_TRUE(created.is_ok());
        Container container = created.value();
        container.topic = topic;
        EXPECT_TRUE(remote.set_container_topic(container.id, topic).is_ok());
        return container;
    }

    void send(const Container& container, const std::string& name, const std::vector<std::uint8_t>& data) {
        ASSERT_TRUE(remote.send_message(container.id, name, data).is_ok());
    }
};

TEST_F(DownloadEngineTest, ReassemblesBlocksInOrder) {
    auto container = make_container("110");
    send(container, "1", bytes(50, 'a'));
    remote.post_text_message(container.id);
    send(container, "2", bytes(50, 'b'));
    send(container, "3", bytes(10, 'c'));

    const fs::path target = dir / "out.bin";
    auto summary = engine.download(container, "out.bin", target, DownloadOptions{});
    ASSERT_TRUE(summary.is_ok()) << summary.error().message;
    EXPECT_EQ(summary.value().blocks_transferred, 3u);
    EXPECT_EQ(summary.value().block_size, 50u);

    std::vector<std::uint8_t> expected = bytes(50, 'a');
    auto b = bytes(50, 'b');
    auto c = bytes(10, 'c');
    expected.insert(expected.end(), b.begin(), b.end());
    expected.insert(expected.end(), c.begin(), c.end());
    EXPECT_EQ(read_file(target), expected);
    EXPECT_FALSE(fs::exists(dir / "out.bin.part"));
}

TEST_F(DownloadEngineTest, PagesThroughLongBlockLists) {
    const std::size_t count = DownloadEngine::kPageSize * 2 + 5;
    auto container = make_container(std::to_string(count * 10));
    for (std::size_t i = 1; i <= count; ++i) {
        send(container, std::to_string(i), bytes(10, static_cast<std::uint8_t>(i)));
    }

    auto layout = engine.read_layout(container);
    ASSERT_TRUE(layout.is_ok()) << layout.error().message;
    ASSERT_EQ(layout.value().blocks.size(), count);
    EXPECT_EQ(layout.value().blocks.back().info.index, count);
}

TEST_F(DownloadEngineTest, DetectsMissingBlock) {
    auto container = make_container("150");
    send(container, "1", bytes(50, 1));
    send(container, "3", bytes(50, 3));
    send(container, "4", bytes(50, 4));

    auto layout = engine.read_layout(container);
    ASSERT_TRUE(layout.is_error());
    EXPECT_EQ(layout.error().code, ErrorCode::BlockSequenceGap);
}

TEST_F(DownloadEngineTest, DetectsInconsistentBlockSize) {
    auto container = make_container("100");
    send(container, "1", bytes(50, 1));
    send(container, "2", bytes(30, 2));
    send(container, "3", bytes(20, 3));

    auto layout = engine.read_layout(container);
    ASSERT_TRUE(layout.is_error());
    EXPECT_EQ(layout.error().code, ErrorCode::BlockSizeInconsistent);
}

TEST_F(DownloadEngineTest, RejectsForeignAttachmentNames) {
    auto container = make_container("50");
    send(container, "holiday.jpg", bytes(50, 1));

    auto layout = engine.read_layout(container);
    ASSERT_TRUE(layout.is_error());
    EXPECT_EQ(layout.error().code, ErrorCode::MalformedBlockName);
}

TEST_F(DownloadEngineTest, InterruptedUploadIsNotDownloaded) {
    auto container = make_container("507");
    send(container, "1", bytes(50, 1));
    send(container, "2", bytes(50, 2));

    const fs::path target = dir / "partial.bin";
    auto summary = engine.download(container, "partial.bin", target, DownloadOptions{});
    ASSERT_TRUE(summary.is_error());
    EXPECT_EQ(summary.error().code, ErrorCode::IncompleteUpload);
    EXPECT_FALSE(fs::exists(target));
    EXPECT_FALSE(fs::exists(dir / "partial.bin.part"));
}

TEST_F(DownloadEngineTest, MoreBytesThanTopicIsASizeMismatch) {
    auto container = make_container("60");
    send(container, "1", bytes(50, 1));
    send(container, "2", bytes(50, 2));

    auto layout = engine.read_layout(container);
    ASSERT_TRUE(layout.is_error());
    EXPECT_EQ(layout.error().code, ErrorCode::SizeMismatch);
}

TEST_F(DownloadEngineTest, KeepsExistingFileUnlessOverwriting) {
    auto container = make_container("5");
    send(container, "1", bytes(5, 'n'));

    const fs::path target = dir / "keep.txt";
    {
        std::ofstream out(target);
        out << "old";
    }

    auto refused = engine.download(container, "keep.txt", target, DownloadOptions{});
    ASSERT_TRUE(refused.is_error());
    EXPECT_EQ(refused.error().code, ErrorCode::LocalWriteError);
    EXPECT_EQ(read_file(target), (std::vector<std::uint8_t>{'o', 'l', 'd'}));

    DownloadOptions overwrite;
    overwrite.overwrite = true;
    auto replaced = engine.download(container, "keep.txt", target, overwrite);
    ASSERT_TRUE(replaced.is_ok()) << replaced.error().message;
    EXPECT_EQ(read_file(target), bytes(5, 'n'));
}

TEST_F(DownloadEngineTest, ListingFailureIsARemoteReadError) {
    auto container = make_container("5");
    send(container, "1", bytes(5, 1));
    remote.set_fail_listing(true);

    auto summary = engine.download(container, "x", dir / "x", DownloadOptions{});
    ASSERT_TRUE(summary.is_error());
    EXPECT_EQ(summary.error().code, ErrorCode::RemoteReadError);
}
