#include "chanfs/events/components.hpp"
#include "chanfs/events/event_bus.hpp"
#include "chanfs/events/events.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <sstream>

using chanfs::events::BestEffortFailedEvent;
using chanfs::events::BlockRetryEvent;
using chanfs::events::BlockTransferredEvent;
using chanfs::events::EventBus;
using chanfs::events::MetricsComponent;
using chanfs::events::ProgressComponent;
using chanfs::events::ProgressMode;
using chanfs::events::TransferCompletedEvent;
using chanfs::events::TransferDirection;
using chanfs::events::TransferStartedEvent;

TEST(MetricsComponentTest, CountsBlocksBytesAndRetries) {
    EventBus bus;
    MetricsComponent metrics(bus);

    bus.emit(BlockTransferredEvent{"a.bin", TransferDirection::Upload, 1, 50, 50, 120});
    bus.emit(BlockTransferredEvent{"a.bin", TransferDirection::Upload, 2, 50, 100, 120});
    bus.emit(BlockTransferredEvent{"b.bin", TransferDirection::Download, 1, 7, 7, 7});
    bus.emit(BlockRetryEvent{"a.bin", 3, 1, std::chrono::milliseconds{1000}, "timeout"});
    bus.emit(BestEffortFailedEvent{"a.bin", "pin anchor", "forbidden"});

    const auto& stats = metrics.get_stats();
    EXPECT_EQ(stats.blocks_uploaded.load(), 2u);
    EXPECT_EQ(stats.bytes_uploaded.load(), 100u);
    EXPECT_EQ(stats.blocks_downloaded.load(), 1u);
    EXPECT_EQ(stats.bytes_downloaded.load(), 7u);
    EXPECT_EQ(stats.retries.load(), 1u);
    EXPECT_EQ(stats.best_effort_failures.load(), 1u);
    EXPECT_EQ(stats.transfers_failed.load(), 0u);
}

TEST(ProgressComponentTest, DebugModeWritesTotalAndProcessedPerBlock) {
    EventBus bus;
    std::ostringstream out;
    std::ostringstream bar;
    ProgressComponent progress(bus, ProgressMode::Debug, out, bar);

    bus.emit(TransferStartedEvent{"a.bin", TransferDirection::Upload, 120, 50, 0, false});
    bus.emit(BlockTransferredEvent{"a.bin", TransferDirection::Upload, 1, 50, 50, 120});
    bus.emit(BlockTransferredEvent{"a.bin", TransferDirection::Upload, 2, 50, 100, 120});
    bus.emit(BlockTransferredEvent{"a.bin", TransferDirection::Upload, 3, 20, 120, 120});
    bus.emit(TransferCompletedEvent{"a.bin", TransferDirection::Upload, 120, 3, std::chrono::milliseconds{5}});

    EXPECT_EQ(out.str(), "120 50\n120 100\n120 120\n");
    EXPECT_TRUE(bar.str().empty());
}

TEST(ProgressComponentTest, BarModeRedrawsOnStderrOnly) {
    EventBus bus;
    std::ostringstream out;
    std::ostringstream bar;
    ProgressComponent progress(bus, ProgressMode::Bar, out, bar);

    bus.emit(TransferStartedEvent{"a.bin", TransferDirection::Upload, 200, 50, 100, true});
    bus.emit(BlockTransferredEvent{"a.bin", TransferDirection::Upload, 3, 50, 150, 200});
    bus.emit(BlockTransferredEvent{"a.bin", TransferDirection::Upload, 4, 50, 200, 200});
    bus.emit(TransferCompletedEvent{"a.bin", TransferDirection::Upload, 200, 4, std::chrono::milliseconds{5}});

    EXPECT_TRUE(out.str().empty());
    const std::string drawn = bar.str();
    EXPECT_NE(drawn.find("Uploading a.bin  50%"), std::string::npos);
    EXPECT_NE(drawn.find(" 75%"), std::string::npos);
    EXPECT_NE(drawn.find("100%"), std::string::npos);
    EXPECT_NE(drawn.find("200 B/200 B"), std::string::npos);
    EXPECT_EQ(drawn.back(), '\n');
}

TEST(ProgressComponentTest, QuietModeWritesNothing) {
    EventBus bus;
    std::ostringstream out;
    std::ostringstream bar;
    ProgressComponent progress(bus, ProgressMode::Quiet, out, bar);

    bus.emit(TransferStartedEvent{"a.bin", TransferDirection::Download, 10, 10, 0, false});
    bus.emit(BlockTransferredEvent{"a.bin", TransferDirection::Download, 1, 10, 10, 10});

    EXPECT_TRUE(out.str().empty());
    EXPECT_TRUE(bar.str().empty());
}

TEST(ProgressComponentTest, FormatBytes) {
    EXPECT_EQ(ProgressComponent::format_bytes(0), "0 B");
    EXPECT_EQ(ProgressComponent::format_bytes(999), "999 B");
    EXPECT_EQ(ProgressComponent::format_bytes(1500), "1.5 kB");
    EXPECT_EQ(ProgressComponent::format_bytes(25000000), "25.0 MB");
}
