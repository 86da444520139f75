#include "chanfs/transport/memory_transport.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

using chanfs::ErrorCode;
using chanfs::transport::MemoryTransport;
using chanfs::transport::MessageQuery;

namespace {

std::vector<std::uint8_t> payload(const std::string& text) {
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

} // namespace

TEST(MemoryTransportTest, ContainersAreScopedToTheirGroup) {
    MemoryTransport remote(100);
    ASSERT_TRUE(remote.create_container("co", "guild-a").is_ok());
    ASSERT_TRUE(remote.create_container("c4", "guild-b").is_ok());

    auto listed = remote.list_containers("guild-a");
    ASSERT_TRUE(listed.is_ok());
    ASSERT_EQ(listed.value().size(), 1u);
    EXPECT_EQ(listed.value()[0].name, "co");
}

TEST(MemoryTransportTest, ListsMessagesInBothDirectionsWithCursors) {
    MemoryTransport remote(100);
    auto container = remote.create_container("co", "guild").value();
    std::vector<std::string> ids;
    for (const char* name : {"1", "2", "3", "4"}) {
        ids.push_back(remote.send_message(container.id, name, payload(name)).value().id);
    }

    MessageQuery newest;
    newest.limit = 2;
    auto latest = remote.list_messages(container.id, newest);
    ASSERT_TRUE(latest.is_ok());
    ASSERT_EQ(latest.value().size(), 2u);
    EXPECT_EQ(latest.value()[0].attachment->name, "4");
    EXPECT_EQ(latest.value()[1].attachment->name, "3");

    MessageQuery oldest;
    oldest.limit = 1;
    oldest.after_id = "0";
    oldest.ascending = true;
    auto first = remote.list_messages(container.id, oldest);
    ASSERT_TRUE(first.is_ok());
    ASSERT_EQ(first.value().size(), 1u);
    EXPECT_EQ(first.value()[0].attachment->name, "1");

    MessageQuery page;
    page.after_id = ids[1];
    page.ascending = true;
    auto rest = remote.list_messages(container.id, page);
    ASSERT_TRUE(rest.is_ok());
    ASSERT_EQ(rest.value().size(), 2u);
    EXPECT_EQ(rest.value()[0].attachment->name, "3");

    MessageQuery before;
    before.before_id = ids[2];
    auto earlier = remote.list_messages(container.id, before);
    ASSERT_TRUE(earlier.is_ok());
    ASSERT_EQ(earlier.value().size(), 2u);
    EXPECT_EQ(earlier.value()[0].attachment->name, "2");
}

TEST(MemoryTransportTest, FetchReturnsStoredBytes) {
    MemoryTransport remote(100);
    auto container = remote.create_container("co", "guild").value();
    auto message = remote.send_message(container.id, "1", payload("hello"));
    ASSERT_TRUE(message.is_ok());
    ASSERT_TRUE(message.value().attachment.has_value());
    EXPECT_EQ(message.value().attachment->size, 5u);

    auto data = remote.fetch_attachment(*message.value().attachment);
    ASSERT_TRUE(data.is_ok());
    EXPECT_EQ(data.value(), payload("hello"));
}

TEST(MemoryTransportTest, EnforcesAttachmentLimit) {
    MemoryTransport remote(4);
    auto container = remote.create_container("co", "guild").value();

    auto sent = remote.send_message(container.id, "1", payload("hello"));
    ASSERT_TRUE(sent.is_error());
    EXPECT_EQ(sent.error().code, ErrorCode::RemoteWriteError);
    EXPECT_TRUE(remote.messages(container.id).empty());
}

TEST(MemoryTransportTest, InjectedSendFailuresAreCounted) {
    MemoryTransport remote(100);
    auto container = remote.create_container("co", "guild").value();
    remote.fail_next_sends(2);

    EXPECT_TRUE(remote.send_message(container.id, "1", payload("a")).is_error());
    EXPECT_TRUE(remote.send_message(container.id, "1", payload("a")).is_error());
    EXPECT_TRUE(remote.send_message(container.id, "1", payload("a")).is_ok());
    EXPECT_EQ(remote.send_attempts(), 3u);
    EXPECT_EQ(remote.messages(container.id).size(), 1u);
}

TEST(MemoryTransportTest, PinAndDelete) {
    MemoryTransport remote(100);
    auto container = remote.create_container("co", "guild").value();
    auto message = remote.send_message(container.id, "1", payload("a")).value();

    ASSERT_TRUE(remote.pin_message(container.id, message.id).is_ok());
    EXPECT_TRUE(remote.messages(container.id)[0].pinned);

    ASSERT_TRUE(remote.delete_container(container.id).is_ok());
    EXPECT_EQ(remote.container_count(), 0u);
    auto again = remote.delete_container(container.id);
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error().code, ErrorCode::NotFound);
}
