#include <gtest/gtest.h>

#include "permsnap/snapshot_writer.hpp"
#include "test_support.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <string>

using namespace permsnap;
using permsnap::testing::TempTree;

namespace {

FileSystemEntry make_entry(const std::string& path, EntryKind kind, const std::string& octal,
                           const std::string& symbolic) {
    FileSystemEntry entry;
    entry.path = path;
    entry.kind = kind;
    entry.owner = "root";
    entry.group = "wazuh";
    entry.mode_octal = octal;
    entry.mode_symbolic = symbolic;
    return entry;
}

Snapshot sample_snapshot() {
    Snapshot snapshot;
    snapshot.emplace("/var/ossec/bin", make_entry("/var/ossec/bin", EntryKind::Directory, "750", "drwxr-x---"));
    snapshot.emplace("/var/ossec/active-response",
                     make_entry("/var/ossec/active-response", EntryKind::Directory, "750", "drwxr-x---"));
    snapshot.emplace("/var/ossec/bin/wazuh-control",
                     make_entry("/var/ossec/bin/wazuh-control", EntryKind::File, "750", "-rwxr-x---"));
    snapshot.emplace("/var/ossec/queue/gone", FileSystemEntry::unavailable("/var/ossec/queue/gone"));
    return snapshot;
}

} // namespace

TEST(SnapshotWriterTest, EntriesAreOrderedByPathWithSequentialIds) {
    const auto document = to_document(sample_snapshot());
    const auto& data = document.at("data");
    ASSERT_EQ(data.size(), 4u);

    EXPECT_EQ(data[0].at("id"), 0);
    EXPECT_EQ(data[0].at("name"), "/var/ossec/active-response");
    EXPECT_EQ(data[1].at("id"), 1);
    EXPECT_EQ(data[1].at("name"), "/var/ossec/bin");
    EXPECT_EQ(data[2].at("name"), "/var/ossec/bin/wazuh-control");
    EXPECT_EQ(data[3].at("id"), 3);
    EXPECT_EQ(data[3].at("name"), "/var/ossec/queue/gone");
}

TEST(SnapshotWriterTest, DescriptionCarriesFiveFields) {
    const auto document = to_document(sample_snapshot());
    const auto& description = document.at("data")[1].at("description");

    EXPECT_EQ(description.size(), 5u);
    EXPECT_EQ(description.at("group"), "wazuh");
    EXPECT_EQ(description.at("mode"), "750");
    EXPECT_EQ(description.at("prot"), "drwxr-x---");
    EXPECT_EQ(description.at("type"), "directory");
    EXPECT_EQ(description.at("user"), "root");

    EXPECT_EQ(document.at("data")[2].at("description").at("type"), "file");
}

TEST(SnapshotWriterTest, UnavailableEntryIsAllSentinel) {
    const auto document = to_document(sample_snapshot());
    const auto& description = document.at("data")[3].at("description");

    for (const auto& key : {"group", "mode", "prot", "type", "user"}) {
        EXPECT_EQ(description.at(key), "-") << key;
    }
}

TEST(SnapshotWriterTest, EmptySnapshotWritesEmptyData) {
    std::ostringstream out;
    write_snapshot(Snapshot{}, out);
    EXPECT_EQ(out.str(), R"({"data":[]})");
}

TEST(SnapshotWriterTest, FileRoundTripsThroughParser) {
    TempTree tree;
    const auto destination = tree.root() / "linux_files.json";

    write_snapshot_file(sample_snapshot(), destination);

    std::ifstream in{destination};
    const auto parsed = nlohmann::json::parse(in);
    EXPECT_EQ(parsed, to_document(sample_snapshot()));
}

TEST(SnapshotWriterTest, UnwritableDestinationThrows) {
    TempTree tree;
    EXPECT_THROW(write_snapshot_file(sample_snapshot(), tree.root() / "no-such-dir" / "out.json"), SnapshotError);
}
