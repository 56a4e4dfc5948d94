#include "lft/transfer/receiver.hpp"

#include "support/test_helpers.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace lft::transfer;
using namespace lft::protocol;
using lft::ErrorCode;
using lft::events::EntryCompleted;
using lft::events::TransferEvent;
using lft::test::create_temp_dir;
using lft::test::read_file;
using lft::test::write_file;

namespace {

DataChunk chunk_of(std::uint64_t index, const std::string& text) {
    return DataChunk{index, std::vector<std::uint8_t>(text.begin(), text.end())};
}

} // namespace

class ReceiverTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = create_temp_dir("lft_recv_");
        options_.receive_root = root_;
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    Receiver make_receiver() {
        return Receiver(options_, [this](TransferEvent event) { events_.push_back(std::move(event)); });
    }

    std::vector<std::string> completed_paths() const {
        std::vector<std::string> paths;
        for (const auto& event : events_) {
            if (const auto* done = std::get_if<EntryCompleted>(&event)) {
                paths.push_back(done->relative_path);
            }
        }
        return paths;
    }

    fs::path root_;
    ReceiverOptions options_;
    std::vector<TransferEvent> events_;
};

TEST_F(ReceiverTest, ReceivesSingleFile) {
    Receiver receiver(options_);
    ASSERT_TRUE(receiver.begin("peer").is_ok());

    ASSERT_TRUE(receiver.handle(Header{TransferKind::File, "a.txt", 5, 1}).is_ok());
    EXPECT_EQ(receiver.session().phase(), TransferPhase::ReceivingData);

    auto reply = receiver.handle(chunk_of(0, "hello"));
    ASSERT_TRUE(reply.is_ok());
    EXPECT_FALSE(reply.value().has_value());

    EXPECT_TRUE(receiver.finished());
    const auto outcome = receiver.outcome();
    EXPECT_TRUE(outcome.succeeded());
    EXPECT_EQ(outcome.items, 1u);
    EXPECT_EQ(outcome.bytes, 5u);
    EXPECT_EQ(outcome.local_path, root_ / "received_files" / "a.txt");
    EXPECT_EQ(read_file(outcome.local_path), "hello");
}

TEST_F(ReceiverTest, ZeroByteFileCompletesOnHeader) {
    Receiver receiver(options_);
    ASSERT_TRUE(receiver.begin("peer").is_ok());

    ASSERT_TRUE(receiver.handle(Header{TransferKind::File, "empty.txt", 0, 1}).is_ok());
    EXPECT_EQ(receiver.session().phase(), TransferPhase::Complete);
    EXPECT_TRUE(fs::exists(root_ / "received_files" / "empty.txt"));
    EXPECT_EQ(fs::file_size(root_ / "received_files" / "empty.txt"), 0u);
}

TEST_F(ReceiverTest, RenamesDuplicateFileName) {
    write_file(root_ / "received_files" / "a.txt", "old");

    Receiver receiver(options_);
    ASSERT_TRUE(receiver.begin("peer").is_ok());
    ASSERT_TRUE(receiver.handle(Header{TransferKind::File, "a.txt", 3, 1}).is_ok());
    ASSERT_TRUE(receiver.handle(chunk_of(0, "new")).is_ok());

    EXPECT_EQ(receiver.destination(), root_ / "received_files" / "a_1.txt");
    EXPECT_EQ(read_file(root_ / "received_files" / "a.txt"), "old");
    EXPECT_EQ(read_file(root_ / "received_files" / "a_1.txt"), "new");
}

TEST_F(ReceiverTest, ReceivesFolderAndVerifies) {
    auto receiver = make_receiver();
    ASSERT_TRUE(receiver.begin("peer").is_ok());

    ASSERT_TRUE(receiver.handle(Header{TransferKind::Folder, "root", 5, 3}).is_ok());
    ASSERT_TRUE(receiver.handle(FolderEntryHeader{EntryKind::Directory, "sub", 0}).is_ok());
    ASSERT_TRUE(receiver.handle(FolderEntryHeader{EntryKind::File, "sub/a.txt", 5}).is_ok());
    EXPECT_EQ(receiver.session().phase(), TransferPhase::ReceivingData);
    ASSERT_TRUE(receiver.handle(chunk_of(1, "he")).is_ok());
    ASSERT_TRUE(receiver.handle(chunk_of(1, "llo")).is_ok());
    EXPECT_EQ(receiver.session().phase(), TransferPhase::ReceivingEntries);
    ASSERT_TRUE(receiver.handle(FolderEntryHeader{EntryKind::File, "zero.txt", 0}).is_ok());

    auto reply = receiver.handle(Handshake{3, 5});
    ASSERT_TRUE(reply.is_ok());
    ASSERT_TRUE(reply.value().has_value());
    const auto& ack = std::get<Acknowledgment>(*reply.value());
    EXPECT_TRUE(ack.matched);
    EXPECT_EQ(ack.received_items, 3u);
    EXPECT_EQ(ack.received_bytes, 5u);

    EXPECT_EQ(receiver.session().phase(), TransferPhase::Complete);
    const fs::path folder = root_ / "received_folders" / "root";
    EXPECT_EQ(read_file(folder / "sub" / "a.txt"), "hello");
    EXPECT_TRUE(fs::exists(folder / "zero.txt"));

    const std::vector<std::string> expected{"sub", "sub/a.txt", "zero.txt"};
    EXPECT_EQ(completed_paths(), expected);
}

TEST_F(ReceiverTest, HandshakeMismatchAbortsAndStillAcknowledges) {
    Receiver receiver(options_);
    ASSERT_TRUE(receiver.begin("peer").is_ok());
    ASSERT_TRUE(receiver.handle(Header{TransferKind::Folder, "root", 0, 1}).is_ok());
    ASSERT_TRUE(receiver.handle(FolderEntryHeader{EntryKind::Directory, "d", 0}).is_ok());

    auto reply = receiver.handle(Handshake{2, 0});
    ASSERT_TRUE(reply.is_ok());
    const auto& ack = std::get<Acknowledgment>(*reply.value());
    EXPECT_FALSE(ack.matched);
    EXPECT_EQ(ack.received_items, 1u);

    EXPECT_EQ(receiver.session().phase(), TransferPhase::Aborted);
    ASSERT_TRUE(receiver.outcome().error.has_value());
    EXPECT_EQ(receiver.outcome().error->code, ErrorCode::VerificationMismatch);
    ASSERT_TRUE(receiver.outcome().verification.has_value());
    EXPECT_EQ(receiver.outcome().verification->items_expected, 2u);
}

TEST_F(ReceiverTest, MergesIntoExistingFolder) {
    write_file(root_ / "received_folders" / "root" / "keep.txt", "keep");

    Receiver receiver(options_);
    ASSERT_TRUE(receiver.begin("peer").is_ok());
    ASSERT_TRUE(receiver.handle(Header{TransferKind::Folder, "root", 1, 1}).is_ok());
    EXPECT_EQ(receiver.destination(), root_ / "received_folders" / "root");
    ASSERT_TRUE(receiver.handle(FolderEntryHeader{EntryKind::File, "new.txt", 1}).is_ok());
    ASSERT_TRUE(receiver.handle(chunk_of(0, "n")).is_ok());
    ASSERT_TRUE(receiver.handle(Handshake{1, 1}).is_ok());

    EXPECT_TRUE(receiver.outcome().succeeded());
    EXPECT_EQ(read_file(root_ / "received_folders" / "root" / "keep.txt"), "keep");
    EXPECT_EQ(read_file(root_ / "received_folders" / "root" / "new.txt"), "n");
}

TEST_F(ReceiverTest, NamesCleanedToTheSamePathDoNotOverwrite) {
    auto receiver = make_receiver();
    ASSERT_TRUE(receiver.begin("peer").is_ok());
    ASSERT_TRUE(receiver.handle(Header{TransferKind::Folder, "root", 6, 2}).is_ok());

    ASSERT_TRUE(receiver.handle(FolderEntryHeader{EntryKind::File, "x*.txt", 3}).is_ok());
    ASSERT_TRUE(receiver.handle(chunk_of(0, "one")).is_ok());
    ASSERT_TRUE(receiver.handle(FolderEntryHeader{EntryKind::File, "x?.txt", 3}).is_ok());
    ASSERT_TRUE(receiver.handle(chunk_of(1, "two")).is_ok());

    auto reply = receiver.handle(Handshake{2, 6});
    ASSERT_TRUE(reply.is_ok());
    EXPECT_TRUE(receiver.outcome().succeeded());

    const fs::path folder = root_ / "received_folders" / "root";
    EXPECT_EQ(read_file(folder / "x_.txt"), "one");
    EXPECT_EQ(read_file(folder / "x__1.txt"), "two");

    std::vector<fs::path> written;
    for (const auto& event : events_) {
        if (const auto* done = std::get_if<EntryCompleted>(&event)) {
            written.push_back(done->local_path);
        }
    }
    const std::vector<fs::path> expected{folder / "x_.txt", folder / "x__1.txt"};
    EXPECT_EQ(written, expected);
}

TEST_F(ReceiverTest, MergeStillReplacesFilesFromEarlierTransfers) {
    write_file(root_ / "received_folders" / "root" / "a.txt", "old");

    Receiver receiver(options_);
    ASSERT_TRUE(receiver.begin("peer").is_ok());
    ASSERT_TRUE(receiver.handle(Header{TransferKind::Folder, "root", 3, 1}).is_ok());
    ASSERT_TRUE(receiver.handle(FolderEntryHeader{EntryKind::File, "a.txt", 3}).is_ok());
    ASSERT_TRUE(receiver.handle(chunk_of(0, "new")).is_ok());
    ASSERT_TRUE(receiver.handle(Handshake{1, 3}).is_ok());

    EXPECT_EQ(read_file(root_ / "received_folders" / "root" / "a.txt"), "new");
    EXPECT_FALSE(fs::exists(root_ / "received_folders" / "root" / "a_1.txt"));
}

TEST_F(ReceiverTest, RejectsFramesOutOfPhase) {
    Receiver receiver(options_);
    ASSERT_TRUE(receiver.begin("peer").is_ok());

    auto early = receiver.handle(chunk_of(0, "x"));
    ASSERT_TRUE(early.is_error());
    EXPECT_EQ(early.error().code, ErrorCode::ProtocolViolation);
    EXPECT_EQ(receiver.session().phase(), TransferPhase::Aborted);

    auto after = receiver.handle(Header{TransferKind::File, "a", 1, 1});
    EXPECT_TRUE(after.is_error());
}

TEST_F(ReceiverTest, RejectsAcknowledgmentFromSender) {
    Receiver receiver(options_);
    ASSERT_TRUE(receiver.begin("peer").is_ok());
    auto result = receiver.handle(Acknowledgment{0, 0, true});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::ProtocolViolation);
}

TEST_F(ReceiverTest, RejectsChunkForWrongEntry) {
    Receiver receiver(options_);
    ASSERT_TRUE(receiver.begin("peer").is_ok());
    ASSERT_TRUE(receiver.handle(Header{TransferKind::Folder, "root", 4, 1}).is_ok());
    ASSERT_TRUE(receiver.handle(FolderEntryHeader{EntryKind::File, "a", 4}).is_ok());

    auto result = receiver.handle(chunk_of(7, "data"));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::ProtocolViolation);
}

TEST_F(ReceiverTest, RejectsChunkOverflowingDeclaredSize) {
    Receiver receiver(options_);
    ASSERT_TRUE(receiver.begin("peer").is_ok());
    ASSERT_TRUE(receiver.handle(Header{TransferKind::File, "a.txt", 3, 1}).is_ok());

    auto result = receiver.handle(chunk_of(0, "toolong"));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::SizeMismatch);
    EXPECT_EQ(receiver.outcome().bytes, 0u);
}

TEST_F(ReceiverTest, RejectsTraversalWithoutWritingOutsideDestination) {
    Receiver receiver(options_);
    ASSERT_TRUE(receiver.begin("peer").is_ok());
    ASSERT_TRUE(receiver.handle(Header{TransferKind::Folder, "root", 1, 1}).is_ok());

    auto result = receiver.handle(FolderEntryHeader{EntryKind::File, "../../escape.txt", 1});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidPath);
    EXPECT_FALSE(fs::exists(root_ / "escape.txt"));
    EXPECT_FALSE(fs::exists(root_ / "received_folders" / "escape.txt"));
}

TEST_F(ReceiverTest, RejectsHeaderNameWithSeparator) {
    Receiver receiver(options_);
    ASSERT_TRUE(receiver.begin("peer").is_ok());
    auto result = receiver.handle(Header{TransferKind::File, "../evil", 1, 1});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidPath);
}

TEST_F(ReceiverTest, NextEntryWhileFileIncompleteIsSizeMismatch) {
    Receiver receiver(options_);
    ASSERT_TRUE(receiver.begin("peer").is_ok());
    ASSERT_TRUE(receiver.handle(Header{TransferKind::Folder, "root", 10, 2}).is_ok());
    ASSERT_TRUE(receiver.handle(FolderEntryHeader{EntryKind::File, "a", 10}).is_ok());
    ASSERT_TRUE(receiver.handle(chunk_of(0, "abc")).is_ok());

    auto result = receiver.handle(FolderEntryHeader{EntryKind::File, "b", 0});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::SizeMismatch);
    EXPECT_EQ(result.error().message, "'a' ended after 3 of 10 bytes");
}

TEST_F(ReceiverTest, ConnectionLossMidFileBecomesSizeMismatch) {
    Receiver receiver(options_);
    ASSERT_TRUE(receiver.begin("peer").is_ok());
    ASSERT_TRUE(receiver.handle(Header{TransferKind::File, "a.txt", 10, 1}).is_ok());
    ASSERT_TRUE(receiver.handle(chunk_of(0, "abcd")).is_ok());

    receiver.fail(lft::Error(ErrorCode::ConnectionClosed, "peer went away"));

    const auto outcome = receiver.outcome();
    EXPECT_EQ(outcome.phase, TransferPhase::Aborted);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->code, ErrorCode::SizeMismatch);
    EXPECT_EQ(read_file(root_ / "received_files" / "a.txt"), "abcd");
}
