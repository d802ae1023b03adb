#include <boost/test/unit_test.hpp>
#include <chrono>
#include <string>
#include <thread>
#include "core/FileTask.hpp"
#include "core/StopSource.hpp"
#include "fixtures/FakeUploadClient.hpp"
#include "fixtures/TempDirFixture.hpp"
#include "upload/ProgressBoard.hpp"
#include "workflow/UploadWorkflow.hpp"

using namespace reeldrop;

struct WorkflowFixture : public TempDirFixture {
    FakeUploadClient client;
    WorkflowOptions options;

    WorkflowFixture() {
        options.categoryId = 25;
        options.transferRetries = 1;
    }
};

BOOST_FIXTURE_TEST_SUITE(workflow_test_suite, WorkflowFixture)

BOOST_AUTO_TEST_CASE(test_success_publishes_and_deletes_source) {
    auto path = writeFile("Beach Day.mp4", "video-bytes");
    UploadWorkflow workflow(client, options);

    FileTask task = workflow.run(path);

    BOOST_CHECK(task.state == TaskState::Done);
    BOOST_CHECK(task.error == ErrorKind::None);
    BOOST_CHECK(task.sourceRemoved);
    BOOST_CHECK(!exists(path));
    BOOST_CHECK_EQUAL(task.title, "Beach Day");
    BOOST_CHECK_EQUAL(task.postId, "post-1");
    BOOST_CHECK_EQUAL(task.transferAttempts, 1);

    BOOST_CHECK_EQUAL(client.acquireCalls, 1);
    BOOST_CHECK_EQUAL(client.transferCalls, 1);
    BOOST_REQUIRE_EQUAL(client.postedTitles.size(), 1u);
    BOOST_CHECK_EQUAL(client.postedTitles[0], "Beach Day");
    BOOST_CHECK_EQUAL(client.postedHashes[0], "hash-1");
    BOOST_CHECK_EQUAL(client.postedCategories[0], 25);
}

BOOST_AUTO_TEST_CASE(test_single_transfer_failure_is_retried) {
    auto path = writeFile("clip.mp4", "video-bytes");
    client.failingTransfers = 1;
    UploadWorkflow workflow(client, options);

    FileTask task = workflow.run(path);

    BOOST_CHECK(task.state == TaskState::Done);
    BOOST_CHECK_EQUAL(task.transferAttempts, 2);
    BOOST_CHECK_EQUAL(client.transferCalls, 2);
    BOOST_CHECK_EQUAL(client.acquireCalls, 1);
    BOOST_CHECK(!exists(path));
}

BOOST_AUTO_TEST_CASE(test_repeated_transfer_failure_keeps_file) {
    auto path = writeFile("clip.mp4", "video-bytes");
    client.failingTransfers = 2;
    UploadWorkflow workflow(client, options);

    FileTask task = workflow.run(path);

    BOOST_CHECK(task.state == TaskState::Failed);
    BOOST_CHECK(task.error == ErrorKind::Transfer);
    BOOST_CHECK_EQUAL(client.transferCalls, 2);
    BOOST_CHECK_EQUAL(client.postCalls, 0);
    BOOST_CHECK(exists(path));
}

BOOST_AUTO_TEST_CASE(test_retry_can_be_disabled) {
    auto path = writeFile("clip.mp4", "video-bytes");
    client.failingTransfers = 1;
    options.transferRetries = 0;
    UploadWorkflow workflow(client, options);

    FileTask task = workflow.run(path);

    BOOST_CHECK(task.state == TaskState::Failed);
    BOOST_CHECK_EQUAL(client.transferCalls, 1);
    BOOST_CHECK(exists(path));
}

BOOST_AUTO_TEST_CASE(test_conflict_counts_as_done) {
    auto path = writeFile("clip.mp4", "video-bytes");
    client.conflictOnPost = true;
    UploadWorkflow workflow(client, options);

    FileTask task = workflow.run(path);

    BOOST_CHECK(task.state == TaskState::Done);
    BOOST_CHECK(task.alreadyPosted);
    BOOST_CHECK(task.postId.empty());
    BOOST_CHECK(!exists(path));
}

BOOST_AUTO_TEST_CASE(test_failed_delete_stays_done) {
    auto path = writeFile("clip.mp4", "video-bytes");
    client.onCreatePost = [path]() { std::filesystem::remove(path); };
    UploadWorkflow workflow(client, options);

    FileTask task = workflow.run(path);

    BOOST_CHECK(task.state == TaskState::Done);
    BOOST_CHECK(task.error == ErrorKind::None);
    BOOST_CHECK(!task.sourceRemoved);
    BOOST_CHECK_EQUAL(task.postId, "post-1");
}

BOOST_AUTO_TEST_CASE(test_protocol_error_keeps_file) {
    auto path = writeFile("clip.mp4", "video-bytes");
    client.protocolFailureOnAcquire = 1;
    UploadWorkflow workflow(client, options);

    FileTask task = workflow.run(path);

    BOOST_CHECK(task.state == TaskState::Failed);
    BOOST_CHECK(task.error == ErrorKind::Protocol);
    BOOST_CHECK_EQUAL(client.transferCalls, 0);
    BOOST_CHECK(exists(path));
}

BOOST_AUTO_TEST_CASE(test_auth_error_is_reported) {
    auto path = writeFile("clip.mp4", "video-bytes");
    client.authFailureOnAcquire = 1;
    UploadWorkflow workflow(client, options);

    FileTask task = workflow.run(path);

    BOOST_CHECK(task.state == TaskState::Failed);
    BOOST_CHECK(task.error == ErrorKind::Auth);
    BOOST_CHECK(exists(path));
}

BOOST_AUTO_TEST_CASE(test_empty_source_fails_before_acquiring) {
    auto path = writeFile("clip.mp4", "");
    UploadWorkflow workflow(client, options);

    FileTask task = workflow.run(path);

    BOOST_CHECK(task.state == TaskState::Failed);
    BOOST_CHECK(task.error == ErrorKind::LocalIO);
    BOOST_CHECK_EQUAL(client.acquireCalls, 0);
    BOOST_CHECK(exists(path));
}

BOOST_AUTO_TEST_CASE(test_missing_source_fails_before_acquiring) {
    UploadWorkflow workflow(client, options);

    FileTask task = workflow.run((dir / "vanished.mp4").string());

    BOOST_CHECK(task.state == TaskState::Failed);
    BOOST_CHECK(task.error == ErrorKind::LocalIO);
    BOOST_CHECK_EQUAL(client.acquireCalls, 0);
}

BOOST_AUTO_TEST_CASE(test_growing_source_fails_settle_check) {
    auto path = writeFile("clip.mp4", "first-chunk");
    options.settleDelay = std::chrono::milliseconds(300);
    UploadWorkflow workflow(client, options);

    std::thread writer([path]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        std::ofstream out(path, std::ios::binary | std::ios::app);
        out << "second-chunk";
    });
    FileTask task = workflow.run(path);
    writer.join();

    BOOST_CHECK(task.state == TaskState::Failed);
    BOOST_CHECK(task.error == ErrorKind::LocalIO);
    BOOST_CHECK_EQUAL(client.acquireCalls, 0);
    BOOST_CHECK(exists(path));
}

BOOST_AUTO_TEST_CASE(test_stable_source_passes_settle_check) {
    auto path = writeFile("clip.mp4", "complete");
    options.settleDelay = std::chrono::milliseconds(20);
    UploadWorkflow workflow(client, options);

    BOOST_CHECK(workflow.run(path).state == TaskState::Done);
}

BOOST_AUTO_TEST_CASE(test_stop_request_cancels_before_next_step) {
    auto path = writeFile("clip.mp4", "video-bytes");
    StopSource stop;
    stop.requestStop();
    UploadWorkflow workflow(client, options, nullptr, &stop);

    FileTask task = workflow.run(path);

    BOOST_CHECK(task.state == TaskState::Failed);
    BOOST_CHECK(task.error == ErrorKind::Cancelled);
    BOOST_CHECK_EQUAL(client.acquireCalls, 0);
    BOOST_CHECK(exists(path));
}

BOOST_AUTO_TEST_CASE(test_progress_goes_to_board) {
    auto path = writeFile("clip.mp4", "video-bytes");
    ProgressBoard board;
    UploadWorkflow workflow(client, options, &board);

    BOOST_CHECK(workflow.run(path).state == TaskState::Done);
    // the transfer released its entry when it finished
    BOOST_CHECK(board.snapshot().empty());
}

BOOST_AUTO_TEST_SUITE_END()
