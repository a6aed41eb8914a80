// test_transfer_router.cpp — Тесты матрицы маршрутизации и оценки скорости

#include <gtest/gtest.h>
#include "twinpane/Transfer/TransferRouter.h"
#include "twinpane/Transfer/SpeedEstimator.h"

using namespace TwinPane;
using namespace std::chrono_literals;

// ═══════════════════════════════════════════════════════════
// Матрица
// ═══════════════════════════════════════════════════════════

TEST(TransferRouterTest, RoutingMatrix) {
    struct Case {
        FileSystemKind source;
        FileSystemKind destination;
        bool isCopy;
        TransferOperation expected;
        bool removesSource;
    };
    const Case cases[] = {
        {FileSystemKind::Local,  FileSystemKind::Local,  true,  TransferOperation::LocalCopy,  false},
        {FileSystemKind::Local,  FileSystemKind::Local,  false, TransferOperation::LocalMove,  true},
        {FileSystemKind::Remote, FileSystemKind::Remote, true,  TransferOperation::RemoteCopy, false},
        {FileSystemKind::Remote, FileSystemKind::Remote, false, TransferOperation::RemoteMove, true},
        {FileSystemKind::Local,  FileSystemKind::Remote, true,  TransferOperation::Upload,     false},
        {FileSystemKind::Local,  FileSystemKind::Remote, false, TransferOperation::Upload,     false},
        {FileSystemKind::Remote, FileSystemKind::Local,  true,  TransferOperation::Download,   false},
        {FileSystemKind::Remote, FileSystemKind::Local,  false, TransferOperation::Download,   false},
    };

    for (const auto& c : cases) {
        TransferRoute route = TransferRouter::route(c.source, c.destination, c.isCopy);
        EXPECT_EQ(route.operation, c.expected) << transferOperationToString(c.expected);
        EXPECT_EQ(route.removesSource, c.removesSource) << transferOperationToString(c.expected);
        EXPECT_EQ(route.crossesSystems(), c.source != c.destination);
    }
}

TEST(TransferRouterTest, OperationNames) {
    EXPECT_STREQ(transferOperationToString(TransferOperation::LocalCopy), "localCopy");
    EXPECT_STREQ(transferOperationToString(TransferOperation::RemoteMove), "remoteMove");
    EXPECT_STREQ(transferOperationToString(TransferOperation::Upload), "upload");
    EXPECT_STREQ(transferOperationToString(TransferOperation::Download), "download");
}

TEST(TransferRouterTest, TargetSystemFollowsPane) {
    PaneState pane;
    pane.system = FileSystemKind::Remote;
    pane.currentPath = "C:/looks/local";
    EXPECT_EQ(TransferRouter::targetSystem(pane), FileSystemKind::Remote);
}

// ═══════════════════════════════════════════════════════════
// planDrop
// ═══════════════════════════════════════════════════════════

static DropRequest makeDrop(FileSystemKind from, FileSystemKind to, bool isCopy) {
    DropRequest request;
    request.hostId = "host-1";
    request.sourcePane = {PaneId::Left, from, "/src"};
    request.targetPane = {PaneId::Right, to, "/dst"};
    request.targetPath = "/dst";
    request.isCopy = isCopy;
    return request;
}

TEST(TransferRouterTest, PlanDropBuildsStepPerSource) {
    DropRequest request = makeDrop(FileSystemKind::Local, FileSystemKind::Remote, true);
    request.sourcePaths = {"/src/a.txt", "/src/photos"};

    TransferPlan plan = TransferRouter::planDrop(request);
    EXPECT_EQ(plan.route.operation, TransferOperation::Upload);
    EXPECT_EQ(plan.hostId, "host-1");
    ASSERT_EQ(plan.steps.size(), 2u);
    EXPECT_EQ(plan.steps[0].sourcePath, "/src/a.txt");
    EXPECT_EQ(plan.steps[0].destinationPath, "/dst/a.txt");
    EXPECT_EQ(plan.steps[1].destinationPath, "/dst/photos");
    EXPECT_EQ(plan.steps[1].operation, TransferOperation::Upload);
}

TEST(TransferRouterTest, PlanDropSkipsItemsAlreadyInTarget) {
    DropRequest request = makeDrop(FileSystemKind::Local, FileSystemKind::Local, false);
    request.sourcePaths = {"/dst/same.txt", "/src/other.txt", ""};

    TransferPlan plan = TransferRouter::planDrop(request);
    EXPECT_EQ(plan.route.operation, TransferOperation::LocalMove);
    ASSERT_EQ(plan.steps.size(), 1u);
    EXPECT_EQ(plan.steps[0].sourcePath, "/src/other.txt");
}

TEST(TransferRouterTest, PlanDropAcrossSystemsKeepsSamePath) {
    DropRequest request = makeDrop(FileSystemKind::Remote, FileSystemKind::Local, true);
    request.sourcePaths = {"/dst/same.txt"};

    TransferPlan plan = TransferRouter::planDrop(request);
    EXPECT_EQ(plan.route.operation, TransferOperation::Download);
    EXPECT_EQ(plan.steps.size(), 1u);
}

// ═══════════════════════════════════════════════════════════
// SpeedEstimator
// ═══════════════════════════════════════════════════════════

TEST(SpeedEstimatorTest, FirstSampleIsInstantRate) {
    SpeedEstimator estimator(0.3, 250);
    auto t0 = SpeedEstimator::Clock::now();
    estimator.reset(t0);

    EXPECT_DOUBLE_EQ(estimator.addBytes(500, t0 + 100ms), 0.0);
    EXPECT_DOUBLE_EQ(estimator.addBytes(500, t0 + 500ms), 2000.0);
}

TEST(SpeedEstimatorTest, SmoothsWithExponentialAverage) {
    SpeedEstimator estimator(0.5, 0);
    auto t0 = SpeedEstimator::Clock::now();
    estimator.reset(t0);

    estimator.addBytes(1000, t0 + 1000ms);                      // 1000 B/s
    double rate = estimator.addBytes(3000, t0 + 2000ms);        // 3000 B/s
    EXPECT_DOUBLE_EQ(rate, 2000.0);
    EXPECT_DOUBLE_EQ(estimator.bytesPerSecond(), 2000.0);

    estimator.reset(t0 + 3000ms);
    EXPECT_DOUBLE_EQ(estimator.bytesPerSecond(), 0.0);
}
