#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <thread>

#include "../include/errors.hpp"
#include "../include/nodereconciler.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;
using ::testing::_;
using ::testing::InSequence;
using ::testing::Return;
using ::testing::Throw;
using testsupport::GatedWait;
using testsupport::ImmediateWait;
using testsupport::makeNode;
using testsupport::MockSupervisor;
using testsupport::running;
using testsupport::stopped;

namespace {

const ReconcilePolicy kStart{3, 10ms};
const ReconcilePolicy kStop{2, 10ms};

bool ready(const std::shared_future<ReconcileResult> &future) {
  return future.wait_for(5s) == std::future_status::ready;
}

}  // namespace

class NodeReconcilerTest : public ::testing::Test {
 protected:
  void SetUp() override { registry_.insert(makeNode("alpha", 9200, 9300)); }

  NodeRegistry registry_;
  MockSupervisor supervisor_;
};

TEST_F(NodeReconcilerTest, StartConvergesWhenProcessComesUp) {
  ImmediateWait wait;
  EXPECT_CALL(supervisor_, healthProbe(_))
      .WillOnce(Return(stopped()))
      .WillOnce(Return(stopped()))
      .WillOnce(Return(running(77)));
  EXPECT_CALL(supervisor_, launch(_)).Times(1);

  NodeReconciler reconciler(registry_, supervisor_, wait, kStart, kStop);
  auto ticket = reconciler.start("alpha");
  ASSERT_TRUE(ready(ticket.result));
  auto result = ticket.result.get();

  EXPECT_FALSE(ticket.alreadyInState);
  EXPECT_TRUE(result.converged());
  EXPECT_EQ(result.attempts, 2);
  EXPECT_EQ(result.finalState, NodeState::Running);
  EXPECT_EQ(reconciler.stateOf("alpha"), NodeState::Running);
  EXPECT_FALSE(reconciler.isReconciling("alpha"));
}

// Исчерпание попыток: итог с таймаутом и свежим состоянием, без исключения
TEST_F(NodeReconcilerTest, StartTimesOutAndReportsObservedState) {
  ImmediateWait wait;
  // начальная проверка, три попытки и итоговая проверка
  EXPECT_CALL(supervisor_, healthProbe(_)).Times(5).WillRepeatedly(Return(stopped()));
  EXPECT_CALL(supervisor_, launch(_)).Times(1);

  NodeReconciler reconciler(registry_, supervisor_, wait, kStart, kStop);
  auto ticket = reconciler.start("alpha");
  ASSERT_TRUE(ready(ticket.result));
  auto result = ticket.result.get();

  EXPECT_EQ(result.outcome, ReconcileOutcome::TimedOut);
  EXPECT_EQ(result.attempts, 3);
  EXPECT_EQ(result.finalState, NodeState::Stopped);
  EXPECT_EQ(wait.calls.load(), 3);
  EXPECT_EQ(reconciler.stateOf("alpha"), NodeState::Stopped);
}

TEST_F(NodeReconcilerTest, AlreadyRunningIssuesNoCommand) {
  ImmediateWait wait;
  EXPECT_CALL(supervisor_, healthProbe(_)).WillOnce(Return(running()));
  EXPECT_CALL(supervisor_, launch(_)).Times(0);

  NodeReconciler reconciler(registry_, supervisor_, wait, kStart, kStop);
  auto ticket = reconciler.start("alpha");

  EXPECT_TRUE(ticket.alreadyInState);
  auto result = ticket.result.get();
  EXPECT_TRUE(result.converged());
  EXPECT_EQ(result.attempts, 0);
  EXPECT_EQ(wait.calls.load(), 0);
}

TEST_F(NodeReconcilerTest, StopConvergesWhenProcessExits) {
  ImmediateWait wait;
  EXPECT_CALL(supervisor_, healthProbe(_))
      .WillOnce(Return(running()))
      .WillOnce(Return(stopped()));
  EXPECT_CALL(supervisor_, terminate(_)).Times(1);

  NodeReconciler reconciler(registry_, supervisor_, wait, kStart, kStop);
  auto result = reconciler.stop("alpha").result.get();

  EXPECT_TRUE(result.converged());
  EXPECT_EQ(result.finalState, NodeState::Stopped);
}

// Два одновременных запуска разделяют один цикл и одну серию проверок
TEST_F(NodeReconcilerTest, ConcurrentStartsShareOneLoop) {
  GatedWait wait;
  EXPECT_CALL(supervisor_, healthProbe(_))
      .Times(2)
      .WillOnce(Return(stopped()))
      .WillOnce(Return(running()));
  EXPECT_CALL(supervisor_, launch(_)).Times(1);

  NodeReconciler reconciler(registry_, supervisor_, wait, kStart, kStop);
  auto first = reconciler.start("alpha");
  ASSERT_TRUE(wait.awaitWaiter());
  auto second = reconciler.start("alpha");

  EXPECT_FALSE(first.joined);
  EXPECT_TRUE(second.joined);
  EXPECT_EQ(reconciler.stateOf("alpha"), NodeState::Starting);

  wait.open();
  ASSERT_TRUE(ready(first.result));
  ASSERT_TRUE(ready(second.result));
  EXPECT_TRUE(first.result.get().converged());
  EXPECT_EQ(second.result.get().attempts, first.result.get().attempts);
}

TEST_F(NodeReconcilerTest, OppositeRequestDuringFlightIsRejected) {
  GatedWait wait;
  EXPECT_CALL(supervisor_, healthProbe(_))
      .WillOnce(Return(stopped()))
      .WillRepeatedly(Return(running()));
  EXPECT_CALL(supervisor_, launch(_)).Times(1);
  EXPECT_CALL(supervisor_, terminate(_)).Times(0);

  NodeReconciler reconciler(registry_, supervisor_, wait, kStart, kStop);
  auto ticket = reconciler.start("alpha");
  ASSERT_TRUE(wait.awaitWaiter());

  EXPECT_THROW(reconciler.stop("alpha"), ReconcileBusyError);

  wait.open();
  ASSERT_TRUE(ready(ticket.result));
  EXPECT_TRUE(ticket.result.get().converged());
}

// Отмена всех ожидающих прерывает цикл, состояние проверяется ещё раз
TEST_F(NodeReconcilerTest, CancellingAllWaitersStopsTheLoop) {
  GatedWait wait;
  EXPECT_CALL(supervisor_, healthProbe(_))
      .Times(2)
      .WillRepeatedly(Return(stopped()));
  EXPECT_CALL(supervisor_, launch(_)).Times(1);
  EXPECT_CALL(supervisor_, terminate(_)).Times(0);

  ManagementSession session;
  NodeReconciler reconciler(registry_, supervisor_, wait, kStart, kStop);
  auto ticket = reconciler.start("alpha", session.newToken());
  ASSERT_TRUE(wait.awaitWaiter());

  session.close();
  ASSERT_TRUE(ready(ticket.result));
  auto result = ticket.result.get();

  EXPECT_EQ(result.outcome, ReconcileOutcome::Cancelled);
  EXPECT_EQ(result.attempts, 0);
  EXPECT_EQ(result.finalState, NodeState::Stopped);
}

TEST_F(NodeReconcilerTest, LoopContinuesWhileAnyWaiterRemains) {
  GatedWait wait;
  EXPECT_CALL(supervisor_, healthProbe(_))
      .WillOnce(Return(stopped()))
      .WillOnce(Return(running()));
  EXPECT_CALL(supervisor_, launch(_)).Times(1);

  CancellationToken gone;
  CancellationToken staying;
  NodeReconciler reconciler(registry_, supervisor_, wait, kStart, kStop);
  auto first = reconciler.start("alpha", gone);
  ASSERT_TRUE(wait.awaitWaiter());
  auto second = reconciler.start("alpha", staying);

  gone.cancel();
  std::this_thread::sleep_for(30ms);
  wait.open();

  ASSERT_TRUE(ready(second.result));
  EXPECT_TRUE(second.result.get().converged());
}

TEST_F(NodeReconcilerTest, LaunchFailureRestoresStateAndThrows) {
  ImmediateWait wait;
  EXPECT_CALL(supervisor_, healthProbe(_)).WillOnce(Return(stopped()));
  EXPECT_CALL(supervisor_, launch(_))
      .WillOnce(Throw(SupervisorError("launcher missing")));

  NodeReconciler reconciler(registry_, supervisor_, wait, kStart, kStop);
  EXPECT_THROW(reconciler.start("alpha"), SupervisorError);
  EXPECT_FALSE(reconciler.isReconciling("alpha"));
  EXPECT_EQ(reconciler.stateOf("alpha"), NodeState::Stopped);
}

TEST_F(NodeReconcilerTest, FailingFinalProbeMarksNodeUnreachable) {
  ImmediateWait wait;
  {
    InSequence seq;
    EXPECT_CALL(supervisor_, healthProbe(_)).WillOnce(Return(stopped()));
    EXPECT_CALL(supervisor_, healthProbe(_))
        .Times(3)
        .WillRepeatedly(Throw(SupervisorError("probe failed")));
    EXPECT_CALL(supervisor_, healthProbe(_))
        .WillOnce(Throw(SupervisorError("probe failed")));
  }
  EXPECT_CALL(supervisor_, launch(_)).Times(1);

  NodeReconciler reconciler(registry_, supervisor_, wait, kStart, kStop);
  auto result = reconciler.start("alpha").result.get();

  EXPECT_EQ(result.outcome, ReconcileOutcome::TimedOut);
  EXPECT_EQ(result.finalState, NodeState::Unreachable);
  EXPECT_EQ(reconciler.stateOf("alpha"), NodeState::Unreachable);
}

TEST_F(NodeReconcilerTest, RefreshDuringFlightDoesNotProbe) {
  GatedWait wait;
  EXPECT_CALL(supervisor_, healthProbe(_))
      .Times(2)
      .WillOnce(Return(stopped()))
      .WillOnce(Return(running()));
  EXPECT_CALL(supervisor_, launch(_)).Times(1);

  NodeReconciler reconciler(registry_, supervisor_, wait, kStart, kStop);
  auto ticket = reconciler.start("alpha");
  ASSERT_TRUE(wait.awaitWaiter());

  EXPECT_EQ(reconciler.refresh("alpha").state, NodeState::Starting);

  wait.open();
  ASSERT_TRUE(ready(ticket.result));
}

TEST_F(NodeReconcilerTest, UnknownNodeIsNotFound) {
  ImmediateWait wait;
  NodeReconciler reconciler(registry_, supervisor_, wait, kStart, kStop);

  EXPECT_THROW(reconciler.start("missing"), NodeNotFoundError);
  EXPECT_THROW(reconciler.refresh("missing"), NodeNotFoundError);
  EXPECT_FALSE(reconciler.stateOf("missing").has_value());
}

TEST_F(NodeReconcilerTest, RefreshMapsProbeFailureToUnreachable) {
  ImmediateWait wait;
  EXPECT_CALL(supervisor_, healthProbe(_))
      .WillOnce(Throw(SupervisorError("no answer")));

  NodeReconciler reconciler(registry_, supervisor_, wait, kStart, kStop);
  EXPECT_EQ(reconciler.refresh("alpha").state, NodeState::Unreachable);

  reconciler.forget("alpha");
  EXPECT_FALSE(reconciler.stateOf("alpha").has_value());
}
