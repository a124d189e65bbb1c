#include "KalxTestSupport.h"

#include "KalxHost/KalxHostInterface.h"
#include "KalxHost/KalxMemorySurface.h"
#include "KalxReconciler/KalxNode.h"
#include "KalxRuntime/KalxRenderRoot.h"
#include "KalxScheduler/KalxScheduler.h"
#include "KalxScheduler/ManualHostEventLoop.h"
#include "KalxTransition/KalxDeferredValue.h"
#include "shared/KalxErrors.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace kalx::test {

namespace {

NodePtr label(const std::string& text) {
  return createElement("span", {}, {createText(text)});
}

RenderFunction renderLabel(const std::string& text, int* calls = nullptr) {
  return [text, calls] {
    if (calls != nullptr) {
      ++*calls;
    }
    return label(text);
  };
}

// Accepts nothing; every mutation fails.
class RejectingSurface final : public HostSurface {
public:
  void createNode(const NodePtr&, HostRef, HostRef) override {
    throw std::runtime_error("surface is read-only");
  }
  void removeNode(HostRef) override {
    throw std::runtime_error("surface is read-only");
  }
  void updateProps(HostRef, const PropList&, const PropList&) override {
    throw std::runtime_error("surface is read-only");
  }
  void updateText(HostRef, const std::string&) override {
    throw std::runtime_error("surface is read-only");
  }
  void moveNode(HostRef, HostRef) override {
    throw std::runtime_error("surface is read-only");
  }
  void retainNodes(const std::vector<RetainedNode>&) override {}
};

void testScheduledRenderCommits() {
  ManualHostEventLoop loop;
  KalxScheduler scheduler(loop);
  KalxMemorySurface surface;
  KalxRenderRoot root(scheduler, surface);

  const TaskHandle handle = root.scheduleRender(renderLabel("hello"));
  assert(handle);
  assert(root.hasPendingRender());
  assert(root.current() == nullptr);
  assert(loop.pendingAnimationFrames() == 1);

  loop.runUntilIdle();
  assert(!root.hasPendingRender());
  assert(root.commitCount() == 1);
  assert(surface.serialize() == "<span>hello</span>");

  root.scheduleRender(renderLabel("world"), UserBlockingPriority);
  assert(loop.pendingMicrotasks() == 1);
  loop.runMicrotasks();
  assert(surface.serialize() == "<span>world</span>");
  assert(root.commitCount() == 2);

  root.scheduleRender([] { return NodePtr{}; });
  loop.runUntilIdle();
  assert(surface.serialize().empty());
  assert(root.current() == nullptr);
}

void testNewestRequestReplacesPending() {
  ManualHostEventLoop loop;
  KalxScheduler scheduler(loop);
  KalxMemorySurface surface;
  KalxRenderRoot root(scheduler, surface);
  int staleCalls = 0;
  int freshCalls = 0;

  root.scheduleRender(renderLabel("stale", &staleCalls));
  root.scheduleRender(renderLabel("fresh", &freshCalls));
  assert(scheduler.pendingTaskCount() == 1);

  loop.runUntilIdle();
  assert(staleCalls == 0);
  assert(freshCalls == 1);
  assert(root.commitCount() == 1);
  assert(surface.serialize() == "<span>fresh</span>");

  root.scheduleRender(renderLabel("cancelled", &staleCalls));
  root.cancelPendingRender();
  assert(!root.hasPendingRender());
  loop.runAll();
  assert(staleCalls == 0);
}

void testRenderSyncCancelsPendingPass() {
  ManualHostEventLoop loop;
  KalxScheduler scheduler(loop);
  KalxMemorySurface surface;
  KalxRenderRoot root(scheduler, surface);
  int calls = 0;

  root.scheduleRender(renderLabel("scheduled", &calls));
  root.renderSync(label("sync"));
  assert(!root.hasPendingRender());
  assert(surface.serialize() == "<span>sync</span>");

  loop.runAll();
  assert(calls == 0);
  assert(root.commitCount() == 1);

  const NodePtr previous = root.current();
  root.renderSync(label("again"));
  assert(surface.serialize() == "<span>again</span>");
  assert(surface.find(HostRef::of(root.current())) != nullptr);
  assert(surface.find(HostRef::of(previous)) == nullptr);
}

void testCommitWaitsForNextSliceAfterYield() {
  ManualHostEventLoop loop;
  KalxScheduler scheduler(loop);
  KalxMemorySurface surface;
  KalxRenderRoot root(scheduler, surface);

  root.scheduleRender([&] {
    loop.advanceTime(10.0);
    return label("slow");
  });

  loop.runAnimationFrame();
  assert(root.commitCount() == 0);
  assert(root.hasPendingRender());
  assert(surface.serialize().empty());

  loop.runAnimationFrame();
  assert(root.commitCount() == 1);
  assert(!root.hasPendingRender());
  assert(surface.serialize() == "<span>slow</span>");
}

void testNewerRequestDropsYieldedCommit() {
  ManualHostEventLoop loop;
  KalxScheduler scheduler(loop);
  KalxMemorySurface surface;
  KalxRenderRoot root(scheduler, surface);

  root.scheduleRender([&] {
    loop.advanceTime(10.0);
    return label("outdated");
  });
  loop.runAnimationFrame();
  assert(root.hasPendingRender());

  root.scheduleRender(renderLabel("current"));
  loop.runUntilIdle();
  assert(root.commitCount() == 1);
  assert(surface.serialize() == "<span>current</span>");
}

void testExpiredRenderCommitsWithoutYielding() {
  ManualHostEventLoop loop;
  KalxScheduler scheduler(loop);
  KalxMemorySurface surface;
  KalxRenderRoot root(scheduler, surface);

  TaskOptions options;
  options.timeoutMs = 0.0;
  root.scheduleRender(
    [&] {
      loop.advanceTime(10.0);
      return label("urgent");
    },
    NormalPriority,
    options);

  loop.runAnimationFrame();
  assert(root.commitCount() == 1);
  assert(surface.serialize() == "<span>urgent</span>");
}

void testRenderErrorsAreReported() {
  ManualHostEventLoop loop;
  KalxScheduler scheduler(loop);
  KalxMemorySurface surface;
  KalxRenderRoot root(scheduler, surface);
  root.renderSync(label("stable"));

  CapturedGlobalErrors errors;

  root.scheduleRender([]() -> NodePtr { throw std::runtime_error("render failed"); });
  assert(throwsException<SchedulingError>([&] { loop.runUntilIdle(); }));
  assert(errors.messages.size() == 1);
  assert(errors.messages[0] == "render failed");
  assert(!root.hasPendingRender());

  root.scheduleRender([] {
    return createElement("ul", {}, {createElement("li", {}, {}, std::string("k")), createElement("li", {}, {}, std::string("k"))});
  });
  assert(throwsException<SchedulingError>([&] { loop.runUntilIdle(); }));
  assert(errors.messages.size() == 2);
  assert(errors.messages[1].find("duplicate sibling key 'k'") != std::string::npos);

  assert(throwsException<ReconciliationError>([&] { root.renderSync(createElement("")); }));
  assert(errors.messages.size() == 3);

  assert(root.commitCount() == 1);
  assert(surface.serialize() == "<span>stable</span>");
  assert(scheduler.pendingTaskCount() == 0);
}

void testCommitErrorsLeaveCurrentTreeInPlace() {
  ManualHostEventLoop loop;
  KalxScheduler scheduler(loop);
  RejectingSurface surface;
  KalxRenderRoot root(scheduler, surface);
  CapturedGlobalErrors errors;

  assert(throwsException<std::runtime_error>([&] { root.renderSync(label("x")); }));
  assert(root.current() == nullptr);
  assert(root.commitCount() == 0);
  assert((errors.messages == std::vector<std::string>{"surface is read-only"}));
}

void testFailedCommitLeavesSurfaceUntouched() {
  ManualHostEventLoop loop;
  KalxScheduler scheduler(loop);
  KalxMemorySurface surface;
  KalxRenderRoot root(scheduler, surface);

  const NodePtr first = createElement("div", {}, {createText("a"), createElement("span")});
  root.renderSync(first);
  // Changed behind the root's back, so the next pass names a ref that is gone.
  surface.removeNode(HostRef::of(first->children[1]));
  const std::string before = surface.serialize();

  CapturedGlobalErrors errors;
  const NodePtr second = createElement("div", {}, {createText("b"), createElement("span", {attr("id", "s")})});
  assert(throwsException<std::invalid_argument>([&] { root.renderSync(second); }));
  assert(surface.serialize() == before);
  assert(root.current() == first);
  assert(root.commitCount() == 1);
  assert(errors.messages.size() == 1);
}

void testSharedSubtreeChangesSlot() {
  ManualHostEventLoop loop;
  KalxScheduler scheduler(loop);
  KalxMemorySurface surface;
  KalxRenderRoot root(scheduler, surface);
  const NodePtr shared = createElement("p", {}, {createText("same")});

  root.renderSync(createElement("div", {}, {shared}));
  root.scheduleRender([shared] {
    return createElement("div", {}, {createElement("p", {}, {createText("new")}), shared});
  });
  loop.runUntilIdle();

  assert(root.commitCount() == 2);
  assert(surface.serialize() == "<div><p>new</p><p>same</p></div>");
  assert(surface.find(HostRef::of(root.current())) != nullptr);
  assert(surface.find(HostRef::of(shared)) != nullptr);
  assert(surface.instanceCount() == 5);
}

void testBatchedUpdatesFormOnePass() {
  ManualHostEventLoop loop;
  KalxScheduler scheduler(loop);
  KalxMemorySurface surface;
  KalxRenderRoot root(scheduler, surface);
  int firstCalls = 0;
  int lastCalls = 0;

  assert(!root.batchUpdates([] {}));

  const TaskHandle handle = root.batchUpdates([&] {
    assert(!root.scheduleRender(renderLabel("first", &firstCalls), LowPriority));
    assert(!root.scheduleRender(renderLabel("middle", &firstCalls), UserBlockingPriority));
    const TaskHandle nested = root.batchUpdates([&] {
      root.scheduleRender(renderLabel("last", &lastCalls), LowPriority);
    });
    assert(!nested);
  });

  assert(handle);
  assert(scheduler.pendingTaskCount() == 1);
  assert(loop.pendingMicrotasks() == 1);

  loop.runMicrotasks();
  assert(firstCalls == 0);
  assert(lastCalls == 1);
  assert(root.commitCount() == 1);
  assert(surface.serialize() == "<span>last</span>");

  assert(throwsException<std::runtime_error>([&] {
    root.batchUpdates([&] {
      root.scheduleRender(renderLabel("dropped", &firstCalls));
      throw std::runtime_error("batch failed");
    });
  }));
  assert(!root.hasPendingRender());
  loop.runAll();
  assert(firstCalls == 0);

  // Nothing from the failed batch leaks into the next one.
  assert(!root.batchUpdates([] {}));
}

void testDestroyedRootCancelsItsPass() {
  ManualHostEventLoop loop;
  KalxScheduler scheduler(loop);
  KalxMemorySurface surface;
  int calls = 0;
  {
    KalxRenderRoot root(scheduler, surface);
    root.scheduleRender(renderLabel("gone", &calls));
  }
  assert(scheduler.pendingTaskCount() == 0);
  loop.runAll();
  assert(calls == 0);
}

void testEventDrivenCounter() {
  ManualHostEventLoop loop;
  KalxScheduler scheduler(loop);
  KalxMemorySurface surface;
  KalxRenderRoot root(scheduler, surface);
  int count = 0;

  RenderFunction render;
  const EventHandlerPtr increment = makeEventHandler([&] {
    ++count;
    root.scheduleRender(render, UserBlockingPriority);
  });
  render = [&] {
    return createElement("button", {on("click", increment)}, {createText(std::to_string(count))});
  };

  root.scheduleRender(render);
  loop.runUntilIdle();
  assert(surface.serialize() == "<button>0</button>");

  assert(surface.dispatchEvent(HostRef::of(root.current()), "click"));
  assert(surface.dispatchEvent(HostRef::of(root.current()), "click"));
  loop.runUntilIdle();
  assert(surface.serialize() == "<button>2</button>");
  assert(root.commitCount() == 2);
}

void testDeferredValueDrivesRender() {
  ManualHostEventLoop loop;
  KalxScheduler scheduler(loop);
  KalxMemorySurface surface;
  KalxRenderRoot root(scheduler, surface);

  auto query = useDeferredValue<std::string>(scheduler, "", DeferredValueOptions{50.0});
  auto render = [&] { return label("results for '" + query->get() + "'"); };
  query->subscribe([&](const std::string&) { root.scheduleRender(render); });
  root.renderSync(render());

  query->set("k");
  query->set("ka");
  query->set("kal");
  loop.runUntilIdle();
  assert(surface.serialize() == "<span>results for ''</span>");

  loop.runAll();
  assert(surface.serialize() == "<span>results for 'kal'</span>");
  assert(root.commitCount() == 2);
}

void testRejectsMissingCallbacks() {
  ManualHostEventLoop loop;
  KalxScheduler scheduler(loop);
  KalxMemorySurface surface;
  KalxRenderRoot root(scheduler, surface);

  assert(throwsException<std::invalid_argument>([&] { root.scheduleRender(nullptr); }));
  assert(throwsException<std::invalid_argument>([&] { root.batchUpdates(nullptr); }));
}

} // namespace

bool runKalxRenderRootTests() {
  testScheduledRenderCommits();
  testNewestRequestReplacesPending();
  testRenderSyncCancelsPendingPass();
  testCommitWaitsForNextSliceAfterYield();
  testNewerRequestDropsYieldedCommit();
  testExpiredRenderCommitsWithoutYielding();
  testRenderErrorsAreReported();
  testCommitErrorsLeaveCurrentTreeInPlace();
  testFailedCommitLeavesSurfaceUntouched();
  testSharedSubtreeChangesSlot();
  testBatchedUpdatesFormOnePass();
  testDestroyedRootCancelsItsPass();
  testEventDrivenCounter();
  testDeferredValueDrivesRender();
  testRejectsMissingCallbacks();
  return true;
}

} // namespace kalx::test
