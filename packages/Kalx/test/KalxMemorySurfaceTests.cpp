#include "KalxTestSupport.h"

#include "KalxHost/KalxHostInterface.h"
#include "KalxHost/KalxMemorySurface.h"
#include "KalxReconciler/KalxNode.h"
#include "KalxReconciler/KalxTreeDiff.h"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace kalx::test {

namespace {

NodePtr item(const std::string& key) {
  return createElement("li", {attr("data-key", key)}, {createText(key)}, key);
}

NodePtr keyedList(const std::vector<std::string>& keys) {
  NodeList children;
  for (const auto& key : keys) {
    children.push_back(item(key));
  }
  return createElement("ul", {}, std::move(children));
}

void mount(KalxMemorySurface& surface, const NodePtr& tree) {
  commitReconcileResult(surface, reconcile(nullptr, tree));
}

void update(KalxMemorySurface& surface, const NodePtr& previous, const NodePtr& next) {
  commitReconcileResult(surface, reconcile(previous, next));
}

std::size_t countNodes(const NodePtr& node) {
  if (node == nullptr) {
    return 0;
  }
  std::size_t count = 1;
  for (const auto& child : node->children) {
    count += countNodes(child);
  }
  return count;
}

bool everyNodeResolves(const KalxMemorySurface& surface, const NodePtr& node) {
  if (node == nullptr) {
    return true;
  }
  if (surface.find(HostRef::of(node)) == nullptr) {
    return false;
  }
  return std::all_of(node->children.begin(), node->children.end(), [&](const NodePtr& child) {
    return everyNodeResolves(surface, child);
  });
}

// The patched surface must look exactly like one that rendered `tree` from
// scratch, and every node of `tree` must address its instance.
void expectMatchesFreshRender(const KalxMemorySurface& surface, const NodePtr& tree) {
  KalxMemorySurface fresh;
  mount(fresh, tree);
  assert(surface.serialize() == fresh.serialize());
  assert(surface.instanceCount() == countNodes(tree));
  assert(everyNodeResolves(surface, tree));
}

void testMountSerializesTree() {
  KalxMemorySurface surface;
  const NodePtr tree = createElement(
    "div",
    {attr("id", "app"), attr("class", "x"), style({{"margin", "0"}, {"color", "red"}}), attr("hidden", false)},
    {createElement("h1", {}, {createText("Hi")}), createFragment({createText("a"), createText("b")})});

  mount(surface, tree);
  assert(surface.serialize() == "<div class=\"x\" hidden=\"false\" id=\"app\" style=\"color:red;margin:0\"><h1>Hi</h1>ab</div>");
  assert(surface.instanceCount() == 6);

  const KalxHostInstancePtr root = surface.find(HostRef::of(tree));
  assert(root != nullptr);
  assert(root->getParent() == surface.container());
  assert(root->getType() == "div");
  assert(root->getStyles().size() == 2);
  assert(surface.container()->children.size() == 1);

  const KalxHostInstancePtr fragment = surface.find(HostRef::of(tree->children[1]));
  assert(fragment->kind() == KalxHostInstance::Kind::Fragment);
  assert(fragment->children.size() == 2);

  update(surface, tree, nullptr);
  assert(surface.serialize().empty());
  assert(surface.instanceCount() == 0);
}

void testKeyedPermutationsMatchFreshRender() {
  const std::vector<std::string> base{"a", "b", "c", "d"};
  std::vector<std::string> order = base;
  do {
    KalxMemorySurface surface;
    const NodePtr previous = keyedList(base);
    mount(surface, previous);

    const NodePtr next = keyedList(order);
    update(surface, previous, next);
    expectMatchesFreshRender(surface, next);

    // The rebound refs must carry a second pass back to the start.
    const NodePtr again = keyedList(base);
    update(surface, next, again);
    expectMatchesFreshRender(surface, again);
  } while (std::next_permutation(order.begin(), order.end()));
}

void testKeyedInsertRemoveMixesMatchFreshRender() {
  const std::vector<std::vector<std::string>> shapes{
    {},
    {"a"},
    {"e", "a", "b", "c", "d"},
    {"d", "x", "b", "y"},
    {"c", "a"},
    {"z", "y", "x"},
    {"b", "a", "d", "c", "e", "f"},
  };

  for (const auto& from : shapes) {
    for (const auto& to : shapes) {
      KalxMemorySurface surface;
      const NodePtr previous = keyedList(from);
      mount(surface, previous);
      const NodePtr next = keyedList(to);
      update(surface, previous, next);
      expectMatchesFreshRender(surface, next);
    }
  }
}

void testUnkeyedAndFragmentChildrenMatchFreshRender() {
  KalxMemorySurface surface;
  const NodePtr first = createElement(
    "section",
    {},
    {createText("one"),
     createElement("b", {}, {createText("bold")}),
     createFragment({createText("f1"), createText("f2")}, std::string("frag")),
     createText("tail")});
  mount(surface, first);

  const NodePtr second = createElement(
    "section",
    {attr("title", "t")},
    {createElement("i", {}, {createText("italic")}),
     createText("two"),
     createFragment({createText("f2")}, std::string("frag")),
     createText("tail"),
     createText("extra")});
  update(surface, first, second);
  expectMatchesFreshRender(surface, second);

  const NodePtr third = createElement(
    "section",
    {},
    {createFragment({createText("f2"), createElement("hr")}, std::string("frag")), createText("solo")});
  update(surface, second, third);
  expectMatchesFreshRender(surface, third);
}

void testKeyedFragmentsMoveTheirChildren() {
  KalxMemorySurface surface;
  const NodePtr previous = createElement(
    "div",
    {},
    {createFragment({createText("a"), createText("b")}, std::string("f1")),
     createFragment({createText("c")}, std::string("f2"))});
  mount(surface, previous);
  assert(surface.serialize() == "<div>abc</div>");

  const NodePtr next = createElement(
    "div",
    {},
    {createFragment({createText("c")}, std::string("f2")),
     createFragment({createText("a"), createText("b")}, std::string("f1"))});
  update(surface, previous, next);
  assert(surface.serialize() == "<div>cab</div>");
  expectMatchesFreshRender(surface, next);
}

void testPropUpdatesReachInstances() {
  KalxMemorySurface surface;
  const NodePtr first =
    createElement("p", {attr("id", "a"), attr("title", "t"), style({{"color", "red"}})}, {createText("x")});
  mount(surface, first);

  const NodePtr second = createElement("p", {attr("id", "b"), attr("style", "color:blue")}, {createText("x")});
  update(surface, first, second);
  assert(surface.serialize() == "<p id=\"b\" style=\"color:blue\">x</p>");
  const KalxHostInstancePtr paragraph = surface.find(HostRef::of(second));
  assert(paragraph->getStyles().empty());
  assert(paragraph->getAttribute("title") == nullptr);

  const NodePtr third = createElement("p", {attr("id", "b"), style({{"color", "green"}})}, {createText("x")});
  update(surface, second, third);
  assert(surface.serialize() == "<p id=\"b\" style=\"color:green\">x</p>");
  assert(paragraph->getAttribute("style") == nullptr);
  expectMatchesFreshRender(surface, third);
}

void testEventHandlersFollowRebinding() {
  KalxMemorySurface surface;
  int firstClicks = 0;
  int secondClicks = 0;

  const NodePtr first = createElement("button", {on("click", [&] { ++firstClicks; })}, {createText("go")});
  mount(surface, first);
  assert(surface.dispatchEvent(HostRef::of(first), "click"));
  assert(!surface.dispatchEvent(HostRef::of(first), "hover"));
  assert(firstClicks == 1);

  const NodePtr second = createElement("button", {on("click", [&] { ++secondClicks; })}, {createText("go")});
  update(surface, first, second);
  assert(surface.dispatchEvent(HostRef::of(second), "click"));
  assert(firstClicks == 1);
  assert(secondClicks == 1);
  assert(throwsException<std::invalid_argument>([&] { surface.dispatchEvent(HostRef::of(first), "click"); }));

  const NodePtr third = createElement("button", {}, {createText("go")});
  update(surface, second, third);
  assert(!surface.dispatchEvent(HostRef::of(third), "click"));
}

void testRediffAfterRotationIsEmpty() {
  KalxMemorySurface surface;
  const NodePtr original = keyedList({"a", "b", "c"});
  mount(surface, original);
  const NodePtr rotated = keyedList({"b", "c", "a"});
  update(surface, original, rotated);

  const NodePtr rebuilt = keyedList({"b", "c", "a"});
  const ReconcileResult again = reconcile(rotated, rebuilt);
  assert(again.operations.empty());
  commitReconcileResult(surface, again);
  expectMatchesFreshRender(surface, rebuilt);
}

void testSharedSubtreesMoveBetweenSlots() {
  KalxMemorySurface surface;
  const NodePtr shared = createElement("p", {}, {createText("same")});
  const NodePtr first = createElement("div", {}, {shared});
  mount(surface, first);

  const NodePtr second = createElement("div", {}, {createElement("p", {}, {createText("new")}), shared});
  update(surface, first, second);
  assert(surface.serialize() == "<div><p>new</p><p>same</p></div>");
  expectMatchesFreshRender(surface, second);

  const NodePtr moving = createText("moving");
  const NodePtr third =
    createElement("div", {}, {createElement("section"), createElement("aside", {}, {moving}), shared});
  update(surface, second, third);
  expectMatchesFreshRender(surface, third);

  const NodePtr fourth =
    createElement("div", {}, {createElement("section", {}, {moving}), createElement("aside"), shared});
  update(surface, third, fourth);
  assert(surface.serialize() == "<div><section>moving</section><aside></aside><p>same</p></div>");
  expectMatchesFreshRender(surface, fourth);
}

void testFailedCommitRestoresTree() {
  KalxMemorySurface surface;
  const NodePtr first = createElement("div", {attr("id", "a")}, {createText("a"), createElement("span")});
  mount(surface, first);
  const std::string before = surface.serialize();
  const NodePtr stranger = createElement("em");

  ReconcileResult broken;
  broken.operations.emplace_back(UpdateText{HostRef::of(first->children[0]), "changed"});
  broken.operations.emplace_back(CreateNode{createText("extra"), HostRef::of(first), HostRef{}});
  broken.operations.emplace_back(RemoveNode{HostRef::of(stranger)});
  assert(throwsException<std::invalid_argument>([&] { commitReconcileResult(surface, broken); }));
  assert(surface.serialize() == before);
  expectMatchesFreshRender(surface, first);
  assert(surface.find(HostRef::of(first))->getParent() == surface.container());

  ReconcileResult badRebind;
  badRebind.operations.emplace_back(UpdateText{HostRef::of(first->children[0]), "changed"});
  badRebind.retained.push_back(RetainedNode{HostRef::of(stranger), HostRef::of(first)});
  assert(throwsException<std::invalid_argument>([&] { commitReconcileResult(surface, badRebind); }));
  assert(surface.serialize() == before);

  const NodePtr second = createElement("div", {attr("id", "b")}, {createText("b"), createElement("span")});
  update(surface, first, second);
  assert(surface.serialize() == "<div id=\"b\">b<span></span></div>");
  expectMatchesFreshRender(surface, second);
}

void testRejectsInvalidOperations() {
  KalxMemorySurface surface;
  const NodePtr tree = createElement("div", {}, {createText("t"), createElement("span")});
  mount(surface, tree);
  const std::string before = surface.serialize();
  const HostRef div = HostRef::of(tree);
  const HostRef text = HostRef::of(tree->children[0]);
  const HostRef span = HostRef::of(tree->children[1]);
  const NodePtr stranger = createElement("em");

  assert(throwsException<std::invalid_argument>([&] { surface.removeNode(HostRef{}); }));
  assert(throwsException<std::invalid_argument>([&] { surface.removeNode(HostRef::of(stranger)); }));
  assert(throwsException<std::invalid_argument>([&] { surface.createNode(nullptr, div, HostRef{}); }));
  assert(throwsException<std::logic_error>([&] { surface.createNode(stranger, text, HostRef{}); }));
  assert(throwsException<std::invalid_argument>([&] { surface.createNode(stranger, span, text); }));
  assert(throwsException<std::invalid_argument>([&] { surface.createNode(tree, HostRef{}, HostRef{}); }));
  assert(throwsException<std::logic_error>([&] { surface.updateText(div, "nope"); }));
  assert(throwsException<std::logic_error>([&] { surface.updateProps(text, {}, {attr("id", "x")}); }));
  assert(throwsException<std::invalid_argument>([&] { surface.moveNode(span, span); }));
  assert(throwsException<std::invalid_argument>([&] { surface.moveNode(text, div); }));
  assert(throwsException<std::invalid_argument>([&] { surface.retainNodes({RetainedNode{HostRef::of(stranger), div}}); }));

  assert(surface.serialize() == before);
  assert(surface.instanceCount() == 3);

  surface.moveNode(text, HostRef{});
  assert(surface.serialize() == "<div><span></span>t</div>");
}

void testRetainedRefsSwapTogether() {
  KalxMemorySurface surface;
  const NodePtr left = createText("left");
  const NodePtr right = createText("right");
  surface.createNode(left, HostRef{}, HostRef{});
  surface.createNode(right, HostRef{}, HostRef{});

  surface.retainNodes({RetainedNode{HostRef::of(left), HostRef::of(right)}, RetainedNode{HostRef::of(right), HostRef::of(left)}});
  assert(surface.find(HostRef::of(right))->getTextContent() == "left");
  assert(surface.find(HostRef::of(left))->getTextContent() == "right");
  assert(surface.instanceCount() == 2);
}

} // namespace

bool runKalxMemorySurfaceTests() {
  testMountSerializesTree();
  testKeyedPermutationsMatchFreshRender();
  testKeyedInsertRemoveMixesMatchFreshRender();
  testUnkeyedAndFragmentChildrenMatchFreshRender();
  testKeyedFragmentsMoveTheirChildren();
  testPropUpdatesReachInstances();
  testEventHandlersFollowRebinding();
  testRediffAfterRotationIsEmpty();
  testSharedSubtreesMoveBetweenSlots();
  testFailedCommitRestoresTree();
  testRejectsInvalidOperations();
  testRetainedRefsSwapTogether();
  return true;
}

} // namespace kalx::test
