#include "KalxReconciler/KalxMutation.h"

#include <sstream>

namespace kalx {

namespace {

std::string describePropList(const PropList& props) {
  std::string text = "[";
  for (std::size_t index = 0; index < props.size(); ++index) {
    if (index > 0) {
      text += ", ";
    }
    text += describeProp(props[index]);
  }
  return text + "]";
}

} // namespace

std::string describeHostRef(HostRef ref) {
  if (!ref) {
    return "#null";
  }
  std::ostringstream stream;
  stream << "#" << std::hex << ref.value();
  return stream.str();
}

std::string describeMutation(const MutationOperation& operation) {
  if (const auto* create = std::get_if<CreateNode>(&operation)) {
    return "Create " + (create->node ? describeNode(*create->node) : std::string("<null>")) + " in " +
      describeHostRef(create->parent) + " before " + describeHostRef(create->before);
  }
  if (const auto* remove = std::get_if<RemoveNode>(&operation)) {
    return "Remove " + describeHostRef(remove->ref);
  }
  if (const auto* update = std::get_if<UpdateProps>(&operation)) {
    return "UpdateProps " + describeHostRef(update->ref) + " removed=" + describePropList(update->removed) +
      " changed=" + describePropList(update->changed);
  }
  if (const auto* text = std::get_if<UpdateText>(&operation)) {
    return "UpdateText " + describeHostRef(text->ref) + " \"" + text->text + "\"";
  }
  const auto& move = std::get<MoveNode>(operation);
  return "Move " + describeHostRef(move.ref) + " before " + describeHostRef(move.before);
}

} // namespace kalx
