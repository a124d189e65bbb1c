#pragma once

#include "KalxReconciler/KalxMutation.h"
#include "KalxReconciler/KalxNode.h"
#include "KalxReconciler/KalxNodeProps.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace kalx {

/**
 * A retained host-side object built from a Node. Elements hold attributes,
 * inline styles and listeners; text instances hold their text; fragments
 * and the root container only group children.
 */
class KalxHostInstance final : public std::enable_shared_from_this<KalxHostInstance> {
public:
  enum class Kind {
    Container,
    Element,
    Text,
    Fragment,
  };

  KalxHostInstance(Kind kind, std::string type, std::string textContent = {});

  [[nodiscard]] Kind kind() const noexcept;
  [[nodiscard]] bool isTextInstance() const noexcept;
  [[nodiscard]] const std::string& getType() const noexcept;
  [[nodiscard]] const std::string& getTextContent() const noexcept;
  void setTextContent(std::string text);

  [[nodiscard]] HostRef getRef() const noexcept;
  void setRef(HostRef ref) noexcept;

  void setProp(const Prop& prop);
  void removeProp(const Prop& prop);

  [[nodiscard]] const PropValue* getAttribute(const std::string& name) const;
  [[nodiscard]] const std::map<std::string, PropValue>& getAttributes() const noexcept;
  [[nodiscard]] const std::map<std::string, std::string>& getStyles() const noexcept;
  [[nodiscard]] EventHandlerPtr getListener(const std::string& event) const;

  [[nodiscard]] std::shared_ptr<KalxHostInstance> getParent() const;
  void setParent(const std::shared_ptr<KalxHostInstance>& parent);
  void clearParent();

  // Deep copy with the same refs and listeners. The copy has no parent.
  [[nodiscard]] std::shared_ptr<KalxHostInstance> cloneSubtree() const;

  [[nodiscard]] std::string serialize() const;
  [[nodiscard]] std::string debugDescription() const;

  std::vector<std::shared_ptr<KalxHostInstance>> children;

private:
  Kind kind_;
  std::string type_;
  std::string textContent_{};
  HostRef ref_{};
  std::map<std::string, PropValue> attributes_;
  std::map<std::string, std::string> styles_;
  std::map<std::string, EventHandlerPtr> listeners_;
  std::weak_ptr<KalxHostInstance> parent_;
};

using KalxHostInstancePtr = std::shared_ptr<KalxHostInstance>;

} // namespace kalx
