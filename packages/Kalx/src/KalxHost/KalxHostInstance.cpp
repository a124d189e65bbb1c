#include "KalxHost/KalxHostInstance.h"

#include <sstream>
#include <stdexcept>
#include <utility>

namespace kalx {

namespace {

std::string attributeText(const PropValue& value) {
  if (const auto* text = std::get_if<std::string>(&value)) {
    return *text;
  }
  if (std::holds_alternative<std::monostate>(value)) {
    return std::string{};
  }
  return propValueToString(value);
}

std::string styleText(const std::map<std::string, std::string>& styles) {
  std::string text;
  for (const auto& [name, value] : styles) {
    if (!text.empty()) {
      text += ";";
    }
    text += name + ":" + value;
  }
  return text;
}

} // namespace

KalxHostInstance::KalxHostInstance(Kind kind, std::string type, std::string textContent)
    : kind_(kind),
      type_(std::move(type)),
      textContent_(std::move(textContent)) {
}

KalxHostInstance::Kind KalxHostInstance::kind() const noexcept {
  return kind_;
}

bool KalxHostInstance::isTextInstance() const noexcept {
  return kind_ == Kind::Text;
}

const std::string& KalxHostInstance::getType() const noexcept {
  return type_;
}

const std::string& KalxHostInstance::getTextContent() const noexcept {
  return textContent_;
}

void KalxHostInstance::setTextContent(std::string text) {
  if (kind_ != Kind::Text) {
    throw std::logic_error("setTextContent on non-text instance " + debugDescription());
  }
  textContent_ = std::move(text);
}

HostRef KalxHostInstance::getRef() const noexcept {
  return ref_;
}

void KalxHostInstance::setRef(HostRef ref) noexcept {
  ref_ = ref;
}

void KalxHostInstance::setProp(const Prop& prop) {
  if (kind_ != Kind::Element) {
    throw std::logic_error("props can only be set on elements, not " + debugDescription());
  }
  if (const auto* attribute = std::get_if<Attribute>(&prop)) {
    if (attribute->name == "style") {
      styles_.clear();
    }
    attributes_[attribute->name] = attribute->value;
  } else if (const auto* binding = std::get_if<EventBinding>(&prop)) {
    listeners_[binding->event] = binding->handler;
  } else {
    attributes_.erase("style");
    styles_.clear();
    for (const auto& [name, value] : std::get<StyleMap>(prop).declarations) {
      styles_[name] = value;
    }
  }
}

void KalxHostInstance::removeProp(const Prop& prop) {
  if (kind_ != Kind::Element) {
    throw std::logic_error("props can only be removed from elements, not " + debugDescription());
  }
  if (const auto* attribute = std::get_if<Attribute>(&prop)) {
    attributes_.erase(attribute->name);
  } else if (const auto* binding = std::get_if<EventBinding>(&prop)) {
    auto it = listeners_.find(binding->event);
    if (it != listeners_.end() && it->second == binding->handler) {
      listeners_.erase(it);
    }
  } else {
    styles_.clear();
  }
}

const PropValue* KalxHostInstance::getAttribute(const std::string& name) const {
  auto it = attributes_.find(name);
  return it == attributes_.end() ? nullptr : &it->second;
}

const std::map<std::string, PropValue>& KalxHostInstance::getAttributes() const noexcept {
  return attributes_;
}

const std::map<std::string, std::string>& KalxHostInstance::getStyles() const noexcept {
  return styles_;
}

EventHandlerPtr KalxHostInstance::getListener(const std::string& event) const {
  auto it = listeners_.find(event);
  return it == listeners_.end() ? nullptr : it->second;
}

std::shared_ptr<KalxHostInstance> KalxHostInstance::getParent() const {
  return parent_.lock();
}

void KalxHostInstance::setParent(const std::shared_ptr<KalxHostInstance>& parent) {
  parent_ = parent;
}

void KalxHostInstance::clearParent() {
  parent_.reset();
}

std::shared_ptr<KalxHostInstance> KalxHostInstance::cloneSubtree() const {
  auto copy = std::make_shared<KalxHostInstance>(kind_, type_, textContent_);
  copy->ref_ = ref_;
  copy->attributes_ = attributes_;
  copy->styles_ = styles_;
  copy->listeners_ = listeners_;
  for (const auto& child : children) {
    auto childCopy = child->cloneSubtree();
    childCopy->setParent(copy);
    copy->children.push_back(std::move(childCopy));
  }
  return copy;
}

std::string KalxHostInstance::serialize() const {
  if (kind_ == Kind::Text) {
    return textContent_;
  }

  std::string inner;
  for (const auto& child : children) {
    inner += child->serialize();
  }
  if (kind_ != Kind::Element) {
    return inner;
  }

  std::ostringstream out;
  out << "<" << type_;
  for (const auto& [name, value] : attributes_) {
    out << " " << name << "=\"" << attributeText(value) << "\"";
  }
  if (!styles_.empty()) {
    out << " style=\"" << styleText(styles_) << "\"";
  }
  out << ">" << inner << "</" << type_ << ">";
  return out.str();
}

std::string KalxHostInstance::debugDescription() const {
  switch (kind_) {
    case Kind::Text:
      return "#text{" + textContent_ + "}";
    case Kind::Fragment:
      return "<>";
    case Kind::Container:
      return "#container";
    case Kind::Element:
      break;
  }
  return "<" + type_ + ">";
}

} // namespace kalx
