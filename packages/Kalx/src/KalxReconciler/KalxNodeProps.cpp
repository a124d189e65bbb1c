#include "KalxReconciler/KalxNodeProps.h"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace kalx {

namespace {

constexpr const char* kEventSlotPrefix = "on:";
constexpr const char* kStyleSlot = "style";

bool isClassName(const std::string& name) {
  return name == "class" || name == "className";
}

std::vector<std::pair<std::string, std::string>> sortedDeclarations(const StyleMap& style) {
  auto declarations = style.declarations;
  std::sort(declarations.begin(), declarations.end());
  return declarations;
}

} // namespace

Attribute attr(std::string name, std::string value) {
  return Attribute{std::move(name), PropValue{std::move(value)}};
}

Attribute attr(std::string name, const char* value) {
  return attr(std::move(name), std::string(value != nullptr ? value : ""));
}

Attribute attr(std::string name, double value) {
  return Attribute{std::move(name), PropValue{value}};
}

Attribute attr(std::string name, int value) {
  return attr(std::move(name), static_cast<double>(value));
}

Attribute attr(std::string name, bool value) {
  return Attribute{std::move(name), PropValue{value}};
}

EventHandlerPtr makeEventHandler(EventHandler handler) {
  if (!handler) {
    throw std::invalid_argument("event handler must be callable");
  }
  return std::make_shared<const EventHandler>(std::move(handler));
}

EventBinding on(std::string event, EventHandler handler) {
  return on(std::move(event), makeEventHandler(std::move(handler)));
}

EventBinding on(std::string event, EventHandlerPtr handler) {
  if (handler == nullptr) {
    throw std::invalid_argument("event binding requires a handler");
  }
  return EventBinding{std::move(event), std::move(handler)};
}

StyleMap style(std::initializer_list<std::pair<std::string, std::string>> declarations) {
  return StyleMap{std::vector<std::pair<std::string, std::string>>(declarations)};
}

std::string propKey(const Prop& prop) {
  if (const auto* attribute = std::get_if<Attribute>(&prop)) {
    return attribute->name;
  }
  if (const auto* binding = std::get_if<EventBinding>(&prop)) {
    return kEventSlotPrefix + binding->event;
  }
  return kStyleSlot;
}

PropCategory propCategory(const Prop& prop) {
  if (const auto* attribute = std::get_if<Attribute>(&prop)) {
    if (isClassName(attribute->name)) {
      return PropCategory::Class;
    }
    if (attribute->name == kStyleSlot) {
      return PropCategory::Style;
    }
    return PropCategory::Props;
  }
  if (std::holds_alternative<EventBinding>(prop)) {
    return PropCategory::Events;
  }
  return PropCategory::Style;
}

std::string propValueToString(const PropValue& value) {
  if (std::holds_alternative<std::monostate>(value)) {
    return "null";
  }
  if (const auto* flag = std::get_if<bool>(&value)) {
    return *flag ? "true" : "false";
  }
  if (const auto* number = std::get_if<double>(&value)) {
    std::ostringstream stream;
    stream << *number;
    return stream.str();
  }
  return "\"" + std::get<std::string>(value) + "\"";
}

std::string describeProp(const Prop& prop) {
  if (const auto* attribute = std::get_if<Attribute>(&prop)) {
    return attribute->name + "=" + propValueToString(attribute->value);
  }
  if (const auto* binding = std::get_if<EventBinding>(&prop)) {
    return "@" + binding->event;
  }
  std::string text = "style={";
  const auto declarations = sortedDeclarations(std::get<StyleMap>(prop));
  for (std::size_t index = 0; index < declarations.size(); ++index) {
    if (index > 0) {
      text += ";";
    }
    text += declarations[index].first + ":" + declarations[index].second;
  }
  return text + "}";
}

bool operator==(const Attribute& a, const Attribute& b) {
  return a.name == b.name && a.value == b.value;
}

bool operator!=(const Attribute& a, const Attribute& b) {
  return !(a == b);
}

bool operator==(const EventBinding& a, const EventBinding& b) {
  return a.event == b.event && a.handler == b.handler;
}

bool operator!=(const EventBinding& a, const EventBinding& b) {
  return !(a == b);
}

bool operator==(const StyleMap& a, const StyleMap& b) {
  if (a.declarations.size() != b.declarations.size()) {
    return false;
  }
  return sortedDeclarations(a) == sortedDeclarations(b);
}

bool operator!=(const StyleMap& a, const StyleMap& b) {
  return !(a == b);
}

} // namespace kalx
