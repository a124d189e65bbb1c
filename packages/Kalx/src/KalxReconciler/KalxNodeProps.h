#pragma once

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace kalx {

using PropValue = std::variant<std::monostate, bool, double, std::string>;

struct Attribute {
  std::string name;
  PropValue value;
};

using EventHandler = std::function<void()>;
using EventHandlerPtr = std::shared_ptr<const EventHandler>;

// Handlers compare by identity: a freshly made handler is a new binding even
// if it does the same thing.
struct EventBinding {
  std::string event;
  EventHandlerPtr handler;
};

// Inline style declarations. Compared without regard to order.
struct StyleMap {
  std::vector<std::pair<std::string, std::string>> declarations;
};

using Prop = std::variant<Attribute, EventBinding, StyleMap>;
using PropList = std::vector<Prop>;

enum class PropCategory : std::uint8_t {
  Class,
  Style,
  Props,
  Events,
};

Attribute attr(std::string name, std::string value);
Attribute attr(std::string name, const char* value);
Attribute attr(std::string name, double value);
Attribute attr(std::string name, int value);
Attribute attr(std::string name, bool value);

EventHandlerPtr makeEventHandler(EventHandler handler);
EventBinding on(std::string event, EventHandler handler);
EventBinding on(std::string event, EventHandlerPtr handler);

StyleMap style(std::initializer_list<std::pair<std::string, std::string>> declarations);

// The slot a prop occupies on its node; at most one prop per slot.
[[nodiscard]] std::string propKey(const Prop& prop);
[[nodiscard]] PropCategory propCategory(const Prop& prop);

[[nodiscard]] std::string propValueToString(const PropValue& value);
[[nodiscard]] std::string describeProp(const Prop& prop);

bool operator==(const Attribute& a, const Attribute& b);
bool operator!=(const Attribute& a, const Attribute& b);
bool operator==(const EventBinding& a, const EventBinding& b);
bool operator!=(const EventBinding& a, const EventBinding& b);
bool operator==(const StyleMap& a, const StyleMap& b);
bool operator!=(const StyleMap& a, const StyleMap& b);

} // namespace kalx
