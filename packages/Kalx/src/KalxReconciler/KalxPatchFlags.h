#pragma once

#include <cstdint>

namespace kalx {

// Compiler hints attached to a node. Positive values are bit sets; the two
// negative values are sentinels and never combined with anything.
enum class PatchFlag : std::int32_t {
  None = 0,
  Text = 1 << 0,
  Class = 1 << 1,
  Style = 1 << 2,
  Props = 1 << 3,
  FullProps = 1 << 4,
  Events = 1 << 5,
  StableChildren = 1 << 6,
  KeyedChildren = 1 << 7,
  UnkeyedChildren = 1 << 8,
  Hoisted = -1,
  Bail = -2,
};

inline PatchFlag operator|(PatchFlag a, PatchFlag b) {
  return static_cast<PatchFlag>(static_cast<std::int32_t>(a) | static_cast<std::int32_t>(b));
}

inline PatchFlag operator&(PatchFlag a, PatchFlag b) {
  return static_cast<PatchFlag>(static_cast<std::int32_t>(a) & static_cast<std::int32_t>(b));
}

class PatchDescriptor {
public:
  constexpr PatchDescriptor() noexcept = default;
  constexpr PatchDescriptor(PatchFlag flags) noexcept : bits_(static_cast<std::int32_t>(flags)) {}

  static constexpr PatchDescriptor fromBits(std::int32_t bits) noexcept {
    PatchDescriptor descriptor;
    descriptor.bits_ = bits;
    return descriptor;
  }

  static constexpr PatchDescriptor hoisted() noexcept {
    return PatchDescriptor(PatchFlag::Hoisted);
  }

  static constexpr PatchDescriptor bail() noexcept {
    return PatchDescriptor(PatchFlag::Bail);
  }

  [[nodiscard]] constexpr std::int32_t bits() const noexcept {
    return bits_;
  }

  [[nodiscard]] constexpr bool isHoisted() const noexcept {
    return bits_ == static_cast<std::int32_t>(PatchFlag::Hoisted);
  }

  [[nodiscard]] constexpr bool isBail() const noexcept {
    return bits_ == static_cast<std::int32_t>(PatchFlag::Bail);
  }

  // True when the descriptor lists exactly which prop categories can change.
  [[nodiscard]] constexpr bool isOptimized() const noexcept {
    return bits_ > 0 && !has(PatchFlag::FullProps);
  }

  [[nodiscard]] constexpr bool has(PatchFlag flag) const noexcept {
    return bits_ > 0 && (bits_ & static_cast<std::int32_t>(flag)) != 0;
  }

  [[nodiscard]] constexpr bool hasDynamicText() const noexcept {
    return has(PatchFlag::Text);
  }

  [[nodiscard]] constexpr bool hasDynamicClass() const noexcept {
    return has(PatchFlag::Class);
  }

  [[nodiscard]] constexpr bool hasDynamicStyle() const noexcept {
    return has(PatchFlag::Style);
  }

  [[nodiscard]] constexpr bool hasDynamicProps() const noexcept {
    return has(PatchFlag::Props);
  }

  [[nodiscard]] constexpr bool needsFullProps() const noexcept {
    return has(PatchFlag::FullProps);
  }

  [[nodiscard]] constexpr bool hasEvents() const noexcept {
    return has(PatchFlag::Events);
  }

  [[nodiscard]] constexpr bool hasStableChildren() const noexcept {
    return has(PatchFlag::StableChildren);
  }

  [[nodiscard]] constexpr bool hasKeyedChildren() const noexcept {
    return has(PatchFlag::KeyedChildren);
  }

  [[nodiscard]] constexpr bool hasUnkeyedChildren() const noexcept {
    return has(PatchFlag::UnkeyedChildren);
  }

  friend constexpr bool operator==(PatchDescriptor a, PatchDescriptor b) noexcept {
    return a.bits_ == b.bits_;
  }

  friend constexpr bool operator!=(PatchDescriptor a, PatchDescriptor b) noexcept {
    return a.bits_ != b.bits_;
  }

private:
  std::int32_t bits_{0};
};

} // namespace kalx
