#pragma once

// The suites assert on behaviour, so keep assert() live in every build type.
#ifdef NDEBUG
#undef NDEBUG
#endif
#include <cassert>

#include "KalxReconciler/KalxMutation.h"
#include "shared/KalxGlobalError.h"

#include <cstddef>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace kalx::test {

template <typename Exception, typename Fn>
bool throwsException(Fn&& fn) {
  try {
    std::forward<Fn>(fn)();
  } catch (const Exception&) {
    return true;
  }
  return false;
}

template <typename Operation>
std::size_t countOperations(const MutationList& operations) {
  std::size_t count = 0;
  for (const auto& operation : operations) {
    if (std::holds_alternative<Operation>(operation)) {
      ++count;
    }
  }
  return count;
}

// Redirects reportGlobalError into a list for the lifetime of the object.
class CapturedGlobalErrors {
public:
  CapturedGlobalErrors()
    : previous_(setGlobalErrorHandler([this](const std::string& message) {
        messages.push_back(message);
      })) {}

  ~CapturedGlobalErrors() {
    setGlobalErrorHandler(std::move(previous_));
  }

  CapturedGlobalErrors(const CapturedGlobalErrors&) = delete;
  CapturedGlobalErrors& operator=(const CapturedGlobalErrors&) = delete;

  std::vector<std::string> messages;

private:
  GlobalErrorHandler previous_;
};

} // namespace kalx::test
