#include "shared/KalxGlobalError.h"

#include <exception>
#include <iostream>
#include <string>
#include <utility>

namespace kalx {

namespace {

GlobalErrorHandler& currentHandler() {
  static GlobalErrorHandler handler{};
  return handler;
}

void writeErrorMessage(const std::string& message) {
  const GlobalErrorHandler& handler = currentHandler();
  if (handler) {
    handler(message);
    return;
  }
  std::cerr << "Kalx global error: " << message << std::endl;
}

std::string describeNested(const std::exception& ex) {
  std::string message = ex.what();
  try {
    std::rethrow_if_nested(ex);
  } catch (const std::exception& nested) {
    message += ": " + describeNested(nested);
  } catch (...) {
    message += ": unknown nested error";
  }
  return message;
}

} // namespace

void reportGlobalError(const std::exception& ex) {
  writeErrorMessage(describeNested(ex));
}

void reportGlobalError(const std::string& message) {
  writeErrorMessage(message);
}

void reportGlobalError() {
  writeErrorMessage("Unknown error");
}

GlobalErrorHandler setGlobalErrorHandler(GlobalErrorHandler handler) {
  GlobalErrorHandler previous = std::move(currentHandler());
  currentHandler() = std::move(handler);
  return previous;
}

} // namespace kalx
