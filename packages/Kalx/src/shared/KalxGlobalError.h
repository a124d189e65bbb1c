#pragma once

#include <exception>
#include <functional>
#include <string>

namespace kalx {

using GlobalErrorHandler = std::function<void(const std::string&)>;

void reportGlobalError(const std::exception& ex);
void reportGlobalError(const std::string& message);
void reportGlobalError();

// Replaces the sink used by reportGlobalError. Passing an empty handler
// restores the default stderr sink. Returns the previous handler.
GlobalErrorHandler setGlobalErrorHandler(GlobalErrorHandler handler);

} // namespace kalx
