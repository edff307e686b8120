#pragma once

#include <functional>
#include <string>

namespace djonline {

/**
 * Sink for diagnostic messages. When unset, messages go to stderr.
 */
using LogCallback = std::function<void(const std::string&)>;

/// Deliver a message to the callback, or to stderr with a "[djonline]" prefix.
void Log(const std::string& message, const LogCallback& callback);

}  // namespace djonline
