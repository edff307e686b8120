#include "djonline/log.h"

#include <iostream>

namespace djonline {

void Log(const std::string& message, const LogCallback& callback) {
  if (callback) {
    callback(message);
    return;
  }
  std::cerr << "[djonline] " << message << std::endl;
}

}  // namespace djonline
