// Example: print the network interfaces the troubleshooting report would show.
#include "djonline/network.h"

#include <iostream>

int main() {
  djonline::NetworkDiagnostics diagnostics;
  const auto lines = diagnostics.ListInterfaces();
  if (lines.empty()) {
    std::cout << "No active network interfaces found." << std::endl;
    return 1;
  }
  for (const auto& line : lines) {
    std::cout << line << std::endl;
  }
  return 0;
}
