#pragma once

#include <optional>
#include <string>

namespace bridge {

class PortAllocator {
 public:
  virtual ~PortAllocator() = default;
  virtual std::optional<int> FindFreePort(std::string* err) = 0;
};

// Asks the kernel for an unused loopback port by binding 127.0.0.1:0.
class LoopbackPortAllocator : public PortAllocator {
 public:
  std::optional<int> FindFreePort(std::string* err) override;
};

// Always hands out the configured port.
class FixedPortAllocator : public PortAllocator {
 public:
  explicit FixedPortAllocator(int port) : port_(port) {}
  std::optional<int> FindFreePort(std::string* err) override;

 private:
  int port_;
};

}  // namespace bridge
