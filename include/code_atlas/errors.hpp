#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace code_atlas {

// Bad budgets, max_depth < 1, unreadable or mistyped config. Raised before any parsing.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error("configuration error: " + message) {}
};

// A structural guarantee of the pipeline did not hold. Never recovered from.
class InvariantViolation : public std::logic_error {
public:
    InvariantViolation(std::string invariant, const std::string& message)
        : std::logic_error("invariant '" + invariant + "' violated: " + message),
          invariant_(std::move(invariant)) {}

    const std::string& invariant() const noexcept { return invariant_; }

private:
    std::string invariant_;
};

namespace invariant {
    inline constexpr const char* kPartition = "partition";
    inline constexpr const char* kAcyclic = "acyclic-condensation";
    inline constexpr const char* kDepthBound = "depth-bound";
    inline constexpr const char* kGroupIntegrity = "group-integrity";
    inline constexpr const char* kTopologicalOrder = "topological-order";
    inline constexpr const char* kModuleShape = "module-shape";
    inline constexpr const char* kLeafBudget = "leaf-budget";
}

} // namespace code_atlas
