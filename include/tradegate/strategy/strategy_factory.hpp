#pragma once

#include "../config/settings.hpp"
#include "istrategy.hpp"

#include <memory>
#include <string>
#include <vector>

namespace tradegate {
namespace strategy {

/**
 * Strategy Factory
 *
 * Creates strategy instances by name from Settings.
 */
class StrategyFactory {
public:
    /**
     * @throws std::invalid_argument for an unknown name
     */
    static std::unique_ptr<IStrategy> create(const std::string& name, const config::Settings& settings);

    static const std::vector<std::string>& names();
};

}  // namespace strategy
}  // namespace tradegate
