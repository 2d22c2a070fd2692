#pragma once

#include "combat/KitStrategy.hpp"
#include <memory>

namespace Crimson::Combat {

/**
 * @brief Create the strategy for @p config.id
 *
 * The returned kit is not bound; the owner calls OnBind() once it is
 * installed.
 */
std::unique_ptr<KitStrategy> CreateKit(const KitConfig& config, const KitContext& context);

} // namespace Crimson::Combat
