#include "combat/KitFactory.hpp"
#include "combat/kits/BloodKit.hpp"
#include "combat/kits/FrostKit.hpp"
#include "combat/kits/PoisonMeleeKit.hpp"
#include "combat/kits/RangedBowKit.hpp"

namespace Crimson::Combat {

std::unique_ptr<KitStrategy> CreateKit(const KitConfig& config, const KitContext& context) {
    switch (config.id) {
        case KitId::Frost:       return std::make_unique<FrostKit>(config, context);
        case KitId::PoisonMelee: return std::make_unique<PoisonMeleeKit>(config, context);
        case KitId::RangedBow:   return std::make_unique<RangedBowKit>(config, context);
        case KitId::Blood:       break;
    }
    return std::make_unique<BloodKit>(config, context);
}

} // namespace Crimson::Combat
