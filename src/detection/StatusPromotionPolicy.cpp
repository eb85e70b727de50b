#include "detection/StatusPromotionPolicy.h"

StatusPromotionPolicy StatusPromotion::keepStatus()
{
    return [](DetectionStatus current, EditKind) {
        return current;
    };
}

StatusPromotionPolicy StatusPromotion::promoteOnEdit()
{
    return [](DetectionStatus current, EditKind) {
        switch (current) {
        case DetectionStatus::ModelGenerated:
        case DetectionStatus::UserConfirmed:
            return DetectionStatus::UserEditedConfirmed;
        default:
            return current;
        }
    };
}

StatusPromotionPolicy StatusPromotion::forMode(Mode mode)
{
    switch (mode) {
    case Mode::PromoteOnEdit:
        return promoteOnEdit();
    case Mode::KeepStatus:
        break;
    }
    return keepStatus();
}
