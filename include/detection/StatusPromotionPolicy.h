#ifndef STATUSPROMOTIONPOLICY_H
#define STATUSPROMOTIONPOLICY_H

#include <functional>

#include "detection/Detection.h"

enum class EditKind {
    Move,
    Resize
};

// Decides the status a detection takes after a committed geometry edit
using StatusPromotionPolicy = std::function<DetectionStatus(DetectionStatus current, EditKind kind)>;

/**
 * @brief Built-in promotion policies.
 *
 * KeepStatus leaves the status alone. PromoteOnEdit turns a model-generated
 * or confirmed box into UserEditedConfirmed once its geometry is edited.
 */
class StatusPromotion
{
public:
    enum class Mode {
        KeepStatus = 0,
        PromoteOnEdit = 1
    };

    static StatusPromotionPolicy keepStatus();
    static StatusPromotionPolicy promoteOnEdit();
    static StatusPromotionPolicy forMode(Mode mode);

private:
    StatusPromotion() = delete;
};

#endif // STATUSPROMOTIONPOLICY_H
