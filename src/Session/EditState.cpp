#include "Session/EditState.h"

const char* to_string(EditState state)
{
    switch (state) {
        case EditState::Uploaded:   return "uploaded";
        case EditState::Estimating: return "estimating";
        case EditState::Estimated:  return "estimated";
        case EditState::Editing:    return "editing";
        case EditState::Saved:      return "saved";
        case EditState::Accepted:   return "accepted";
        case EditState::Rejected:   return "rejected";
    }
    return "unknown";
}

bool can_transition(EditState from, EditState to)
{
    switch (from) {
        case EditState::Uploaded:
            return to == EditState::Estimating;

        case EditState::Estimating:
            return to == EditState::Estimated;

        case EditState::Estimated:
            return to == EditState::Editing
                || to == EditState::Saved
                || to == EditState::Rejected;

        case EditState::Editing:
            return to == EditState::Saved
                || to == EditState::Rejected;

        case EditState::Saved:
            return to == EditState::Editing
                || to == EditState::Saved
                || to == EditState::Accepted
                || to == EditState::Rejected;

        case EditState::Accepted:
            // Saved: accept withdrawn; the crop stays.
            return to == EditState::Editing
                || to == EditState::Saved
                || to == EditState::Rejected;

        case EditState::Rejected:
            return to == EditState::Editing
                || to == EditState::Saved
                || to == EditState::Accepted;
    }
    return false;
}

bool is_export_eligible(EditState state, bool has_crop)
{
    return state == EditState::Accepted && has_crop;
}
