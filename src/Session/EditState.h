#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// Per-image lifecycle
//
//   Uploaded → Estimating → Estimated → Editing ⇄ Saved → Accepted | Rejected
//
// Accepted and Rejected are reversible: editing an accepted image drops it
// back to Editing, and a rejected image can be edited, saved or accepted
// again. Only Accepted records with a committed crop are exported.
// ─────────────────────────────────────────────────────────────────────────────

enum class EditState {
    Uploaded,
    Estimating,
    Estimated,
    Editing,
    Saved,
    Accepted,
    Rejected,
};

const char* to_string(EditState state);

// Whether the lifecycle allows moving from `from` to `to`.
bool can_transition(EditState from, EditState to);

bool is_export_eligible(EditState state, bool has_crop);
