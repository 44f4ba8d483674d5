/* ──────────────────────────────────────────────────────────────
   dispatcher.hpp  –  shape checks, label realignment and routing
   of (X_ref, X_enh, Y_ref) to one regression backend
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <string>
#include <vector>

#include "model_iface.hpp"

namespace feature_enhance {

struct Realigned {
    LabeledMatrix x_enh;
    bool          changed = false;
};

/*  X_enh with X_ref's dimension labels.  Columns are matched by
    position; `changed` is set when the labels differed.          */
Realigned realign_labels(const LabeledMatrix& x_enh, const LabeledMatrix& x_ref);

struct DispatchResult {
    EnhancedMatrix prediction;
    bool           labels_realigned = false;
};

/*  Fit `kind` on (x_ref, y_ref) and predict on x_enh.
    y_ref is features × samples and already restricted to the
    selected features.  Throws precondition_error when the
    embedding widths or sample counts disagree.                  */
DispatchResult dispatch(const LabeledMatrix& x_enh,
                        const LabeledMatrix& x_ref,
                        const LabeledMatrix& y_ref,
                        ModelKind            kind,
                        const TrainOpt&      opt = TrainOpt());

} // namespace feature_enhance
