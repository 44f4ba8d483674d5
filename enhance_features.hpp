/* ──────────────────────────────────────────────────────────────
   enhance_features.hpp  –  predict per-spot features at enhanced
   resolution from a shared embedding

   Enhanced features are computed by fitting a predictive model on
   the reference embedding (e.g. the top principal components of
   each spot) against the reference feature values, then evaluating
   it on the enhanced embedding of the subspots.  With the default
   lm backend that is one `feature ~ PCs` regression per feature.

   Feature matrices are p × n: p features over n spots.
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <optional>
#include <string>
#include <vector>

#include "model_iface.hpp"
#include "spot_data.hpp"

namespace feature_enhance {

struct EnhanceOptions {
    std::string                   use_dimred = "PCA";        // embedding name
    std::string                   assay_type = "logcounts";  // primary assay
    std::optional<std::string>    alt_exp_type;              // overrides assay_type
    std::optional<LabeledMatrix>  feature_matrix;            // overrides both
    std::vector<std::string>      feature_names;             // empty = all
    ModelKind                     model = ModelKind::xgboost;
    TrainOpt                      train;
};

struct FeatureSelection {
    std::vector<std::string> selected;     // native row order
    std::vector<std::string> skipped;      // requested but absent
    size_t                   n_available = 0;

    bool partial() const { return selected.size() < n_available; }
};

struct EnhanceResult {
    enum class Kind { matrix, object };

    Kind                     kind = Kind::matrix;
    EnhancedMatrix           matrix;        // always filled
    std::optional<SpotData>  object;        // kind == object
    FeatureSelection         selection;
    bool                     labels_realigned = false;

    bool is_matrix() const { return kind == Kind::matrix; }
};

/*  explicit matrix > alternate experiment > primary assay.
    The alternate set is the assay named `alt_exp_type` inside the
    alternate experiment of the same name.  Throws
    precondition_error if the result has no row names.            */
const LabeledMatrix& resolve_feature_matrix(const SpotData&                   ref,
                                            const LabeledMatrix*              feature_matrix,
                                            const std::optional<std::string>& alt_exp_type,
                                            const std::string&                assay_type);

/*  request ∩ available, in `available` order; empty request = all */
FeatureSelection select_features(const std::vector<std::string>& requested,
                                 const std::vector<std::string>& available);

/*  Raw matrix for explicit or partial inputs, otherwise a copy of
    `enhanced` with the prediction stored where it was read from.  */
EnhanceResult materialize(EnhancedMatrix                    prediction,
                          const SpotData&                   enhanced,
                          bool                              explicit_matrix,
                          const std::optional<std::string>& alt_exp_type,
                          const std::string&                assay_type,
                          FeatureSelection                  selection);

EnhanceResult enhance_features(const SpotData&       enhanced,
                               const SpotData&       ref,
                               const EnhanceOptions& opt = EnhanceOptions());

} // namespace feature_enhance
