/* ──────────────────────────────────────────────────────────────
   config.hpp  –  EnhanceOptions / TrainOpt  <->  JSON
   {
     "use_dimred": "PCA", "assay_type": "logcounts",
     "alt_exp_type": null, "feature_names": ["g1","g2"],
     "model": "xgboost",
     "train": { "trees": 100, "max_depth": 2, "lr": 0.03,
                "lgbm_threads": 1, "threads": 1,
                "max_iter": 200, "tol": 1e-10 }
   }
   Missing keys keep their defaults, unknown keys are logged.
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <string>

#include <nlohmann/json.hpp>

#include "enhance_features.hpp"

namespace feature_enhance {

using json = nlohmann::json;

TrainOpt       train_opt_from_json(const json& j);
EnhanceOptions options_from_json(const json& j);
/* reads and parses a JSON file; IO or parse failures → precondition_error */
EnhanceOptions load_options(const std::string& path);

json to_json(const TrainOpt& opt);
/* the explicit feature matrix and the cancel flag are not serialised */
json to_json(const EnhanceOptions& opt);

} // namespace feature_enhance
