/*  lightgbm_model.cpp  ---------------------------------------
 *  gradient-boosted regression trees, one booster per feature,
 *  squared-error objective, single-threaded and deterministic
 * ----------------------------------------------------------- */
#include <LightGBM/c_api.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "model_iface.hpp"

namespace feature_enhance {

namespace {

/* ★ util – LightGBM return code → backend_error */
inline void lgbm_chk(int ret, const char* what)
{
    if (ret != 0) {
        const std::string msg = std::string(what) + ": " + LGBM_GetLastError();
        logE("LightGBM " + msg);
        throw backend_error(msg);
    }
}

/* handles are freed on every path, including throws */
struct DatasetGuard {
    DatasetHandle h = nullptr;
    ~DatasetGuard() { if (h) LGBM_DatasetFree(h); }
};

struct BoosterGuard {
    BoosterHandle h = nullptr;
    ~BoosterGuard() { if (h) LGBM_BoosterFree(h); }
};

/*  max_depth d allows at most 2^d leaves; no row or column
    subsampling so repeated fits are bit-identical.          */
std::string booster_params(const TrainOpt& opt)
{
    const int leaves = 1 << std::max(1, std::min(opt.max_depth, 16));

    std::ostringstream ss;
    ss << "objective=regression"
       << " metric=rmse"
       << " is_provide_training_metric=true"
       << " boosting=gbdt"
       << " learning_rate=" << opt.lr
       << " max_depth=" << opt.max_depth
       << " num_leaves=" << leaves
       << " num_threads=" << std::max(1, opt.lgbm_threads)
       << " min_data_in_leaf=1"
       << " min_sum_hessian_in_leaf=1"
       << " min_data_in_bin=1"
       << " feature_pre_filter=false"
       << " lambda_l2=1"
       << " bagging_fraction=1.0 bagging_freq=0"
       << " feature_fraction=1.0"
       << " deterministic=true force_row_wise=true seed=0"
       << " verbosity=-1";
    return ss.str();
}

} // namespace

class LGBModel : public IModel {
public:
    ModelKind   kind()   const override { return ModelKind::xgboost; }
    InputLayout layout() const override { return InputLayout::raw; }

    EnhancedMatrix fit_predict(const ModelInput&               X,
                               const LabeledMatrix&            y_ref,
                               const std::vector<std::string>& features,
                               const TrainOpt&                 opt) const override
    {
        chk(X.layout == InputLayout::raw, "xgboost expects raw embedding rows");
        chk(y_ref.cols() == X.num_ref(),
            "response has " + std::to_string(y_ref.cols()) + " samples, embedding has " +
            std::to_string(X.num_ref()));
        chk(X.enh_raw.ncol == X.ref_raw.ncol, "xgboost: embedding widths differ");
        chk(opt.trees > 0, "xgboost: trees must be positive");

        const std::string params = booster_params(opt);
        logI("xgboost: " + std::to_string(features.size()) + " features, " +
             std::to_string(opt.trees) + " rounds, max_depth=" +
             std::to_string(opt.max_depth) + ", eta=" + std::to_string(opt.lr));

        return map_features(features, y_ref, X.enh_ids(), X.num_enh(),
                            DiagKind::rmse, opt,
            [&](const std::string& feature, Eigen::Index r) {
                return fit_one(X.ref_raw, X.enh_raw, y_ref.values.row(r), feature,
                               params, opt.trees);
            });
    }

private:
    static FeatureFit fit_one(const RawRows&            ref,
                              const RawRows&            enh,
                              const Eigen::RowVectorXd& y,
                              const std::string&        feature,
                              const std::string&        params,
                              int                       trees)
    {
        const std::string tag = "xgboost[" + feature + "] ";

        DatasetGuard ds;
        lgbm_chk(LGBM_DatasetCreateFromMat(ref.data.data(), C_API_DTYPE_FLOAT64,
                                           ref.nrow, ref.ncol,
                                           1,                 // is_row_major
                                           params.c_str(),
                                           nullptr,           // reference
                                           &ds.h),
                 (tag + "DatasetCreateFromMat").c_str());

        /* LightGBM keeps labels as float32 */
        std::vector<float> label(size_t(y.size()));
        for (Eigen::Index i = 0; i < y.size(); ++i) label[size_t(i)] = float(y(i));
        lgbm_chk(LGBM_DatasetSetField(ds.h, "label", label.data(),
                                      static_cast<int>(label.size()),
                                      C_API_DTYPE_FLOAT32),
                 (tag + "DatasetSetField(label)").c_str());

        BoosterGuard bst;
        lgbm_chk(LGBM_BoosterCreate(ds.h, params.c_str(), &bst.h),
                 (tag + "BoosterCreate").c_str());

        for (int it = 0; it < trees; ++it) {
            int finished = 0;
            lgbm_chk(LGBM_BoosterUpdateOneIter(bst.h, &finished),
                     (tag + "UpdateOneIter").c_str());
            if (finished) break;              // nothing left to split on
        }

        /* training rmse after the final round */
        int n_eval = 0;
        lgbm_chk(LGBM_BoosterGetEvalCounts(bst.h, &n_eval),
                 (tag + "GetEvalCounts").c_str());
        std::vector<double> eval(size_t(std::max(n_eval, 1)), NAN);
        int out_eval = 0;
        lgbm_chk(LGBM_BoosterGetEval(bst.h, 0, &out_eval, eval.data()),
                 (tag + "GetEval").c_str());

        FeatureFit fit;
        fit.diag = out_eval > 0 ? eval[0] : NAN;
        fit.row  = Eigen::VectorXd::Zero(enh.nrow);
        if (enh.nrow > 0) {
            int64_t out_len = 0;
            lgbm_chk(LGBM_BoosterPredictForMat(bst.h, enh.data.data(), C_API_DTYPE_FLOAT64,
                                               enh.nrow, enh.ncol,
                                               1,                      // row-major
                                               C_API_PREDICT_NORMAL,
                                               0,                      // start_iteration
                                               -1,                     // all trees
                                               "num_threads=1",
                                               &out_len, fit.row.data()),
                     (tag + "PredictForMat").c_str());
            chk(out_len == int64_t(enh.nrow),
                tag + "predicted " + std::to_string(out_len) + " of " +
                std::to_string(enh.nrow) + " rows");
        }
        return fit;
    }
};

std::unique_ptr<IModel> make_lightgbm()
{
    return std::make_unique<LGBModel>();
}

} // namespace feature_enhance
