/* ──────────────────────────────────────────────────────────────
   model_iface.hpp     –  the abstraction layer
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "common.hpp"

namespace feature_enhance {

/* closed set of regression strategies */
enum class ModelKind { lm, dirichlet, xgboost };

/* accepts "lm"/"linear", "dirichlet"/"compositional", "xgboost"/"tree";
   throws std::invalid_argument otherwise                            */
ModelKind   parse_model_kind(const std::string& name);
const char* model_name(ModelKind kind);

struct TrainOpt {
    /* generic hyper-params – each backend reads the ones it needs */
    int     trees        = 100;     // boosting rounds
    int     max_depth    = 2;
    double  lr           = 0.03;
    int     lgbm_threads = 1;       // threads inside one LightGBM fit
    int     threads      = 1;       // per-feature loop (lm / xgboost)
    int     max_iter     = 200;     // dirichlet Fisher scoring
    double  tol          = 1e-10;   // relative log-likelihood change
    /* checked between features; set → cancelled_error */
    const std::atomic<bool>* cancel = nullptr;
};

/* ────────────────── input representations ────────────────── */
enum class InputLayout { table, raw };

/* labeled tabular view: one named column per embedding dimension,
   one row per sample                                             */
struct EmbeddingTable {
    std::vector<std::string>      columns;
    std::vector<std::string>      row_ids;     // may be empty
    std::vector<Eigen::VectorXd>  data;        // data[j] = column j
    Eigen::Index                  nrow = 0;

    Eigen::Index num_rows() const { return nrow; }
    /* [1 | columns…], the design matrix of an intercept model */
    Eigen::MatrixXd design() const;
};

/* row-major dense buffer, the layout LightGBM reads */
struct RawRows {
    int32_t                   nrow = 0;
    int32_t                   ncol = 0;
    std::vector<double>       data;
    std::vector<std::string>  row_ids;       // may be empty
};

struct ModelInput {
    InputLayout     layout = InputLayout::table;
    EmbeddingTable  ref_table, enh_table;     // layout == table
    RawRows         ref_raw,   enh_raw;       // layout == raw

    Eigen::Index num_ref() const;
    Eigen::Index num_enh() const;
    const std::vector<std::string>& enh_ids() const;
};

EmbeddingTable to_table(const LabeledMatrix& x);
RawRows        to_raw(const LabeledMatrix& x);
ModelInput     make_model_input(InputLayout layout,
                                const LabeledMatrix& x_ref,
                                const LabeledMatrix& x_enh);

/* ────────────────── outputs ────────────────── */
enum class DiagKind { none, r_squared, rmse };

struct Diagnostics {
    DiagKind                                   kind = DiagKind::none;
    std::vector<std::pair<std::string,double>> values;   // feature order

    size_t size()  const { return values.size(); }
    bool   empty() const { return values.empty(); }
    bool   contains(const std::string& feature) const;
    double at(const std::string& feature) const;          // std::out_of_range
};

struct EnhancedMatrix {
    LabeledMatrix values;          // features × enhanced samples
    Diagnostics   diagnostics;
};

/* one feature's fit, the unit of the per-feature map */
struct FeatureFit {
    Eigen::VectorXd row;           // predictions on the enhanced samples
    double          diag = 0.0;
};

using FitOne = std::function<FeatureFit(const std::string& feature,
                                        Eigen::Index        row)>;

/*  Runs fit_one for every feature and assembles the output matrix.
    Features are independent; with opt.threads > 1 they are mapped
    on an OpenMP team, each writing its own row.                   */
EnhancedMatrix map_features(const std::vector<std::string>& features,
                            const LabeledMatrix&            y_ref,
                            const std::vector<std::string>& enh_ids,
                            Eigen::Index                    n_enh,
                            DiagKind                        kind,
                            const TrainOpt&                 opt,
                            const FitOne&                   fit_one);

/* ────────────────── the model contract ────────────────── */
struct IModel {
    virtual ~IModel() = default;

    virtual ModelKind   kind()   const = 0;
    /*  which representation fit_predict expects in X              */
    virtual InputLayout layout() const = 0;

    /*  fit on (X.ref, y_ref[features]) and predict on X.enh.
        y_ref is features × reference samples.                      */
    virtual EnhancedMatrix
        fit_predict(const ModelInput&                X,
                    const LabeledMatrix&             y_ref,
                    const std::vector<std::string>&  features,
                    const TrainOpt&                  opt) const = 0;
};

/* factory fns, one per backend ---------------------------------- */
std::unique_ptr<IModel> make_lm();
std::unique_ptr<IModel> make_dirichlet();
std::unique_ptr<IModel> make_lightgbm();
std::unique_ptr<IModel> make_model(ModelKind kind);

} // namespace feature_enhance
