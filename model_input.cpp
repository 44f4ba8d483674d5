/*  model_input.cpp  ------------------------------------------
 *  model tags, representation conversion and the per-feature map
 * ----------------------------------------------------------- */
#include <algorithm>
#include <cctype>
#include <exception>
#include <stdexcept>

#include "model_iface.hpp"

namespace feature_enhance {

ModelKind parse_model_kind(const std::string& name)
{
    std::string s(name);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c){ return char(std::tolower(c)); });

    if (s == "lm"        || s == "linear")        return ModelKind::lm;
    if (s == "dirichlet" || s == "compositional") return ModelKind::dirichlet;
    if (s == "xgboost"   || s == "tree")          return ModelKind::xgboost;
    throw std::invalid_argument("unknown model '" + name +
                                "' (expected lm, dirichlet or xgboost)");
}

const char* model_name(ModelKind kind)
{
    switch (kind) {
        case ModelKind::lm:        return "lm";
        case ModelKind::dirichlet: return "dirichlet";
        case ModelKind::xgboost:   return "xgboost";
    }
    return "?";
}

std::unique_ptr<IModel> make_model(ModelKind kind)
{
    switch (kind) {
        case ModelKind::lm:        return make_lm();
        case ModelKind::dirichlet: return make_dirichlet();
        case ModelKind::xgboost:   return make_lightgbm();
    }
    throw std::invalid_argument("unknown model kind");
}

/* ─────────────────────────  representations  ───────────────────────── */
Eigen::MatrixXd EmbeddingTable::design() const
{
    Eigen::MatrixXd X(nrow, Eigen::Index(data.size()) + 1);
    X.col(0).setOnes();
    for (size_t j = 0; j < data.size(); ++j)
        X.col(Eigen::Index(j) + 1) = data[j];
    return X;
}

EmbeddingTable to_table(const LabeledMatrix& x)
{
    EmbeddingTable t;
    t.nrow    = x.rows();
    t.row_ids = x.row_names;
    t.columns = x.col_names;
    if (t.columns.empty()) {                       // V1, V2, … like a bare frame
        for (Eigen::Index j = 0; j < x.cols(); ++j)
            t.columns.push_back("V" + std::to_string(j + 1));
    }
    t.data.reserve(size_t(x.cols()));
    for (Eigen::Index j = 0; j < x.cols(); ++j)
        t.data.emplace_back(x.values.col(j));
    return t;
}

RawRows to_raw(const LabeledMatrix& x)
{
    RawRows r;
    r.nrow    = static_cast<int32_t>(x.rows());
    r.ncol    = static_cast<int32_t>(x.cols());
    r.row_ids = x.row_names;
    r.data.resize(size_t(x.rows()) * size_t(x.cols()));

    /* Eigen is column-major; LightGBM gets is_row_major = 1 */
    Eigen::Map<Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>>
        rm(r.data.data(), x.rows(), x.cols());
    rm = x.values;
    return r;
}

ModelInput make_model_input(InputLayout layout,
                            const LabeledMatrix& x_ref,
                            const LabeledMatrix& x_enh)
{
    ModelInput in;
    in.layout = layout;
    if (layout == InputLayout::table) {
        in.ref_table = to_table(x_ref);
        in.enh_table = to_table(x_enh);
    } else {
        in.ref_raw = to_raw(x_ref);
        in.enh_raw = to_raw(x_enh);
    }
    return in;
}

Eigen::Index ModelInput::num_ref() const
{
    return layout == InputLayout::table ? ref_table.num_rows()
                                        : Eigen::Index(ref_raw.nrow);
}

Eigen::Index ModelInput::num_enh() const
{
    return layout == InputLayout::table ? enh_table.num_rows()
                                        : Eigen::Index(enh_raw.nrow);
}

const std::vector<std::string>& ModelInput::enh_ids() const
{
    return layout == InputLayout::table ? enh_table.row_ids : enh_raw.row_ids;
}

/* ─────────────────────────  diagnostics  ───────────────────────── */
bool Diagnostics::contains(const std::string& feature) const
{
    for (const auto& kv : values)
        if (kv.first == feature) return true;
    return false;
}

double Diagnostics::at(const std::string& feature) const
{
    for (const auto& kv : values)
        if (kv.first == feature) return kv.second;
    throw std::out_of_range("no diagnostic for feature '" + feature + "'");
}

/* ─────────────────────────  per-feature map  ───────────────────────── */
EnhancedMatrix map_features(const std::vector<std::string>& features,
                            const LabeledMatrix&            y_ref,
                            const std::vector<std::string>& enh_ids,
                            Eigen::Index                    n_enh,
                            DiagKind                        kind,
                            const TrainOpt&                 opt,
                            const FitOne&                   fit_one)
{
    const long P = long(features.size());

    std::vector<Eigen::Index> rows(features.size());
    for (long f = 0; f < P; ++f) {
        rows[size_t(f)] = y_ref.row_index(features[size_t(f)]);
        chk(rows[size_t(f)] >= 0,
            "feature '" + features[size_t(f)] + "' not in reference matrix");
    }

    Eigen::MatrixXd     Y(Eigen::Index(P), n_enh);
    std::vector<double> diag(features.size(), 0.0);

    std::exception_ptr first_err;
    bool               cancelled = false;
    const int          nthreads  = std::max(1, opt.threads);

    #pragma omp parallel for schedule(dynamic) num_threads(nthreads) if(nthreads > 1)
    for (long f = 0; f < P; ++f) {
        bool skip;
        #pragma omp critical(fe_map_state)
        {
            if (opt.cancel && opt.cancel->load()) cancelled = true;
            skip = cancelled || first_err;
        }
        if (skip) continue;

        try {
            FeatureFit fit = fit_one(features[size_t(f)], rows[size_t(f)]);
            chk(fit.row.size() == n_enh,
                "backend returned " + std::to_string(fit.row.size()) +
                " predictions for " + std::to_string(n_enh) + " samples");
            Y.row(Eigen::Index(f)) = fit.row.transpose();
            diag[size_t(f)]        = fit.diag;
        } catch (...) {
            #pragma omp critical(fe_map_state)
            {
                if (!first_err) first_err = std::current_exception();
            }
        }
    }

    if (first_err) std::rethrow_exception(first_err);
    if (cancelled) throw cancelled_error("per-feature loop stopped before completion");

    EnhancedMatrix out;
    out.values = LabeledMatrix(std::move(Y), features, enh_ids);
    out.diagnostics.kind = kind;
    if (kind != DiagKind::none) {
        out.diagnostics.values.reserve(features.size());
        for (size_t f = 0; f < features.size(); ++f)
            out.diagnostics.values.emplace_back(features[f], diag[f]);
    }
    return out;
}

} // namespace feature_enhance
