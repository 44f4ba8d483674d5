/*  lm_model.cpp  ---------------------------------------------
 *  ordinary least squares, one independent fit per feature:
 *      feature ~ 1 + dim_1 + … + dim_d
 * ----------------------------------------------------------- */
#include <memory>

#include "model_iface.hpp"

namespace feature_enhance {

/* design matrix of `t` with columns ordered like `terms` */
static Eigen::MatrixXd design_for(const EmbeddingTable& t,
                                  const std::vector<std::string>& terms)
{
    Eigen::MatrixXd X(t.num_rows(), Eigen::Index(terms.size()) + 1);
    X.col(0).setOnes();
    for (size_t j = 0; j < terms.size(); ++j) {
        size_t k = 0;
        while (k < t.columns.size() && t.columns[k] != terms[j]) ++k;
        chk(k < t.columns.size(), "embedding column '" + terms[j] + "' missing in newdata");
        X.col(Eigen::Index(j) + 1) = t.data[k];
    }
    return X;
}

/* R² = mss / (mss + rss) with mss centred on the fitted mean.
   Not clamped: a constant response gives 0/0 = NaN.            */
static double r_squared(const Eigen::VectorXd& y, const Eigen::VectorXd& fitted)
{
    const double rss = (y - fitted).squaredNorm();
    const double mss = (fitted.array() - fitted.mean()).matrix().squaredNorm();
    return mss / (mss + rss);
}

class LMModel : public IModel {
public:
    ModelKind   kind()   const override { return ModelKind::lm; }
    InputLayout layout() const override { return InputLayout::table; }

    EnhancedMatrix fit_predict(const ModelInput&               X,
                               const LabeledMatrix&            y_ref,
                               const std::vector<std::string>& features,
                               const TrainOpt&                 opt) const override
    {
        chk(X.layout == InputLayout::table, "lm expects tabular embeddings");
        chk(y_ref.cols() == X.num_ref(),
            "response has " + std::to_string(y_ref.cols()) + " samples, embedding has " +
            std::to_string(X.num_ref()));

        const Eigen::MatrixXd Xr = X.ref_table.design();
        const Eigen::MatrixXd Xe = design_for(X.enh_table, X.ref_table.columns);

        /* every feature shares the design, so factor it once */
        const Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(Xr);
        if (qr.rank() < Xr.cols())
            logW("lm: design is rank deficient (rank " + std::to_string(qr.rank()) +
                 " < " + std::to_string(Xr.cols()) + "), aliased terms are set to 0");

        logI("lm: fitting " + std::to_string(features.size()) + " features on " +
             std::to_string(Xr.rows()) + " samples × " +
             std::to_string(X.ref_table.columns.size()) + " dims");

        return map_features(features, y_ref, X.enh_ids(), Xe.rows(),
                            DiagKind::r_squared, opt,
            [&](const std::string&, Eigen::Index r) {
                const Eigen::VectorXd y    = y_ref.values.row(r).transpose();
                const Eigen::VectorXd beta = qr.solve(y);

                FeatureFit fit;
                fit.diag = r_squared(y, Xr * beta);
                fit.row  = Xe * beta;
                return fit;
            });
    }
};

std::unique_ptr<IModel> make_lm()
{
    return std::make_unique<LMModel>();
}

} // namespace feature_enhance
