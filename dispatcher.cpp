#include "dispatcher.hpp"

namespace feature_enhance {

Realigned realign_labels(const LabeledMatrix& x_enh, const LabeledMatrix& x_ref)
{
    Realigned out{x_enh, false};
    if (x_enh.col_names != x_ref.col_names) {
        out.x_enh.col_names = x_ref.col_names;
        out.changed = true;
    }
    return out;
}

DispatchResult dispatch(const LabeledMatrix& x_enh,
                        const LabeledMatrix& x_ref,
                        const LabeledMatrix& y_ref,
                        ModelKind            kind,
                        const TrainOpt&      opt)
{
    chk(x_enh.cols() == x_ref.cols(),
        "enhanced embedding has " + std::to_string(x_enh.cols()) +
        " dimensions, reference has " + std::to_string(x_ref.cols()));
    chk(y_ref.cols() == x_ref.rows(),
        "feature matrix has " + std::to_string(y_ref.cols()) +
        " samples, reference embedding has " + std::to_string(x_ref.rows()));
    /* an empty selection carries no names and yields a 0 × n_enh prediction */
    chk(y_ref.rows() == 0 || y_ref.has_row_names(),
        "Spot features must have assigned rownames.");

    Realigned enh = realign_labels(x_enh, x_ref);
    if (enh.changed) {
        logW("column names of the reference and enhanced embeddings do not match");
        logW("setting enhanced embedding column names to match the reference ("
             + join(x_ref.col_names) + ")");
    }

    const std::unique_ptr<IModel> model = make_model(kind);

    /* the only place the representation is chosen */
    const ModelInput in = make_model_input(model->layout(), x_ref, enh.x_enh);

    DispatchResult res;
    res.prediction       = model->fit_predict(in, y_ref, y_ref.row_names, opt);
    res.labels_realigned = enh.changed;
    return res;
}

} // namespace feature_enhance
