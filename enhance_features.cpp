/*  enhance_features.cpp  -------------------------------------
 *  resolve → select → dispatch → materialize
 * ----------------------------------------------------------- */
#include "enhance_features.hpp"

#include <unordered_set>
#include <utility>

#include "dispatcher.hpp"

namespace feature_enhance {

const LabeledMatrix& resolve_feature_matrix(const SpotData&                   ref,
                                            const LabeledMatrix*              feature_matrix,
                                            const std::optional<std::string>& alt_exp_type,
                                            const std::string&                assay_type)
{
    const LabeledMatrix* Y = nullptr;
    if (feature_matrix)    Y = feature_matrix;
    else if (alt_exp_type) Y = &ref.get_alt_assay(*alt_exp_type, *alt_exp_type);
    else                   Y = &ref.get_assay(assay_type);

    chk(Y->has_row_names(), "Spot features must have assigned rownames.");
    return *Y;
}

FeatureSelection select_features(const std::vector<std::string>& requested,
                                 const std::vector<std::string>& available)
{
    FeatureSelection sel;
    sel.n_available = available.size();

    if (requested.empty()) {
        sel.selected = available;
        return sel;
    }

    const std::unordered_set<std::string> want(requested.begin(), requested.end());
    const std::unordered_set<std::string> have(available.begin(), available.end());

    std::unordered_set<std::string> seen;
    for (const auto& name : available)
        if (want.count(name) && seen.insert(name).second)
            sel.selected.push_back(name);

    seen.clear();
    for (const auto& name : requested)
        if (!have.count(name) && seen.insert(name).second)
            sel.skipped.push_back(name);

    if (!sel.skipped.empty())
        logI("Skipping " + std::to_string(sel.skipped.size()) +
             " features not in reference data");
    if (sel.selected.empty())
        logW("none of the " + std::to_string(want.size()) +
             " requested features is present in the reference data");
    return sel;
}

EnhanceResult materialize(EnhancedMatrix                    prediction,
                          const SpotData&                   enhanced,
                          bool                              explicit_matrix,
                          const std::optional<std::string>& alt_exp_type,
                          const std::string&                assay_type,
                          FeatureSelection                  selection)
{
    EnhanceResult res;
    res.selection = std::move(selection);
    res.matrix    = std::move(prediction);

    /* a partial or external feature set has no home in the object */
    if (explicit_matrix || res.selection.partial()) {
        res.kind = EnhanceResult::Kind::matrix;
        return res;
    }

    res.kind = EnhanceResult::Kind::object;
    if (alt_exp_type) {
        AltExperiment alt;
        alt.assays[*alt_exp_type] = res.matrix.values;
        res.object = enhanced.with_alt_exp(*alt_exp_type, std::move(alt));
    } else {
        res.object = enhanced.with_assay(assay_type, res.matrix.values);
    }
    return res;
}

EnhanceResult enhance_features(const SpotData&       enhanced,
                               const SpotData&       ref,
                               const EnhanceOptions& opt)
{
    const LabeledMatrix& x_enh = enhanced.get_embedding(opt.use_dimred);
    const LabeledMatrix& x_ref = ref.get_embedding(opt.use_dimred);

    const LabeledMatrix* explicit_y = opt.feature_matrix ? &*opt.feature_matrix : nullptr;
    const LabeledMatrix& Y = resolve_feature_matrix(ref, explicit_y,
                                                    opt.alt_exp_type, opt.assay_type);

    FeatureSelection sel = select_features(opt.feature_names, Y.row_names);

    DispatchResult d = sel.selected == Y.row_names
        ? dispatch(x_enh, x_ref, Y, opt.model, opt.train)
        : dispatch(x_enh, x_ref, Y.select_rows(sel.selected), opt.model, opt.train);

    EnhanceResult res = materialize(std::move(d.prediction), enhanced,
                                    explicit_y != nullptr, opt.alt_exp_type,
                                    opt.assay_type, std::move(sel));
    res.labels_realigned = d.labels_realigned;
    return res;
}

} // namespace feature_enhance
