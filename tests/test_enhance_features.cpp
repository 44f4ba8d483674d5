#include <cmath>

#include "enhance_features.hpp"
#include "test_util.hpp"

using namespace feature_enhance;

namespace {

struct Pair {
    SpotData      enhanced;
    SpotData      ref;
    LabeledMatrix y;
};

/* 50 spots / 200 subspots over a 15-dim embedding, 10 features */
Pair make_pair_data(unsigned seed)
{
    const LabeledMatrix x_ref = fe_test::random_embedding(50, 15, seed);
    const LabeledMatrix x_enh = fe_test::random_embedding(200, 15, seed + 1, "subspot");
    Pair p{fe_test::spots_with(x_enh), fe_test::spots_with(x_ref),
           fe_test::linear_features(x_ref, 10, seed + 2)};
    p.ref = p.ref.with_assay("logcounts", p.y);
    return p;
}

EnhanceOptions lm_options()
{
    EnhanceOptions opt;
    opt.model = ModelKind::lm;
    return opt;
}

bool test_defaults()
{
    const EnhanceOptions opt;
    FE_CHECK(opt.use_dimred == "PCA");
    FE_CHECK(opt.assay_type == "logcounts");
    FE_CHECK(!opt.alt_exp_type);
    FE_CHECK(!opt.feature_matrix);
    FE_CHECK(opt.feature_names.empty());
    FE_CHECK(opt.model == ModelKind::xgboost);
    return true;
}

bool test_full_request_writes_assay()
{
    const Pair p = make_pair_data(401);
    const EnhanceResult res = enhance_features(p.enhanced, p.ref, lm_options());

    FE_CHECK(!res.is_matrix());
    FE_CHECK(res.object.has_value());
    FE_CHECK(res.object->has_assay("logcounts"));
    FE_CHECK(!p.enhanced.has_assay("logcounts"));            // caller's copy untouched

    const LabeledMatrix& Y = res.object->get_assay("logcounts");
    FE_CHECK(Y.rows() == 10 && Y.cols() == 200);
    FE_CHECK(Y.row_names == p.y.row_names);
    FE_CHECK(Y.col_names == p.enhanced.spot_ids());

    FE_CHECK(res.matrix.diagnostics.size() == 10);
    for (const auto& kv : res.matrix.diagnostics.values) FE_CHECK(std::isfinite(kv.second));
    FE_CHECK(res.selection.skipped.empty());
    return true;
}

bool test_partial_request_returns_matrix()
{
    const Pair p = make_pair_data(411);
    EnhanceOptions opt = lm_options();
    opt.feature_names = {"gene7", "gene2", "not_a_gene"};

    EnhanceResult res;
    std::string log;
    {
        fe_test::CerrCapture cap;
        res = enhance_features(p.enhanced, p.ref, opt);
        log = cap.str();
    }
    FE_CHECK(res.is_matrix());
    FE_CHECK(!res.object);
    FE_CHECK(res.matrix.values.rows() == 2 && res.matrix.values.cols() == 200);
    /* native row order, not request order */
    FE_CHECK((res.matrix.values.row_names == std::vector<std::string>{"gene2", "gene7"}));
    FE_CHECK(res.selection.skipped.size() == 1);
    FE_CHECK(res.selection.skipped[0] == "not_a_gene");
    FE_CHECK(log.find("Skipping 1 features") != std::string::npos);
    return true;
}

bool test_explicit_matrix_always_returns_matrix()
{
    const Pair p = make_pair_data(421);
    EnhanceOptions opt = lm_options();
    LabeledMatrix ext = p.y;
    ext.row_names = fe_test::names("protein", 10);
    opt.feature_matrix = ext;
    opt.alt_exp_type   = std::string("ADT");           // loses to the explicit matrix

    const EnhanceResult res = enhance_features(p.enhanced, p.ref, opt);
    FE_CHECK(res.is_matrix());
    FE_CHECK(res.matrix.values.rows() == 10);
    FE_CHECK(res.matrix.values.row_names == ext.row_names);
    return true;
}

bool test_alt_exp_round_trip()
{
    Pair p = make_pair_data(431);
    LabeledMatrix adt = p.y.select_rows({"gene1", "gene2", "gene3"});
    adt.row_names = {"CD4", "CD8", "CD19"};
    AltExperiment alt;
    alt.assays["ADT"] = adt;
    p.ref = p.ref.with_alt_exp("ADT", alt);

    EnhanceOptions opt = lm_options();
    opt.alt_exp_type = std::string("ADT");
    const EnhanceResult res = enhance_features(p.enhanced, p.ref, opt);

    FE_CHECK(!res.is_matrix());
    FE_CHECK(res.object->has_alt_exp("ADT"));
    FE_CHECK(!res.object->has_assay("logcounts"));
    const LabeledMatrix& Y = res.object->get_alt_assay("ADT", "ADT");
    FE_CHECK(Y.row_names == adt.row_names);
    FE_CHECK(Y.cols() == 200);
    return true;
}

bool test_partial_alt_exp_returns_matrix()
{
    Pair p = make_pair_data(441);
    AltExperiment alt;
    alt.assays["ADT"] = p.y;
    p.ref = p.ref.with_alt_exp("ADT", alt);

    EnhanceOptions opt = lm_options();
    opt.alt_exp_type  = std::string("ADT");
    opt.feature_names = {"gene1"};
    const EnhanceResult res = enhance_features(p.enhanced, p.ref, opt);
    FE_CHECK(res.is_matrix());
    FE_CHECK(res.matrix.values.rows() == 1);
    return true;
}

bool test_resolver_precedence()
{
    Pair p = make_pair_data(451);
    LabeledMatrix adt = p.y;
    adt.row_names = fe_test::names("adt", 10);
    AltExperiment alt;
    alt.assays["ADT"] = adt;
    p.ref = p.ref.with_alt_exp("ADT", alt);
    LabeledMatrix ext = p.y;
    ext.row_names = fe_test::names("ext", 10);

    const std::optional<std::string> none;
    const std::optional<std::string> adt_id("ADT");
    FE_CHECK(resolve_feature_matrix(p.ref, &ext, adt_id, "logcounts").row_names[0] == "ext1");
    FE_CHECK(resolve_feature_matrix(p.ref, nullptr, adt_id, "logcounts").row_names[0] == "adt1");
    FE_CHECK(resolve_feature_matrix(p.ref, nullptr, none, "logcounts").row_names[0] == "gene1");
    FE_CHECK_THROWS(resolve_feature_matrix(p.ref, nullptr, none, "counts"), precondition_error);
    return true;
}

bool test_missing_rownames_for_every_model()
{
    Pair p = make_pair_data(461);
    LabeledMatrix bare = p.y;
    bare.row_names.clear();
    p.ref = p.ref.with_assay("logcounts", bare);

    for (ModelKind k : {ModelKind::lm, ModelKind::dirichlet, ModelKind::xgboost}) {
        EnhanceOptions opt;
        opt.model = k;
        FE_CHECK_THROWS(enhance_features(p.enhanced, p.ref, opt), precondition_error);
    }
    return true;
}

bool test_select_features()
{
    const std::vector<std::string> avail = {"a", "b", "c", "d"};

    const FeatureSelection all = select_features({}, avail);
    FE_CHECK(all.selected == avail);
    FE_CHECK(!all.partial());

    const FeatureSelection some = select_features({"d", "x", "b", "d", "x", "y"}, avail);
    FE_CHECK((some.selected == std::vector<std::string>{"b", "d"}));
    FE_CHECK((some.skipped == std::vector<std::string>{"x", "y"}));
    FE_CHECK(some.n_available == 4);
    FE_CHECK(some.partial());

    /* everything requested → not partial */
    const FeatureSelection full = select_features({"d", "c", "b", "a"}, avail);
    FE_CHECK(full.selected == avail);
    FE_CHECK(!full.partial());
    return true;
}

bool test_no_requested_feature_present()
{
    const Pair p = make_pair_data(481);
    for (ModelKind k : {ModelKind::lm, ModelKind::xgboost}) {
        EnhanceOptions opt;
        opt.model         = k;
        opt.feature_names = {"nope1", "nope2"};

        EnhanceResult res;
        std::string log;
        {
            fe_test::CerrCapture cap;
            res = enhance_features(p.enhanced, p.ref, opt);
            log = cap.str();
        }
        FE_CHECK(res.is_matrix());
        FE_CHECK(res.matrix.values.rows() == 0);
        FE_CHECK(res.matrix.values.cols() == 200);
        FE_CHECK(res.matrix.values.col_names == p.enhanced.spot_ids());
        FE_CHECK(res.matrix.diagnostics.size() == 0);
        FE_CHECK(res.selection.selected.empty());
        FE_CHECK(res.selection.skipped.size() == 2);
        FE_CHECK(log.find("Skipping 2 features") != std::string::npos);
    }
    return true;
}

bool test_every_model_is_shape_correct()
{
    const LabeledMatrix x_ref = fe_test::random_embedding(60, 3, 471);
    const LabeledMatrix x_enh = fe_test::random_embedding(90, 3, 472, "subspot");
    LabeledMatrix y = fe_test::linear_features(x_ref, 4, 473);
    y.values = y.values.array().exp().matrix();
    const SpotData ref = fe_test::spots_with(x_ref).with_assay("logcounts", y);
    const SpotData enh = fe_test::spots_with(x_enh);

    for (ModelKind k : {ModelKind::lm, ModelKind::dirichlet, ModelKind::xgboost}) {
        EnhanceOptions opt;
        opt.model = k;
        const EnhanceResult res = enhance_features(enh, ref, opt);
        FE_CHECK(!res.is_matrix());
        const LabeledMatrix& Y = res.object->get_assay("logcounts");
        FE_CHECK(Y.rows() == 4 && Y.cols() == 90);
        FE_CHECK(Y.row_names == y.row_names);
        FE_CHECK(Y.col_names == x_enh.row_names);
    }
    return true;
}

} // namespace

int main()
{
    return fe_test::run_tests({
        {"defaults",                          test_defaults},
        {"full_request_writes_assay",         test_full_request_writes_assay},
        {"partial_request_returns_matrix",    test_partial_request_returns_matrix},
        {"explicit_matrix_always_returns_matrix", test_explicit_matrix_always_returns_matrix},
        {"alt_exp_round_trip",                test_alt_exp_round_trip},
        {"partial_alt_exp_returns_matrix",    test_partial_alt_exp_returns_matrix},
        {"resolver_precedence",               test_resolver_precedence},
        {"missing_rownames_for_every_model",  test_missing_rownames_for_every_model},
        {"select_features",                   test_select_features},
        {"no_requested_feature_present",      test_no_requested_feature_present},
        {"every_model_is_shape_correct",      test_every_model_is_shape_correct},
    });
}
