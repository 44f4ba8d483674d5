#include "spot_data.hpp"
#include "test_util.hpp"

using namespace feature_enhance;

namespace {

bool test_missing_entries_throw()
{
    SpotData s = fe_test::spots_with(fe_test::random_embedding(4, 2, 1));
    FE_CHECK(s.has_embedding("PCA"));
    FE_CHECK_THROWS(s.get_embedding("UMAP"), precondition_error);
    FE_CHECK_THROWS(s.get_assay("logcounts"), precondition_error);
    FE_CHECK_THROWS(s.get_alt_assay("ADT", "ADT"), precondition_error);
    return true;
}

bool test_updates_return_copies()
{
    LabeledMatrix emb = fe_test::random_embedding(5, 3, 2);
    SpotData base = fe_test::spots_with(emb);
    LabeledMatrix Y = fe_test::linear_features(emb, 2, 3);

    SpotData next = base.with_assay("logcounts", Y);
    FE_CHECK(next.has_assay("logcounts"));
    FE_CHECK(!base.has_assay("logcounts"));
    FE_CHECK(next.get_assay("logcounts").values.isApprox(Y.values));
    FE_CHECK(next.get_embedding("PCA").values.isApprox(emb.values));

    AltExperiment alt;
    alt.assays["ADT"] = Y;
    SpotData with_alt = next.with_alt_exp("ADT", alt);
    FE_CHECK(with_alt.has_alt_exp("ADT"));
    FE_CHECK(!next.has_alt_exp("ADT"));
    FE_CHECK(with_alt.get_alt_assay("ADT", "ADT").rows() == 2);
    FE_CHECK_THROWS(with_alt.get_alt_assay("ADT", "counts"), precondition_error);
    return true;
}

bool test_spot_count_is_enforced()
{
    SpotData s = fe_test::spots_with(fe_test::random_embedding(5, 3, 4));
    LabeledMatrix wrong(Eigen::MatrixXd::Zero(2, 4), {"g1", "g2"});
    FE_CHECK_THROWS(s.with_assay("logcounts", wrong), precondition_error);

    AltExperiment alt;
    alt.assays["ADT"] = wrong;
    FE_CHECK_THROWS(s.with_alt_exp("ADT", alt), precondition_error);

    FE_CHECK_THROWS(s.with_embedding("UMAP", LabeledMatrix(Eigen::MatrixXd::Zero(3, 2))),
                    precondition_error);
    return true;
}

bool test_unlabeled_inputs_get_spot_ids()
{
    SpotData s(fe_test::names("spot", 3));
    s = s.with_embedding("PCA", LabeledMatrix(Eigen::MatrixXd::Ones(3, 2)));
    FE_CHECK(s.get_embedding("PCA").row_names == s.spot_ids());

    s = s.with_assay("logcounts", LabeledMatrix(Eigen::MatrixXd::Ones(1, 3), {"g1"}));
    FE_CHECK(s.get_assay("logcounts").col_names == s.spot_ids());
    FE_CHECK((s.assay_names() == std::vector<std::string>{"logcounts"}));
    FE_CHECK((s.embedding_names() == std::vector<std::string>{"PCA"}));
    return true;
}

} // namespace

int main()
{
    return fe_test::run_tests({
        {"missing_entries_throw",        test_missing_entries_throw},
        {"updates_return_copies",        test_updates_return_copies},
        {"spot_count_is_enforced",       test_spot_count_is_enforced},
        {"unlabeled_inputs_get_spot_ids", test_unlabeled_inputs_get_spot_ids},
    });
}
