#include <gtest/gtest.h>
#include "plonk/keygen.hpp"
#include "test_helpers.hpp"

using namespace plonkish;
using plonkish::testing::known;
using plonkish::testing::thrown_kind;

namespace {

// A gate selector over a fixed coefficient column, plus a constant
struct CoefficientCircuit {
    struct Config {
        AdviceColumn a;
        FixedColumn coeff;
        FixedColumn constants;
        Selector gate;
    };

    size_t rows = 4;

    static Config configure(ConstraintSystem& cs) {
        Config config;
        config.a = cs.advice_column();
        config.coeff = cs.fixed_column();
        config.constants = cs.fixed_column();
        config.gate = cs.selector();
        cs.enable_equality(config.a);
        cs.enable_constant(config.constants);
        return config;
    }

    void synthesize(const Config& config, SingleChipLayouter& layouter) const {
        layouter.assign_region("coefficients", [&](Region& region) {
            for (size_t row = 0; row < rows; ++row) {
                region.enable_selector("gate", config.gate, row);
                region.assign_fixed("coeff", config.coeff, row, [row] {
                    return Value<Assigned>::known(Assigned::rational(Fp(row + 1), Fp(2)));
                });
                region.assign_advice("a", config.a, row, [] { return Value<Assigned>::unknown(); });
            }
            region.assign_advice_from_constant("one", config.a, rows, Fp::one());
        });
    }
};

} // namespace

class KeygenAssemblyTest : public ::testing::Test {
protected:
    void SetUp() override {
        a_ = cs_.advice_column();
        f_ = cs_.fixed_column();
        s_ = cs_.selector();
        i_ = cs_.instance_column();
        cs_.enable_equality(a_);
        cs_.enable_equality(f_);
    }

    ConstraintSystem cs_;
    AdviceColumn a_;
    FixedColumn f_;
    Selector s_;
    InstanceColumn i_;
};

TEST_F(KeygenAssemblyTest, BlindingFactorsFollowAdviceQueries) {
    EXPECT_EQ(cs_.blinding_factors(), 4u);
    EXPECT_EQ(cs_.minimum_rows(), 7u);

    cs_.query_advice(a_, 0);
    cs_.query_advice(a_, 1);
    cs_.query_advice(a_, -1);
    cs_.query_advice(a_, 2);
    cs_.query_advice(a_, 1);
    EXPECT_EQ(cs_.blinding_factors(), 5u);
    EXPECT_EQ(cs_.minimum_rows(), 8u);
}

TEST_F(KeygenAssemblyTest, UsableWindowExcludesBlindingRows) {
    keygen::Assembly assembly(4, cs_);
    EXPECT_EQ(assembly.usable_rows(), RowRange(0, 11));
    EXPECT_EQ(assembly.rw_rows(), RowRange(0, 11));
    EXPECT_EQ(assembly.phase(), SynthesisPhase::Configuring);
}

TEST_F(KeygenAssemblyTest, TooFewRowsForBlindingFails) {
    EXPECT_EQ(thrown_kind([&] { keygen::Assembly assembly(2, cs_); }), ErrorKind::NotEnoughRowsAvailable);
}

TEST_F(KeygenAssemblyTest, WritesOutsideUsableRowsFail) {
    keygen::Assembly assembly(4, cs_);
    assembly.begin_synthesis();

    EXPECT_EQ(thrown_kind([&] { assembly.assign_fixed("f", f_, 11, [] { return known(1); }); }),
              ErrorKind::NotEnoughRowsAvailable);
    EXPECT_EQ(thrown_kind([&] { assembly.enable_selector("s", s_, 15); }),
              ErrorKind::NotEnoughRowsAvailable);
    EXPECT_EQ(thrown_kind([&] { assembly.copy(a_, 0, f_, 12); }),
              ErrorKind::NotEnoughRowsAvailable);
    EXPECT_EQ(thrown_kind([&] { assembly.query_instance(i_, 11); }),
              ErrorKind::NotEnoughRowsAvailable);
}

TEST_F(KeygenAssemblyTest, AdviceAndInstanceAreIgnored) {
    keygen::Assembly assembly(4, cs_);
    assembly.begin_synthesis();

    bool called = false;
    assembly.assign_advice("a", a_, 3, [&called] {
        called = true;
        return known(5);
    });
    EXPECT_FALSE(called);
    EXPECT_EQ(assembly.query_advice(a_, 3), Fp::zero());
    EXPECT_FALSE(assembly.query_instance(i_, 0).is_known());
    EXPECT_FALSE(assembly.get_challenge(Challenge()).is_known());
}

TEST_F(KeygenAssemblyTest, FixedValuesMustBeKnown) {
    keygen::Assembly assembly(4, cs_);
    assembly.begin_synthesis();
    EXPECT_EQ(thrown_kind([&] {
        assembly.assign_fixed("f", f_, 0, [] { return Value<Assigned>::unknown(); });
    }), ErrorKind::Synthesis);
}

TEST_F(KeygenAssemblyTest, UnknownFixedColumnIsBoundsFailure) {
    keygen::Assembly assembly(4, cs_);
    assembly.begin_synthesis();
    EXPECT_EQ(thrown_kind([&] { assembly.assign_fixed("f", FixedColumn(7), 0, [] { return known(1); }); }),
              ErrorKind::BoundsFailure);
    EXPECT_EQ(thrown_kind([&] { assembly.fill_from_row(FixedColumn(7), 0, known(1)); }),
              ErrorKind::BoundsFailure);
}

TEST_F(KeygenAssemblyTest, SealedAssemblyRejectsWrites) {
    keygen::Assembly assembly(4, cs_);
    EXPECT_EQ(thrown_kind([&] { assembly.assign_fixed("f", f_, 0, [] { return known(1); }); }),
              ErrorKind::Synthesis);

    assembly.begin_synthesis();
    assembly.assign_fixed("f", f_, 0, [] { return known(1); });
    assembly.seal();

    EXPECT_EQ(assembly.phase(), SynthesisPhase::Sealed);
    EXPECT_EQ(thrown_kind([&] { assembly.assign_fixed("f", f_, 1, [] { return known(1); }); }),
              ErrorKind::Synthesis);
    EXPECT_EQ(thrown_kind([&] { assembly.enable_selector("s", s_, 1); }), ErrorKind::Synthesis);
    EXPECT_EQ(thrown_kind([&] { assembly.copy(a_, 0, f_, 0); }), ErrorKind::Synthesis);
    EXPECT_EQ(thrown_kind([&] { assembly.fork({RowRange(0, 2)}); }), ErrorKind::Synthesis);
    EXPECT_EQ(thrown_kind([&] { assembly.begin_synthesis(); }), ErrorKind::Synthesis);
}

TEST_F(KeygenAssemblyTest, ReleaseRequiresSealedPass) {
    keygen::Assembly assembly(4, cs_);
    assembly.begin_synthesis();
    EXPECT_EQ(thrown_kind([&] { std::move(assembly).release(); }), ErrorKind::Synthesis);
}

TEST_F(KeygenAssemblyTest, ForkRejectsMalformedRanges) {
    keygen::Assembly assembly(4, cs_);
    assembly.begin_synthesis();

    // Overlapping
    EXPECT_EQ(thrown_kind([&] { assembly.fork({RowRange(0, 4), RowRange(3, 6)}); }), ErrorKind::Synthesis);
    // Decreasing
    EXPECT_EQ(thrown_kind([&] { assembly.fork({RowRange(4, 6), RowRange(0, 2)}); }), ErrorKind::Synthesis);
    // Inverted
    EXPECT_EQ(thrown_kind([&] { assembly.fork({RowRange(5, 3)}); }), ErrorKind::Synthesis);
    // Past the read/write window
    EXPECT_EQ(thrown_kind([&] { assembly.fork({RowRange(8, 12)}); }), ErrorKind::Synthesis);

    // Nothing was lent by the failed attempts
    EXPECT_NO_THROW(assembly.assign_fixed("f", f_, 4, [] { return known(1); }));
}

TEST_F(KeygenAssemblyTest, ForkedWindowsAreExclusive) {
    keygen::Assembly assembly(4, cs_);
    assembly.begin_synthesis();

    auto sub_cs = assembly.fork({RowRange(0, 3), RowRange(3, 5)});
    ASSERT_EQ(sub_cs.size(), 2u);

    // The parent cannot touch lent rows
    EXPECT_EQ(thrown_kind([&] { assembly.assign_fixed("f", f_, 1, [] { return known(1); }); }),
              ErrorKind::Synthesis);
    EXPECT_EQ(thrown_kind([&] { assembly.enable_selector("s", s_, 4); }), ErrorKind::Synthesis);

    // Sub-assemblies cannot touch each other's rows
    EXPECT_EQ(thrown_kind([&] { sub_cs[0]->assign_fixed("f", f_, 3, [] { return known(1); }); }),
              ErrorKind::Synthesis);
    EXPECT_EQ(thrown_kind([&] { sub_cs[1]->enable_selector("s", s_, 2); }), ErrorKind::Synthesis);

    sub_cs[0]->assign_fixed("f", f_, 2, [] { return known(7); });
    sub_cs[1]->enable_selector("s", s_, 4);
    sub_cs[1]->copy(a_, 4, f_, 2);

    auto* sub = dynamic_cast<keygen::Assembly*>(sub_cs[1].get());
    ASSERT_NE(sub, nullptr);
    EXPECT_EQ(sub->buffered_copies().size(), 1u);
    EXPECT_EQ(sub->permutation(), nullptr);

    assembly.merge(std::move(sub_cs));

    EXPECT_EQ(assembly.query_fixed(f_, 2), Fp(7));
    EXPECT_TRUE(assembly.selectors().get(s_.index, 4));
    ASSERT_NE(assembly.permutation(), nullptr);
    EXPECT_TRUE(assembly.permutation()->same_cycle(CopyCell{a_, 4}, CopyCell{f_, 2}));
}

TEST_F(KeygenAssemblyTest, FillFromRowCoversUsableRows) {
    keygen::Assembly assembly(4, cs_);
    assembly.begin_synthesis();
    assembly.fill_from_row(f_, 6, known(3));
    EXPECT_EQ(assembly.query_fixed(f_, 5), Fp::zero());
    EXPECT_EQ(assembly.query_fixed(f_, 6), Fp(3));
    EXPECT_EQ(assembly.query_fixed(f_, 10), Fp(3));
    EXPECT_EQ(assembly.fixed().get(f_.index, 11).evaluate(), Fp::zero());
}

TEST_F(KeygenAssemblyTest, SubAssemblyCannotFillPastItsWindow) {
    keygen::Assembly assembly(4, cs_);
    assembly.begin_synthesis();

    auto sub_cs = assembly.fork({RowRange(2, 5)});
    EXPECT_EQ(thrown_kind([&] { sub_cs[0]->fill_from_row(f_, 3, known(1)); }), ErrorKind::Synthesis);
    assembly.merge(std::move(sub_cs));

    EXPECT_EQ(assembly.query_fixed(f_, 3), Fp::zero());
    EXPECT_EQ(assembly.query_fixed(f_, 10), Fp::zero());
}

TEST_F(KeygenAssemblyTest, GridSizeIsBounded) {
    EXPECT_EQ(grid_rows(4), 16u);
    EXPECT_EQ(grid_rows(MAX_K), size_t(1) << MAX_K);
    EXPECT_EQ(thrown_kind([] { grid_rows(MAX_K + 1); }), ErrorKind::BoundsFailure);
    EXPECT_EQ(thrown_kind([] { grid_rows(64); }), ErrorKind::BoundsFailure);
    EXPECT_EQ(thrown_kind([&] { keygen::Assembly assembly(70, cs_); }), ErrorKind::BoundsFailure);
}

class KeygenTest : public ::testing::Test {};

TEST_F(KeygenTest, VerifyingKeyHoldsEvaluatedFixedData) {
    VerifyingKey vk = keygen_vk(4, CoefficientCircuit{});

    EXPECT_EQ(vk.k, 4u);
    ASSERT_EQ(vk.fixed.size(), 2u);
    ASSERT_EQ(vk.fixed[0].size(), 16u);
    const Fp half = Fp(2).inverse();
    for (size_t row = 0; row < 4; ++row) {
        EXPECT_EQ(vk.fixed[0][row], Fp(row + 1) * half) << row;
    }
    EXPECT_EQ(vk.fixed[0][4], Fp::zero());

    // Constant 1 consolidated to row 0 of the constants column
    EXPECT_EQ(vk.fixed[1][0], Fp::one());

    ASSERT_EQ(vk.selectors.size(), 1u);
    EXPECT_TRUE(vk.selectors[0][3]);
    EXPECT_FALSE(vk.selectors[0][4]);

    ASSERT_EQ(vk.copies.size(), 1u);
    EXPECT_EQ(vk.copies[0].first, (CopyCell{FixedColumn(1), 0}));
    EXPECT_EQ(vk.copies[0].second, (CopyCell{AdviceColumn(0), 4}));
    EXPECT_EQ(vk.permutation_columns.size(), 2u);
}

TEST_F(KeygenTest, TooSmallGridIsRejectedBeforeSynthesis) {
    try {
        keygen_vk(2, CoefficientCircuit{});
        FAIL() << "expected NotEnoughRowsAvailable";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotEnoughRowsAvailable);
        EXPECT_EQ(e.current_k(), 2u);
    }
}

TEST_F(KeygenTest, OversizedGridIsRejected) {
    EXPECT_EQ(thrown_kind([] { keygen_vk(40, CoefficientCircuit{}); }), ErrorKind::BoundsFailure);
}

TEST_F(KeygenTest, ProvingKeyLagrangeVectors) {
    ProvingKey pk = keygen_pk(keygen_vk(4, CoefficientCircuit{}));
    const size_t n = 16;
    const size_t blinding = pk.vk.cs.blinding_factors();
    ASSERT_EQ(blinding, 4u);

    ASSERT_EQ(pk.l0.size(), n);
    EXPECT_EQ(pk.l0[0], Fp::one());
    EXPECT_EQ(pk.l0[1], Fp::zero());

    for (size_t row = 0; row < n; ++row) {
        const bool blind = row >= n - blinding;
        const bool last = row == n - blinding - 1;
        EXPECT_EQ(pk.l_blind[row], blind ? Fp::one() : Fp::zero()) << row;
        EXPECT_EQ(pk.l_last[row], last ? Fp::one() : Fp::zero()) << row;
        EXPECT_EQ(pk.l_active_row[row], (blind || last) ? Fp::zero() : Fp::one()) << row;
    }
}
