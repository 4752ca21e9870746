#include <gtest/gtest.h>
#include "dev/mock_prover.hpp"
#include "floor_planner/single_pass.hpp"
#include "plonk/keygen.hpp"
#include "test_helpers.hpp"

using namespace plonkish;
using plonkish::testing::known;
using plonkish::testing::thrown_kind;

namespace {

// One advice column, no constants column, one constant
struct ConstantWithoutColumnCircuit {
    struct Config {
        AdviceColumn a;
    };

    static Config configure(ConstraintSystem& cs) {
        Config config;
        config.a = cs.advice_column();
        cs.enable_equality(config.a);
        return config;
    }

    void synthesize(const Config& config, SingleChipLayouter& layouter) const {
        layouter.assign_region("constant", [&config](Region& region) {
            region.assign_advice_from_constant("one", config.a, 0, Fp::one());
        });
    }
};

// Writes rows [0, rows) of one advice and one fixed column
struct TallRegionCircuit {
    struct Config {
        AdviceColumn a;
        FixedColumn f;
    };

    size_t rows = 1;

    static Config configure(ConstraintSystem& cs) {
        Config config;
        config.a = cs.advice_column();
        config.f = cs.fixed_column();
        return config;
    }

    void synthesize(const Config& config, SingleChipLayouter& layouter) const {
        layouter.assign_region("tall", [&](Region& region) {
            for (size_t row = 0; row < rows; ++row) {
                region.assign_advice("cell", config.a, row, [row] { return known(row); });
                region.assign_fixed("fixed", config.f, row, [row] { return known(row); });
            }
        });
    }
};

// Constants 5 and 6 from one region, then 7 from a second
struct ConstantsCircuit {
    struct Config {
        AdviceColumn a;
        FixedColumn constants;
    };

    static Config configure(ConstraintSystem& cs) {
        Config config;
        config.a = cs.advice_column();
        config.constants = cs.fixed_column();
        cs.enable_equality(config.a);
        cs.enable_constant(config.constants);
        return config;
    }

    void synthesize(const Config& config, SingleChipLayouter& layouter) const {
        layouter.assign_region("first", [&config](Region& region) {
            region.assign_advice_from_constant("five", config.a, 0, Fp(5));
            region.assign_advice_from_constant("six", config.a, 1, Fp(6));
        });
        layouter.assign_region("second", [&config](Region& region) {
            AssignedCell cell = region.assign_advice("seven", config.a, 0, [] { return known(7); });
            region.constrain_constant(cell.cell(), Fp(7));
        });
    }
};

} // namespace

class SinglePassTest : public ::testing::Test {
protected:
    void SetUp() override {
        x_ = cs_.advice_column();
        y_ = cs_.advice_column();
        z_ = cs_.advice_column();
        s_ = cs_.selector();
        cs_.enable_equality(x_);
        cs_.enable_equality(y_);
        cs_.enable_equality(z_);
    }

    ConstraintSystem cs_;
    AdviceColumn x_, y_, z_;
    Selector s_;
};

TEST_F(SinglePassTest, SharedColumnPlacesSecondRegionAfterFirst) {
    dev::MockProver prover(4, cs_, {});
    prover.begin_synthesis();
    SingleChipLayouter layouter(prover, {});

    layouter.assign_region("A", [&](Region& region) {
        for (size_t row = 0; row < 3; ++row) {
            region.assign_advice("x", x_, row, [] { return known(1); });
            region.assign_advice("y", y_, row, [] { return known(2); });
        }
    });
    layouter.assign_region("B", [&](Region& region) {
        for (size_t row = 0; row < 2; ++row) {
            region.assign_advice("y", y_, row, [] { return known(3); });
            region.assign_advice("z", z_, row, [] { return known(4); });
        }
    });

    EXPECT_EQ(layouter.region_starts(), (std::vector<size_t>{0, 3}));
    EXPECT_EQ(prover.advice_cell(y_, 3).value, Fp(3));
    EXPECT_EQ(prover.advice_cell(y_, 2).value, Fp(2));
    EXPECT_EQ(prover.advice_cell(z_, 0).state, dev::CellValue::State::Unassigned);
}

TEST_F(SinglePassTest, SelectorsOccupyRowsLikeColumns) {
    dev::MockProver prover(4, cs_, {});
    prover.begin_synthesis();
    SingleChipLayouter layouter(prover, {});

    layouter.assign_region("gate", [&](Region& region) {
        region.enable_selector("s", s_, 0);
        region.enable_selector("s", s_, 1);
        region.assign_advice("x", x_, 0, [] { return known(1); });
    });
    layouter.assign_region("gate again", [&](Region& region) {
        region.enable_selector("s", s_, 0);
        region.assign_advice("z", z_, 0, [] { return known(1); });
    });

    EXPECT_EQ(layouter.region_starts(), (std::vector<size_t>{0, 2}));
    EXPECT_TRUE(prover.selector_enabled(s_, 2));
    EXPECT_FALSE(prover.selector_enabled(s_, 3));
}

TEST_F(SinglePassTest, RoutineReturnValueIsForwarded) {
    dev::MockProver prover(4, cs_, {});
    prover.begin_synthesis();
    SingleChipLayouter layouter(prover, {});

    AssignedCell first = layouter.assign_region("first", [&](Region& region) {
        return region.assign_advice("x", x_, 1, [] { return known(11); });
    });
    AssignedCell second = layouter.assign_region("second", [&](Region& region) {
        return first.copy_advice("copy", region, x_, 0);
    });

    EXPECT_EQ(first.cell().region_index, 0u);
    EXPECT_EQ(second.cell().region_index, 1u);
    EXPECT_EQ(layouter.region_starts()[1], 2u);
    ASSERT_TRUE(second.value().is_known());
    EXPECT_EQ(second.value().get().evaluate(), Fp(11));

    ASSERT_NE(prover.permutation(), nullptr);
    ASSERT_EQ(prover.permutation()->copies().size(), 1u);
    EXPECT_TRUE(prover.permutation()->same_cycle(CopyCell{x_, 1}, CopyCell{x_, 2}));
}

TEST_F(SinglePassTest, QueriesSeeMaterializedValues) {
    dev::MockProver prover(4, cs_, {});
    prover.begin_synthesis();
    SingleChipLayouter layouter(prover, {});

    layouter.assign_region("pad", [&](Region& region) {
        region.assign_advice("x", x_, 0, [] { return known(1); });
    });
    // The materializing pass runs last
    Fp seen;
    size_t offset = 0;
    layouter.assign_region("read back", [&](Region& region) {
        region.assign_advice("x", x_, 0, [] { return known(99); });
        seen = region.query_advice(x_, 0);
        offset = region.global_offset(0);
    });
    EXPECT_EQ(seen, Fp(99));
    EXPECT_EQ(offset, 1u);
}

TEST_F(SinglePassTest, FailedRegionIsClosed) {
    dev::MockProver prover(4, cs_, {});
    prover.begin_synthesis();
    SingleChipLayouter layouter(prover, {});

    int calls = 0;
    EXPECT_EQ(thrown_kind([&] {
        layouter.assign_region("fails", [&](Region& region) {
            region.assign_advice("x", x_, 0, [] { return known(1); });
            // Only the materializing pass fails
            if (++calls == 2) {
                throw Error::synthesis("routine failed");
            }
        });
    }), ErrorKind::Synthesis);
    EXPECT_EQ(calls, 2);

    AssignedCell cell = layouter.assign_region("next", [&](Region& region) {
        return region.assign_advice("x", x_, 0, [] { return known(2); });
    });
    EXPECT_EQ(cell.cell().region_index, 1u);
    ASSERT_EQ(prover.regions().size(), 2u);
    EXPECT_EQ(prover.regions()[0].name, "fails");
    EXPECT_EQ(prover.regions()[1].name, "next");
    EXPECT_EQ(prover.advice_cell(x_, 1).value, Fp(2));
}

TEST_F(SinglePassTest, ConstantWithoutConstantsColumnFails) {
    EXPECT_EQ(thrown_kind([] { dev::MockProver::run(3, ConstantWithoutColumnCircuit{}, {}); }),
              ErrorKind::NotEnoughColumnsForConstants);
    EXPECT_EQ(thrown_kind([] { keygen_vk(3, ConstantWithoutColumnCircuit{}); }),
              ErrorKind::NotEnoughColumnsForConstants);
}

TEST_F(SinglePassTest, GridBelowMinimumRowsReportsK) {
    try {
        dev::MockProver::run(2, TallRegionCircuit{}, {});
        FAIL() << "expected NotEnoughRowsAvailable";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotEnoughRowsAvailable);
        EXPECT_EQ(e.current_k(), 2u);
    }
}

TEST_F(SinglePassTest, RegionPastUsableRowsReportsK) {
    // k = 3: 8 rows, 4 blinding + 1 reserved, 3 usable
    TallRegionCircuit fits;
    fits.rows = 3;
    EXPECT_NO_THROW(dev::MockProver::run(3, fits, {}));

    TallRegionCircuit too_tall;
    too_tall.rows = 4;
    try {
        keygen_vk(3, too_tall);
        FAIL() << "expected NotEnoughRowsAvailable";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotEnoughRowsAvailable);
        EXPECT_EQ(e.current_k(), 3u);
    }
}

TEST_F(SinglePassTest, ConstantsAreConsolidatedInRequestOrder) {
    dev::MockProver prover = dev::MockProver::run(4, ConstantsCircuit{}, {});
    const FixedColumn constants = prover.constraint_system().constants()[0];

    EXPECT_EQ(prover.fixed_cell(constants, 0).value, Fp(5));
    EXPECT_EQ(prover.fixed_cell(constants, 1).value, Fp(6));
    EXPECT_EQ(prover.fixed_cell(constants, 2).value, Fp(7));
    EXPECT_FALSE(prover.fixed_cell(constants, 3).is_assigned());

    const AdviceColumn a(0);
    const auto& copies = prover.permutation()->copies();
    ASSERT_EQ(copies.size(), 3u);
    EXPECT_EQ(copies[0].first, (CopyCell{constants, 0}));
    EXPECT_EQ(copies[0].second, (CopyCell{a, 0}));
    EXPECT_EQ(copies[2].first, (CopyCell{constants, 2}));
    EXPECT_EQ(copies[2].second, (CopyCell{a, 2}));
    EXPECT_TRUE(prover.verify().empty());
}

TEST_F(SinglePassTest, SynthesisIsDeterministic) {
    dev::MockProver first = dev::MockProver::run(4, ConstantsCircuit{}, {});
    dev::MockProver second = dev::MockProver::run(4, ConstantsCircuit{}, {});
    EXPECT_EQ(first.layout_json(), second.layout_json());

    VerifyingKey vk1 = keygen_vk(4, ConstantsCircuit{});
    VerifyingKey vk2 = keygen_vk(4, ConstantsCircuit{});
    EXPECT_EQ(vk1.fixed, vk2.fixed);
    EXPECT_EQ(vk1.permutation_mapping, vk2.permutation_mapping);
}

TEST_F(SinglePassTest, InstanceValuesAreCopiedIntoAdvice) {
    InstanceColumn instance = cs_.instance_column();
    cs_.enable_equality(instance);

    dev::MockProver prover(4, cs_, {{Fp(42), Fp(43)}});
    prover.begin_synthesis();
    SingleChipLayouter layouter(prover, {});

    AssignedCell cell = layouter.assign_region("public", [&](Region& region) {
        return region.assign_advice_from_instance("pub", instance, 1, x_, 0);
    });

    ASSERT_TRUE(cell.value().is_known());
    EXPECT_EQ(cell.value().get().evaluate(), Fp(43));
    EXPECT_EQ(prover.advice_cell(x_, 0).value, Fp(43));
    EXPECT_TRUE(prover.permutation()->same_cycle(CopyCell{x_, 0}, CopyCell{instance, 1}));

    layouter.constrain_instance(cell.cell(), instance, 0);
    // 43 != 42
    prover.seal();
    auto failures = prover.verify();
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0].kind, dev::VerifyFailure::Kind::Permutation);
}

TEST_F(SinglePassTest, CopyToColumnWithoutEqualityFails) {
    AdviceColumn plain = cs_.advice_column();
    dev::MockProver prover(4, cs_, {});
    prover.begin_synthesis();
    SingleChipLayouter layouter(prover, {});

    EXPECT_EQ(thrown_kind([&] {
        layouter.assign_region("bad copy", [&](Region& region) {
            AssignedCell a = region.assign_advice("x", x_, 0, [] { return known(1); });
            AssignedCell b = region.assign_advice("plain", plain, 0, [] { return known(1); });
            region.constrain_equal(a.cell(), b.cell());
        });
    }), ErrorKind::ColumnNotInPermutation);
}
