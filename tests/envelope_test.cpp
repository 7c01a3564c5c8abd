/**
 * @file envelope_test.cpp
 * @brief TI envelope math + leadfield contraction, the hot path of every candidate uwu
 */
#include <cmath>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "support/leadfield_fixtures.hpp"
#include "tio/field/envelope.hpp"

using testing::DoubleNear;
using testing::ElementsAre;
using testing::HasSubstr;
using tio::common::Vec3;

namespace
{

constexpr double kTolerance = 1e-12;

/// two electrodes, one element: +500 / -500 mV/mm along x
[[nodiscard]] auto dipole_leadfield() -> tio::leadfield::LeadfieldMatrix
{
    auto matrix = tio::leadfield::LeadfieldMatrix::create(2U, 1U, {500.0F, 0.0F, 0.0F, -500.0F, 0.0F, 0.0F});
    if (!matrix)
    {
        throw std::runtime_error(matrix.error().message);
    }
    return std::move(*matrix);
}

} // namespace

TEST(Envelope, IdenticalFieldsGiveTwiceTheMagnitude)
{
    EXPECT_NEAR(tio::field::envelope(Vec3{1.0, 2.0, 2.0}, Vec3{1.0, 2.0, 2.0}), 6.0, kTolerance);
    EXPECT_DOUBLE_EQ(tio::field::envelope(Vec3{0.0, 0.0, 0.0}, Vec3{0.0, 0.0, 0.0}), 0.0);
}

TEST(Envelope, AlignedFieldsAreLimitedByTheWeakerOne)
{
    EXPECT_NEAR(tio::field::envelope(Vec3{2.0, 0.0, 0.0}, Vec3{1.0, 0.0, 0.0}), 2.0, kTolerance);
    EXPECT_NEAR(tio::field::envelope(Vec3{0.0, 0.5, 0.0}, Vec3{0.0, 3.0, 0.0}), 1.0, kTolerance);
}

TEST(Envelope, AntiparallelFieldsAreFlippedFirst)
{
    EXPECT_NEAR(tio::field::envelope(Vec3{1.0, 0.0, 0.0}, Vec3{-1.0, 0.0, 0.0}), 2.0, kTolerance);
    EXPECT_NEAR(tio::field::envelope(Vec3{3.0, 0.0, 0.0}, Vec3{-1.0, 0.0, 0.0}), 2.0, kTolerance);
}

TEST(Envelope, OrthogonalEqualFieldsUseTheCrossProductBranch)
{
    EXPECT_NEAR(tio::field::envelope(Vec3{1.0, 0.0, 0.0}, Vec3{0.0, 1.0, 0.0}), std::sqrt(2.0), kTolerance);
}

TEST(Envelope, IsSymmetricAndNeverNegative)
{
    const std::vector<std::pair<Vec3, Vec3>> pairs{
        {Vec3{1.0, 0.2, -0.3}, Vec3{0.4, 0.9, 0.1}},
        {Vec3{-2.0, 1.0, 0.5}, Vec3{0.3, -0.7, 2.2}},
        {Vec3{0.0, 0.0, 1.0}, Vec3{1.0, 1.0, 0.0}},
        {Vec3{5.0, 5.0, 5.0}, Vec3{-0.1, 0.2, -0.1}},
    };
    for (const auto &[a, b] : pairs)
    {
        const auto ab = tio::field::envelope(a, b);
        EXPECT_NEAR(ab, tio::field::envelope(b, a), 1e-9);
        EXPECT_GE(ab, 0.0);
        EXPECT_LE(ab, 2.0 * std::min(tio::common::magnitude(a), tio::common::magnitude(b)) + 1e-9);
    }
}

TEST(Envelope, DegenerateInputsStayFinite)
{
    const Vec3 tiny{1e-300, 0.0, 0.0};
    const Vec3 unit{0.0, 1.0, 0.0};
    EXPECT_TRUE(std::isfinite(tio::field::envelope(tiny, unit)));
    EXPECT_TRUE(std::isfinite(tio::field::envelope(Vec3{0.0, 0.0, 0.0}, unit)));
    EXPECT_DOUBLE_EQ(tio::field::envelope(Vec3{0.0, 0.0, 0.0}, unit), 0.0);
}

TEST(Envelope, TiVectorMagnitudeMatchesEnvelope)
{
    const Vec3 a{1.0, 0.2, -0.3};
    const Vec3 b{0.4, 0.9, 0.1};
    EXPECT_NEAR(tio::common::magnitude(tio::field::ti_vector(a, b)), tio::field::envelope(a, b), 1e-12);
}

TEST(Envelope, FieldHelpersRejectLengthMismatch)
{
    const std::vector<Vec3> two{Vec3{1.0, 0.0, 0.0}, Vec3{0.0, 1.0, 0.0}};
    const std::vector<Vec3> one{Vec3{1.0, 0.0, 0.0}};
    const auto              field = tio::field::envelope_field(two, one);
    ASSERT_FALSE(field.has_value());
    EXPECT_THAT(field.error().message, HasSubstr("field length mismatch: 2 vs 1"));

    const auto mti = tio::field::mti_vectors(two, two, one, one);
    ASSERT_FALSE(mti.has_value());
}

TEST(Envelope, MultiChannelNestsTheTiVector)
{
    const std::vector<Vec3> e{Vec3{1.0, 0.0, 0.0}};
    const auto              mti = tio::field::mti_vectors(e, e, e, e);
    ASSERT_TRUE(mti.has_value()) << mti.error().message;
    // TI(e, e) = 2e, TI(2e, 2e) = 4e
    EXPECT_THAT(mti->front(), ElementsAre(DoubleNear(4.0, kTolerance), 0.0, 0.0));
}

TEST(LeadfieldContraction, DipoleGivesTwoVoltsPerMeter)
{
    const auto                leadfield = dipole_leadfield();
    const std::vector<double> stim{1.0, -1.0};
    const auto                envelope = tio::field::calculate_ti_field_from_leadfield(leadfield, stim, stim);
    ASSERT_TRUE(envelope.has_value()) << envelope.error().message;
    ASSERT_EQ(envelope->size(), 1U);
    EXPECT_NEAR(envelope->front(), 2.0, kTolerance);

    const auto field = tio::field::contract_leadfield(leadfield, stim);
    ASSERT_TRUE(field.has_value()) << field.error().message;
    EXPECT_THAT(field->front(), ElementsAre(DoubleNear(1.0, kTolerance), 0.0, 0.0));
}

TEST(LeadfieldContraction, ZeroStimulationGivesZeroField)
{
    const auto                bundle = tio::test_support::make_test_bundle(5U, 7U);
    const std::vector<double> zero(5U, 0.0);
    const auto envelope = tio::field::calculate_ti_field_from_leadfield(*bundle.leadfield, zero, zero);
    ASSERT_TRUE(envelope.has_value()) << envelope.error().message;
    EXPECT_THAT(*envelope, testing::Each(0.0));
}

TEST(LeadfieldContraction, SubsetFollowsIndexOrder)
{
    const auto                bundle = tio::test_support::make_test_bundle(4U, 6U);
    const std::vector<double> stim1{1.0, -1.0, 0.0, 0.0};
    const std::vector<double> stim2{0.0, 0.0, 0.5, -0.5};

    const auto full = tio::field::calculate_ti_field_from_leadfield(*bundle.leadfield, stim1, stim2);
    ASSERT_TRUE(full.has_value()) << full.error().message;

    const std::vector<std::size_t> subset{4U, 1U};
    const auto                     partial = tio::field::calculate_ti_field_from_leadfield(
        *bundle.leadfield, stim1, stim2, std::span<const std::size_t>{subset});
    ASSERT_TRUE(partial.has_value()) << partial.error().message;
    ASSERT_EQ(partial->size(), 2U);
    EXPECT_DOUBLE_EQ((*partial)[0], (*full)[4]);
    EXPECT_DOUBLE_EQ((*partial)[1], (*full)[1]);
}

TEST(LeadfieldContraction, ReportsStimAndIndexErrors)
{
    const auto                bundle = tio::test_support::make_test_bundle(4U, 3U);
    const std::vector<double> short_stim{1.0, -1.0};
    const auto                wrong = tio::field::contract_leadfield(*bundle.leadfield, short_stim);
    ASSERT_FALSE(wrong.has_value());
    EXPECT_THAT(wrong.error().message, HasSubstr("2 entries, leadfield has 4 electrodes"));

    const std::vector<double>      stim{1.0, -1.0, 0.0, 0.0};
    const std::vector<std::size_t> out_of_range{0U, 3U};
    const auto                     bad_index =
        tio::field::contract_leadfield(*bundle.leadfield, stim, std::span<const std::size_t>{out_of_range});
    ASSERT_FALSE(bad_index.has_value());
    EXPECT_THAT(bad_index.error().context, ElementsAre("contract_leadfield", "indices[1]"));
}
