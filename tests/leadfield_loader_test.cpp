/**
 * @file leadfield_loader_test.cpp
 * @brief .npy decoding + manifest loading, the data door of every search uwu
 */
#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "support/leadfield_fixtures.hpp"
#include "test_config.hpp"
#include "tio/leadfield/leadfield.hpp"
#include "tio/leadfield/npy.hpp"

using testing::ElementsAre;
using testing::FloatEq;
using testing::HasSubstr;
using tio::test_support::ScopedTempDir;
using tio::test_support::write_npy;
using tio::test_support::write_text;

namespace
{

/// leadfield [3 electrodes, 2 elements, 3]: value = 100 e + 10 k + axis
[[nodiscard]] auto indexed_leadfield() -> std::vector<float>
{
    std::vector<float> values;
    for (int e = 0; e < 3; ++e)
    {
        for (int k = 0; k < 2; ++k)
        {
            for (int axis = 0; axis < 3; ++axis)
            {
                values.push_back(static_cast<float>((100 * e) + (10 * k) + axis));
            }
        }
    }
    return values;
}

void write_array_manifest(const ScopedTempDir &dir, bool with_optional_channels)
{
    write_npy<float>(dir / "leadfield.npy", {3U, 2U, 3U}, indexed_leadfield());
    write_npy<double>(dir / "centers.npy", {2U, 3U}, {0.0, 1.0, 2.0, 3.0, 4.0, 5.0});
    std::string manifest = "leadfield: leadfield.npy\n"
                           "electrodes: [Fp1, Cz, O2]\n"
                           "grid:\n"
                           "  centers: centers.npy\n";
    if (with_optional_channels)
    {
        write_npy<double>(dir / "volumes.npy", {2U}, {0.5, 1.5});
        write_npy<std::int32_t>(dir / "tags.npy", {2U}, {1, 2});
        write_npy<std::int64_t>(dir / "atlas.npy", {2U}, {11, 42});
        manifest += "  volumes: volumes.npy\n"
                    "  tags: tags.npy\n"
                    "  atlas: atlas.npy\n";
    }
    write_text(dir / "manifest.yaml", manifest);
}

} // namespace

TEST(NpyHeader, ParsesNumpyDictionaries)
{
    const auto header = tio::leadfield::parse_npy_header("{'descr': '<f4', 'fortran_order': False, 'shape': (7, 5, 3), }");
    ASSERT_TRUE(header.has_value()) << header.error().message;
    EXPECT_EQ(header->kind, 'f');
    EXPECT_EQ(header->item_size, 4U);
    EXPECT_FALSE(header->fortran_order);
    EXPECT_THAT(header->shape, ElementsAre(7U, 5U, 3U));
    EXPECT_EQ(header->element_count(), 105U);

    const auto vector = tio::leadfield::parse_npy_header("{'descr': '<i8', 'fortran_order': False, 'shape': (4,), }");
    ASSERT_TRUE(vector.has_value()) << vector.error().message;
    EXPECT_THAT(vector->shape, ElementsAre(4U));

    const auto scalar = tio::leadfield::parse_npy_header("{'descr': '|u1', 'fortran_order': False, 'shape': (), }");
    ASSERT_TRUE(scalar.has_value()) << scalar.error().message;
    EXPECT_TRUE(scalar->shape.empty());
    EXPECT_EQ(scalar->element_count(), 1U);
}

TEST(NpyHeader, RejectsBigEndianAndUnknownKinds)
{
    const auto big = tio::leadfield::parse_npy_header("{'descr': '>f8', 'fortran_order': False, 'shape': (2,), }");
    ASSERT_FALSE(big.has_value());
    EXPECT_THAT(big.error().message, HasSubstr("big-endian"));

    const auto complex = tio::leadfield::parse_npy_header("{'descr': '<c16', 'fortran_order': False, 'shape': (2,), }");
    ASSERT_FALSE(complex.has_value());
    EXPECT_THAT(complex.error().message, HasSubstr("unsupported npy dtype kind"));

    const auto no_shape = tio::leadfield::parse_npy_header("{'descr': '<f8', 'fortran_order': False, }");
    ASSERT_FALSE(no_shape.has_value());
    EXPECT_THAT(no_shape.error().context, ElementsAre("shape"));
}

TEST(NpyLoader, ConvertsDtypesOnLoad)
{
    const ScopedTempDir dir{"npy_dtype"};
    write_npy<std::int64_t>(dir / "ints.npy", {2U, 2U}, {1, -2, 3, 4});

    const auto as_double = tio::leadfield::load_npy_f64(dir / "ints.npy");
    ASSERT_TRUE(as_double.has_value()) << as_double.error().message;
    EXPECT_THAT(as_double->shape, ElementsAre(2U, 2U));
    EXPECT_THAT(as_double->values, ElementsAre(1.0, -2.0, 3.0, 4.0));

    write_npy<double>(dir / "fractional.npy", {2U}, {1.0, 2.5});
    const auto as_int = tio::leadfield::load_npy_i32(dir / "fractional.npy");
    ASSERT_FALSE(as_int.has_value());
    EXPECT_THAT(as_int.error().message, HasSubstr("non-integer value"));
    EXPECT_THAT(as_int.error().context, ElementsAre((dir / "fractional.npy").string(), "[1]"));
}

TEST(NpyLoader, RejectsBadMagicAndTruncatedPayload)
{
    const ScopedTempDir dir{"npy_bad"};
    write_text(dir / "text.npy", "definitely not numpy");
    const auto bad_magic = tio::leadfield::load_npy_f32(dir / "text.npy");
    ASSERT_FALSE(bad_magic.has_value());
    EXPECT_THAT(bad_magic.error().message, HasSubstr("bad magic"));

    // header promises 4 floats, payload holds 2
    write_npy<float>(dir / "short.npy", {4U}, {1.0F, 2.0F});
    const auto truncated = tio::leadfield::load_npy_f32(dir / "short.npy");
    ASSERT_FALSE(truncated.has_value());
    EXPECT_THAT(truncated.error().message, HasSubstr("truncated .npy payload"));
}

TEST(NpyHeader, RejectsShapesThatOverflowSize)
{
    // 6148914691236517206 * 3 wraps a 64-bit size_t to 2
    const auto wrapped = tio::leadfield::parse_npy_header(
        "{'descr': '<f8', 'fortran_order': False, 'shape': (6148914691236517206, 3), }");
    ASSERT_FALSE(wrapped.has_value());
    EXPECT_THAT(wrapped.error().message, HasSubstr("overflows the addressable size"));
    EXPECT_THAT(wrapped.error().context, ElementsAre("shape"));

    const auto long_dim = tio::leadfield::parse_npy_header(
        "{'descr': '<f4', 'fortran_order': False, 'shape': (184467440737095516160,), }");
    ASSERT_FALSE(long_dim.has_value());
    EXPECT_THAT(long_dim.error().message, HasSubstr("dimension overflows"));
}

TEST(NpyLoader, LyingShapeFailsBeforeAllocating)
{
    const ScopedTempDir dir{"npy_lying_shape"};
    const std::string   payload(16U, '\0');
    tio::test_support::write_raw_npy(
        dir / "wrapped.npy", "{'descr': '<f4', 'fortran_order': False, 'shape': (6148914691236517206, 3, 3), }",
        payload);
    write_npy<double>(dir / "centers.npy", {2U, 3U}, {0.0, 1.0, 2.0, 3.0, 4.0, 5.0});
    write_text(dir / "manifest.yaml", "leadfield: wrapped.npy\n"
                                      "electrodes: [Fp1, Cz]\n"
                                      "grid:\n  centers: centers.npy\n");

    const auto wrapped = tio::leadfield::load_leadfield_bundle(dir / "manifest.yaml");
    ASSERT_FALSE(wrapped.has_value());
    EXPECT_THAT(wrapped.error().message, HasSubstr("overflows"));
    EXPECT_THAT(wrapped.error().context, testing::Contains((dir / "wrapped.npy").string()));

    // a billion rows promised, sixteen bytes delivered
    tio::test_support::write_raw_npy(
        dir / "huge.npy", "{'descr': '<f4', 'fortran_order': False, 'shape': (1000000000, 2, 3), }", payload);
    const auto huge = tio::leadfield::load_npy_f32(dir / "huge.npy");
    ASSERT_FALSE(huge.has_value());
    EXPECT_THAT(huge.error().message, HasSubstr("truncated .npy payload (expected 24000000000 bytes, found 16)"));
}

TEST(NpyLoader, RejectsTrailingBytes)
{
    const ScopedTempDir dir{"npy_trailing"};
    // header promises 2 floats, payload holds 3
    write_npy<float>(dir / "long.npy", {2U}, {1.0F, 2.0F, 3.0F});
    const auto trailing = tio::leadfield::load_npy_f32(dir / "long.npy");
    ASSERT_FALSE(trailing.has_value());
    EXPECT_THAT(trailing.error().message, HasSubstr("4 trailing bytes after .npy payload of 8 bytes"));
}

TEST(LeadfieldMatrix, ValidatesShapeAndFiniteness)
{
    auto ok = tio::leadfield::LeadfieldMatrix::create(2U, 1U, {1.0F, 2.0F, 3.0F, 4.0F, 5.0F, 6.0F});
    ASSERT_TRUE(ok.has_value()) << ok.error().message;
    EXPECT_THAT(ok->at(1U, 0U), ElementsAre(4.0, 5.0, 6.0));
    const auto row = ok->row(0U);
    EXPECT_THAT(std::vector<float>(row.begin(), row.end()), ElementsAre(FloatEq(1.0F), FloatEq(2.0F), FloatEq(3.0F)));

    const auto wrong_size = tio::leadfield::LeadfieldMatrix::create(2U, 2U, {1.0F, 2.0F, 3.0F});
    ASSERT_FALSE(wrong_size.has_value());
    EXPECT_THAT(wrong_size.error().message, HasSubstr("shape [2, 2, 3] needs 12"));

    const auto empty = tio::leadfield::LeadfieldMatrix::create(0U, 2U, {});
    ASSERT_FALSE(empty.has_value());

    const auto nan = tio::leadfield::LeadfieldMatrix::create(
        1U, 1U, {0.0F, std::numeric_limits<float>::quiet_NaN(), 0.0F});
    ASSERT_FALSE(nan.has_value());
    EXPECT_THAT(nan.error().context, ElementsAre("leadfield", "[1]"));
}

TEST(ElectrodeIndex, LooksUpRowsAndRejectsDuplicates)
{
    const auto index = tio::leadfield::ElectrodeIndex::create({"Fp1", "Cz", "O2"});
    ASSERT_TRUE(index.has_value()) << index.error().message;
    EXPECT_EQ(index->size(), 3U);
    EXPECT_EQ(index->find("Cz"), std::optional<std::size_t>{1U});
    EXPECT_FALSE(index->find("cz").has_value());
    EXPECT_EQ(index->name(2U), "O2");

    const auto duplicate = tio::leadfield::ElectrodeIndex::create({"Fp1", "Cz", "Fp1"});
    ASSERT_FALSE(duplicate.has_value());
    EXPECT_THAT(duplicate.error().message, HasSubstr("duplicate electrode name 'Fp1'"));
    EXPECT_THAT(duplicate.error().context, ElementsAre("electrodes", "[2]"));
}

TEST(LeadfieldBundle, LoadsArrayManifestWithAllChannels)
{
    const ScopedTempDir dir{"manifest_full"};
    write_array_manifest(dir, true);

    const auto bundle = tio::leadfield::load_leadfield_bundle(dir / "manifest.yaml");
    ASSERT_TRUE(bundle.has_value()) << bundle.error().message;
    EXPECT_EQ(bundle->leadfield->electrode_count(), 3U);
    EXPECT_EQ(bundle->leadfield->element_count(), 2U);
    EXPECT_THAT(bundle->leadfield->at(2U, 1U), ElementsAre(210.0, 211.0, 212.0));
    EXPECT_EQ(bundle->electrodes.find("O2"), std::optional<std::size_t>{2U});

    const auto &grid = *bundle->grid;
    EXPECT_THAT(grid.centers[1], ElementsAre(3.0, 4.0, 5.0));
    EXPECT_THAT(grid.volumes, ElementsAre(0.5, 1.5));
    EXPECT_THAT(grid.tags, ElementsAre(1, 2));
    ASSERT_TRUE(grid.atlas_labels.has_value());
    EXPECT_THAT(*grid.atlas_labels, ElementsAre(11, 42));
}

TEST(LeadfieldBundle, MissingOptionalChannelsFallBackToDefaults)
{
    const ScopedTempDir dir{"manifest_defaults"};
    write_array_manifest(dir, false);

    const auto bundle = tio::leadfield::load_leadfield_bundle(dir / "manifest.yaml");
    ASSERT_TRUE(bundle.has_value()) << bundle.error().message;
    EXPECT_THAT(bundle->grid->volumes, ElementsAre(1.0, 1.0));
    EXPECT_THAT(bundle->grid->tags, ElementsAre(2, 2));
    EXPECT_FALSE(bundle->grid->atlas_labels.has_value());
}

TEST(LeadfieldBundle, BuildsGridFromGmshMesh)
{
    const ScopedTempDir dir{"manifest_mesh"};
    write_npy<float>(dir / "leadfield.npy", {4U, 2U, 3U}, tio::test_support::make_varied_values(4U, 2U));
    const auto mesh_path = std::filesystem::path{TIO_TEST_DATA_DIR} / "two_tissue.msh";
    write_text(dir / "manifest.yaml", "leadfield: leadfield.npy\n"
                                      "electrodes: [E001, E002, E003, E004]\n"
                                      "grid:\n"
                                      "  mesh: " + mesh_path.string() + "\n");

    const auto bundle = tio::leadfield::load_leadfield_bundle(dir / "manifest.yaml");
    ASSERT_TRUE(bundle.has_value()) << bundle.error().message;
    EXPECT_THAT(bundle->grid->tags, ElementsAre(2, 1));
    EXPECT_NEAR(bundle->grid->volumes[1], 1.0 / 3.0, 1e-12);
}

TEST(LeadfieldBundle, ReportsInconsistentManifests)
{
    const ScopedTempDir dir{"manifest_bad"};
    write_array_manifest(dir, false);

    write_text(dir / "names.yaml", "leadfield: leadfield.npy\n"
                                   "electrodes: [Fp1, Cz]\n"
                                   "grid:\n  centers: centers.npy\n");
    const auto names = tio::leadfield::load_leadfield_bundle(dir / "names.yaml");
    ASSERT_FALSE(names.has_value());
    EXPECT_THAT(names.error().message, HasSubstr("2 electrode names for 3 leadfield rows"));

    write_npy<double>(dir / "centers3.npy", {3U, 3U}, std::vector<double>(9U, 0.0));
    write_text(dir / "grid.yaml", "leadfield: leadfield.npy\n"
                                  "electrodes: [Fp1, Cz, O2]\n"
                                  "grid:\n  centers: centers3.npy\n");
    const auto grid = tio::leadfield::load_leadfield_bundle(dir / "grid.yaml");
    ASSERT_FALSE(grid.has_value());
    EXPECT_THAT(grid.error().message, HasSubstr("grid has 3 elements but leadfield has 2"));

    write_npy<float>(dir / "flat.npy", {3U, 6U}, indexed_leadfield());
    write_text(dir / "flat.yaml", "leadfield: flat.npy\n"
                                  "electrodes: [Fp1, Cz, O2]\n"
                                  "grid:\n  centers: centers.npy\n");
    const auto flat = tio::leadfield::load_leadfield_bundle(dir / "flat.yaml");
    ASSERT_FALSE(flat.has_value());
    EXPECT_THAT(flat.error().message, HasSubstr("[n_electrodes, n_elements, 3]"));

    write_text(dir / "nogrid.yaml", "leadfield: leadfield.npy\nelectrodes: [Fp1, Cz, O2]\n");
    const auto no_grid = tio::leadfield::load_leadfield_bundle(dir / "nogrid.yaml");
    ASSERT_FALSE(no_grid.has_value());
    EXPECT_THAT(no_grid.error().message, HasSubstr("missing the 'grid' mapping"));

    const auto missing = tio::leadfield::load_leadfield_bundle(dir / "absent.yaml");
    ASSERT_FALSE(missing.has_value());
    EXPECT_THAT(missing.error().message, HasSubstr("unable to open leadfield manifest"));
}
