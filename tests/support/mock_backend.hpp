/**
 * @file mock_backend.hpp
 * @brief GMock FieldBackend so engine tests can inject failures on demand
 */
#pragma once

#include <gmock/gmock.h>

#include <optional>
#include <span>
#include <string_view>

#include "tio/compute/backend.hpp"

namespace tio::test_support
{

class MockFieldBackend : public compute::FieldBackend
{
public:
    MOCK_METHOD(std::string_view, name, (), (const, noexcept, override));
    MOCK_METHOD(field::VectorResult, contract,
                (const leadfield::LeadfieldMatrix &, std::span<const double>,
                 (std::optional<std::span<const std::size_t>>)),
                (const, override));
    MOCK_METHOD(field::FieldResult, envelope, (std::span<const common::Vec3>, std::span<const common::Vec3>),
                (const, override));
    MOCK_METHOD(field::FieldResult, ti_field,
                (const leadfield::LeadfieldMatrix &, std::span<const double>, std::span<const double>,
                 (std::optional<std::span<const std::size_t>>)),
                (const, override));

    /// routes every primitive to a real CpuBackend until a test overrides one
    void delegate_to_cpu()
    {
        using testing::_;
        ON_CALL(*this, name()).WillByDefault(testing::Return(std::string_view{"mock"}));
        ON_CALL(*this, contract(_, _, _))
            .WillByDefault([this](const leadfield::LeadfieldMatrix &lf, std::span<const double> stim,
                                  std::optional<std::span<const std::size_t>> indices) {
                return cpu_.contract(lf, stim, indices);
            });
        ON_CALL(*this, envelope(_, _))
            .WillByDefault([this](std::span<const common::Vec3> e1, std::span<const common::Vec3> e2) {
                return cpu_.envelope(e1, e2);
            });
        ON_CALL(*this, ti_field(_, _, _, _))
            .WillByDefault([this](const leadfield::LeadfieldMatrix &lf, std::span<const double> stim1,
                                  std::span<const double> stim2, std::optional<std::span<const std::size_t>> indices) {
                return cpu_.ti_field(lf, stim1, stim2, indices);
            });
    }

private:
    compute::CpuBackend cpu_;
};

} // namespace tio::test_support
