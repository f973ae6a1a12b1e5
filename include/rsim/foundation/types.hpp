#pragma once

/// @file types.hpp
/// @brief Strong ID types shared across the simulator.

#include <cstdint>
#include <functional>

namespace rsim::foundation {

/// Tag-based strong typedef for type-safe ID values.
///
/// @tparam Tag A unique tag type to distinguish different ID types.
/// @tparam T The underlying integral type.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct PlayerIdTag {};

/// Identifier of a simulated player (1-based position in the population).
using PlayerId = StrongId<PlayerIdTag>;

} // namespace rsim::foundation

// Hash support for use in unordered containers.
template <typename Tag, typename T>
struct std::hash<rsim::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const rsim::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
