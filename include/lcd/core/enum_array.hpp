#pragma once

#include <array>
#include <cstddef>
#include <utility>
#include <concepts>
#include <type_traits>

namespace lcd::core {

template<class T>
concept enum_with_count = std::is_enum_v<T> && requires {
	{ static_cast<size_t>(T::COUNT) } -> std::same_as<size_t>;
};

template<enum_with_count Enum>
[[nodiscard]]
constexpr auto enum_count() noexcept -> size_t {
	return static_cast<size_t>(Enum::COUNT);
}

template<enum_with_count Enum>
[[nodiscard]]
constexpr auto to_index(const Enum value) noexcept -> size_t {
	return static_cast<size_t>(std::to_underlying(value));
}

/// One slot per enumerator before COUNT, looked up by the enumerator itself
template<enum_with_count Enum, class T>
struct enum_array : public std::array<T, enum_count<Enum>()> {
	using base_class = std::array<T, enum_count<Enum>()>;
	using enum_type  = Enum;

	[[gnu::always_inline]]
	constexpr auto operator[](const enum_type value) const -> const T & {
		return base_class::operator[](to_index(value));
	}

	[[gnu::always_inline]]
	constexpr auto operator[](const enum_type value) -> T & {
		return base_class::operator[](to_index(value));
	}
};

} // namespace lcd::core
