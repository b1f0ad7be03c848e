#pragma once

#include <cstdint>
#include <string_view>

namespace lcd::core {

enum class status : uint8_t {
	ok,
	not_initialized,  ///< drawing requested before display::initialize() succeeded
	invalid_geometry, ///< window or pixel outside of the panel, nothing was sent
	transport_error,  ///< bus or control line failed, the controller may be mid-command
};

[[nodiscard]]
auto to_string(status value) noexcept -> std::string_view;

[[nodiscard]]
constexpr auto succeeded(const status value) noexcept -> bool {
	return value == status::ok;
}

} // namespace lcd::core

namespace lcd {

using core::status;

} // namespace lcd
