#include "lcd/core/status.hpp"

namespace lcd::core {

auto to_string(const status value) noexcept -> std::string_view {
	switch (value) {
		case status::ok:               return "ok";
		case status::not_initialized:  return "not initialized";
		case status::invalid_geometry: return "invalid geometry";
		case status::transport_error:  return "transport error";

		default: break;
	}
	return "unknown";
}

} // namespace lcd::core
