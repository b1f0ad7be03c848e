namespace lcd::core {

#pragma region vec2u16

[[gnu::always_inline]]
inline auto vec2u16::operator +(const vec2u16 &other) const noexcept -> vec2u16 {
	return vec2u16{
		.x = static_cast<uint16_t>(x + other.x),
		.y = static_cast<uint16_t>(y + other.y)
	};
}

[[gnu::always_inline]]
inline auto vec2u16::operator -(const vec2u16 &other) const noexcept -> vec2u16 {
	return vec2u16{
		.x = static_cast<uint16_t>(x - other.x),
		.y = static_cast<uint16_t>(y - other.y)
	};
}

[[gnu::always_inline]]
inline auto vec2u16::operator==(const vec2u16 &other) const noexcept -> bool {
	return x == other.x && y == other.y;
}

[[gnu::always_inline]]
inline auto vec2u16::operator!=(const vec2u16 &other) const noexcept -> bool {
	return !(*this == other);
}

#pragma endregion vec2u16

#pragma region rect

[[gnu::always_inline]]
inline auto rect::from_corners(uint16_t x0, uint16_t y0, uint16_t x1, uint16_t y1) noexcept -> rect {
	return rect{
		.left_top     = vec2u16::make(x0, y0),
		.right_bottom = vec2u16::make(x1, y1)
	};
}

[[gnu::always_inline]]
inline auto rect::from_size(vec2u16 pos, vec2u16 size) noexcept -> rect {
	return rect{
		.left_top     = pos,
		.right_bottom = pos + size - vec2u16::make(1u)
	};
}

[[gnu::always_inline]]
inline auto rect::width() const noexcept -> uint32_t {
	return static_cast<uint32_t>(right_bottom.x) - static_cast<uint32_t>(left_top.x) + 1u;
}

[[gnu::always_inline]]
inline auto rect::height() const noexcept -> uint32_t {
	return static_cast<uint32_t>(right_bottom.y) - static_cast<uint32_t>(left_top.y) + 1u;
}

[[gnu::always_inline]]
inline auto rect::area() const noexcept -> size_t {
	return static_cast<size_t>(width()) * static_cast<size_t>(height());
}

[[gnu::always_inline]]
inline auto rect::fits(vec2u16 bounds) const noexcept -> bool {
	return left_top.x <= right_bottom.x
		&& left_top.y <= right_bottom.y
		&& right_bottom.x < bounds.w
		&& right_bottom.y < bounds.h;
}

[[gnu::always_inline]]
inline auto rect::contains(vec2u16 point) const noexcept -> bool {
	return point.x >= left_top.x && point.x <= right_bottom.x
		&& point.y >= left_top.y && point.y <= right_bottom.y;
}

[[gnu::always_inline]]
inline auto rect::operator==(const rect &other) const noexcept -> bool {
	return left_top == other.left_top && right_bottom == other.right_bottom;
}

#pragma endregion rect

} // namespace lcd::core
