#pragma once

#include <string>

namespace royal {

enum class Color { Blue = 1, Green = 2, Orange = 3, Pink = 4, Purple = 5, Yellow = 6 };
enum class Symbol { Pillow = 1, Bone = 2, Bowl = 3, Can = 4, Poop = 5, Pug = 6 };

//! Tile property a combination is built on.
enum class Attribute { Color, Symbol };

static constexpr int MIN_TILE_CODE = 1;
static constexpr int MAX_TILE_CODE = 6;

//! True for the 6 royal color/symbol pairs that carry a crown.
bool isRoyal(Color color, Symbol symbol);

//! A single game tile.
//! \note Identity for grouping is (color, symbol). Crown is derived once, only the flipped state changes.
class Tile {
public:
	Tile(Color color, Symbol symbol);

	//! Create a tile from integer codes. Throws RuleError(InvalidTileCode) if a code is outside 1..6.
	static Tile fromCodes(int colorCode, int symbolCode);

	Color color() const;
	Symbol symbol() const;
	bool hasCrown() const;
	bool isFlipped() const;

	void flip(); //!< Toggle the flipped state.

	//! True if both tiles have the same value for the given attribute. Flip state is ignored.
	bool shares(const Tile& other, Attribute attribute) const;

	bool operator==(const Tile&) const = default;

private:
	Color m_color;
	Symbol m_symbol;
	bool m_crown;
	bool m_flipped{false};
};

std::string toString(const Tile& tile);

inline constexpr int toCode(const Color c) {
	return static_cast<int>(c);
}
inline constexpr int toCode(const Symbol s) {
	return static_cast<int>(s);
}

} // namespace royal
