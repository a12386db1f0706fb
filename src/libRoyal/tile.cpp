#include "royal/tile.hpp"

#include "royal/errors.hpp"

#include <array>
#include <format>
#include <utility>

namespace royal {

static constexpr std::array<std::pair<Color, Symbol>, 6> ROYAL_TILES{{
        {Color::Blue, Symbol::Pillow},
        {Color::Yellow, Symbol::Poop},
        {Color::Green, Symbol::Pug},
        {Color::Purple, Symbol::Bone},
        {Color::Orange, Symbol::Bowl},
        {Color::Pink, Symbol::Can},
}};

bool isRoyal(const Color color, const Symbol symbol) {
	for (const auto& [c, s]: ROYAL_TILES) {
		if (c == color && s == symbol)
			return true;
	}
	return false;
}

static bool isValidCode(const int code) {
	return code >= MIN_TILE_CODE && code <= MAX_TILE_CODE;
}

Tile::Tile(const Color color, const Symbol symbol) : m_color{color}, m_symbol{symbol}, m_crown{isRoyal(color, symbol)} {
}

Tile Tile::fromCodes(const int colorCode, const int symbolCode) {
	if (!isValidCode(colorCode) || !isValidCode(symbolCode)) {
		throw RuleError(ErrorType::InvalidTileCode, std::format("color {} / symbol {} outside {}..{}", colorCode, symbolCode,
		                                                        MIN_TILE_CODE, MAX_TILE_CODE));
	}
	return Tile(static_cast<Color>(colorCode), static_cast<Symbol>(symbolCode));
}

Color Tile::color() const {
	return m_color;
}

Symbol Tile::symbol() const {
	return m_symbol;
}

bool Tile::hasCrown() const {
	return m_crown;
}

bool Tile::isFlipped() const {
	return m_flipped;
}

void Tile::flip() {
	m_flipped = !m_flipped;
}

bool Tile::shares(const Tile& other, const Attribute attribute) const {
	return attribute == Attribute::Color ? m_color == other.m_color : m_symbol == other.m_symbol;
}

std::string toString(const Tile& tile) {
	return std::format("Tile{{{}-{}{}{}}}", toCode(tile.color()), toCode(tile.symbol()), tile.hasCrown() ? ", royal" : "",
	                   tile.isFlipped() ? ", flipped" : "");
}

} // namespace royal
