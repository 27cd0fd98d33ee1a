#include "EnumSetting.hh"
#include "CommandException.hh"

#include <algorithm>
#include <cassert>
#include <cctype>

namespace gbcore {

[[nodiscard]] static bool caselessEqual(std::string_view x, std::string_view y)
{
	return std::ranges::equal(x, y, [](char a, char b) {
		return std::tolower(static_cast<unsigned char>(a)) ==
		       std::tolower(static_cast<unsigned char>(b));
	});
}

EnumSettingBase::EnumSettingBase(Map&& map)
	: baseMap(std::move(map))
{
}

int EnumSettingBase::fromStringBase(std::string_view str) const
{
	auto it = std::ranges::find_if(baseMap, [&](const MapEntry& e) {
		return caselessEqual(e.name, str);
	});
	if (it == baseMap.end()) {
		throw CommandException("not a valid value: ", str);
	}
	return it->value;
}

std::string_view EnumSettingBase::toStringBase(int value) const
{
	auto it = std::ranges::find(baseMap, value, &MapEntry::value);
	assert(it != baseMap.end());
	return it->name;
}

} // namespace gbcore
