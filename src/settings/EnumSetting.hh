#ifndef ENUMSETTING_HH
#define ENUMSETTING_HH

#include "Setting.hh"

#include <concepts>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gbcore {

// non-templatized base class
class EnumSettingBase
{
public:
	struct MapEntry {
		template<typename Enum>
		MapEntry(std::string_view name_, Enum value_)
			: name(name_), value(static_cast<int>(value_)) {}

		std::string name;
		int value;
	};
	using Map = std::vector<MapEntry>;

protected:
	explicit EnumSettingBase(Map&& m);

	/** Caseless lookup, throws CommandException for unknown names. */
	[[nodiscard]] int fromStringBase(std::string_view str) const;
	[[nodiscard]] std::string_view toStringBase(int value) const;

private:
	Map baseMap;
};

template<typename T>
concept EnumSettingValue = requires(T t, int i) {
	static_cast<T>(i);
	static_cast<int>(t);
};

template<EnumSettingValue T> class EnumSetting final : public EnumSettingBase, public Setting
{
public:
	using Map = EnumSettingBase::Map;

	EnumSetting(Interpreter& interpreter, CliComm& cliComm, std::string_view name,
	            T initialValue, Map&& map_);

	[[nodiscard]] std::string_view getTypeString() const override;

	[[nodiscard]] T getEnum() const;
	void setEnum(T e);
	[[nodiscard]] std::string_view getString() const;

private:
	std::string_view toString(T e) const;
};


//-------------


template<EnumSettingValue T>
EnumSetting<T>::EnumSetting(
		Interpreter& interpreter_, CliComm& cliComm_, std::string_view name,
		T initialValue, Map&& map)
	: EnumSettingBase(std::move(map))
	, Setting(interpreter_, cliComm_, name,
	          TclObject(EnumSettingBase::toStringBase(static_cast<int>(initialValue))))
{
	setChecker([this](TclObject& newValue) {
		// may throw, stores the canonical spelling
		newValue = toStringBase(fromStringBase(newValue.getString()));
	});
	init();
}

template<EnumSettingValue T>
std::string_view EnumSetting<T>::getTypeString() const
{
	return "enumeration";
}

template<EnumSettingValue T>
T EnumSetting<T>::getEnum() const
{
	return static_cast<T>(fromStringBase(getValue().getString()));
}

template<EnumSettingValue T>
void EnumSetting<T>::setEnum(T e)
{
	setValue(TclObject(toString(e)));
}

template<EnumSettingValue T>
std::string_view EnumSetting<T>::getString() const
{
	return getValue().getString();
}

template<EnumSettingValue T>
std::string_view EnumSetting<T>::toString(T e) const
{
	return toStringBase(static_cast<int>(e));
}

} // namespace gbcore

#endif
