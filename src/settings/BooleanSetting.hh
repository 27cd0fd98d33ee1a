#ifndef BOOLEANSETTING_HH
#define BOOLEANSETTING_HH

#include "Setting.hh"

namespace gbcore {

using namespace std::literals;

class BooleanSetting final : public Setting
{
public:
	BooleanSetting(Interpreter& interpreter, CliComm& cliComm,
	               std::string_view name,
	               bool initialValue);
	[[nodiscard]] std::string_view getTypeString() const override;

	[[nodiscard]] bool getBoolean() const noexcept {
		// the checker only lets normalized values through
		return getValue().getString() == "true";
	}
	void setBoolean(bool b) { setValue(TclObject(toString(b))); }

private:
	[[nodiscard]] static std::string_view toString(bool b) {
		return b ? "true"sv : "false"sv;
	}
};

} // namespace gbcore

#endif
