#include "Setting.hh"
#include "CliComm.hh"
#include "Interpreter.hh"

namespace gbcore {

Setting::Setting(Interpreter& interpreter_, CliComm& cliComm_,
                 std::string_view name_,
                 const TclObject& initialValue)
	: interpreter(interpreter_)
	, cliComm(cliComm_)
	, name(name_)
	, value(initialValue)
	, defaultValue(initialValue)
{
	checkFunc = [](TclObject&) { /* nothing */ };
}

void Setting::init()
{
	interpreter.registerSetting(*this);
}

Setting::~Setting()
{
	interpreter.unregisterSetting(*this);
}

void Setting::setValue(const TclObject& newValue)
{
	interpreter.setVariable(getNameObj(), newValue);
}

void Setting::setValueDirect(const TclObject& newValue_)
{
	TclObject newValue = newValue_;
	checkFunc(newValue);
	if (newValue != value) {
		value = newValue;
		notify();
	}
}

void Setting::notify() const
{
	Subject<Setting>::notify();
	cliComm.update(CliComm::UpdateType::SETTING, getName(), value.getString());
}

} // namespace gbcore
