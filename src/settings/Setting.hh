#ifndef SETTING_HH
#define SETTING_HH

#include "Subject.hh"
#include "TclObject.hh"

#include <functional>
#include <string>
#include <string_view>

namespace gbcore {

class CliComm;
class Interpreter;

class Setting : public Subject<Setting>
{
public:
	Setting(const Setting&) = delete;
	Setting(Setting&&) = delete;
	Setting& operator=(const Setting&) = delete;
	Setting& operator=(Setting&&) = delete;
	virtual ~Setting();

	/** Name of the setting, also the name of the Tcl variable. */
	[[nodiscard]] const TclObject& getNameObj() const { return name; }
	[[nodiscard]] std::string_view getName() const { return name.getString(); }

	/** Returns a string describing the setting type (boolean, enumeration, ..)
	  */
	[[nodiscard]] virtual std::string_view getTypeString() const = 0;

	/** Gets the current value of this setting as a TclObject.
	  */
	[[nodiscard]] const TclObject& getValue() const { return value; }

	/** Get the default value of this setting.
	  * This is the initial value of the setting, it's also the value used
	  * for a Tcl 'unset' command.
	  */
	[[nodiscard]] const TclObject& getDefaultValue() const { return defaultValue; }

	/** Set value-check-callback.
	 * The callback is called on each change of this settings value.
	 * The callback has the possibility to
	 *  - change the value (modify the parameter)
	 *  - disallow the change (throw an exception)
	 */
	void setChecker(std::function<void(TclObject&)> checkFunc_) {
		checkFunc = std::move(checkFunc_);
	}

	/** Change the value of this setting to the given value.
	  * This goes via the Tcl variable, so it also triggers Tcl traces.
	  * Throws CommandException when the value is rejected.
	  */
	void setValue(const TclObject& newValue);

	/** Similar to setValue(), but doesn't trigger Tcl traces.
	  * Should only be used by the Interpreter class.
	  */
	void setValueDirect(const TclObject& newValue);

	[[nodiscard]] Interpreter& getInterpreter() const { return interpreter; }

protected:
	Setting(Interpreter& interpreter, CliComm& cliComm,
	        std::string_view name,
	        const TclObject& initialValue);
	void init();

private:
	void notify() const;

private:
	Interpreter& interpreter;
	CliComm& cliComm;
	const TclObject name;
	std::function<void(TclObject&)> checkFunc;
	TclObject value;
	const TclObject defaultValue;
};

} // namespace gbcore

#endif
