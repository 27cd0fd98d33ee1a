#ifndef TCLOBJECT_HH
#define TCLOBJECT_HH

#include <tcl.h>

#include <string_view>
#include <utility>

namespace gbcore {

class Interpreter;

/** Owning (reference counted) handle to a Tcl_Obj. Settings keep their
  * name and value in this form so they can be handed to Tcl unchanged. */
class TclObject
{
public:
	explicit TclObject(Tcl_Obj* o)         { init(o); }
	explicit TclObject(std::string_view s) { init(newObj(s)); }
	TclObject(const TclObject&  o)         { init(o.obj); }
	TclObject(      TclObject&& o) noexcept { init(o.obj); }

	~TclObject() { Tcl_DecrRefCount(obj); }

	TclObject& operator=(const TclObject& other) {
		if (&other != this) {
			Tcl_DecrRefCount(obj);
			init(other.obj);
		}
		return *this;
	}
	TclObject& operator=(TclObject&& other) noexcept {
		std::swap(obj, other.obj);
		return *this;
	}
	TclObject& operator=(std::string_view s) {
		// 's' may point into the current object
		Tcl_Obj* old = obj;
		init(newObj(s));
		Tcl_DecrRefCount(old);
		return *this;
	}

	[[nodiscard]] Tcl_Obj* getTclObjectNonConst() const { return obj; }

	/** The returned view is 0-terminated. */
	[[nodiscard]] std::string_view getString() const;
	/** Interprets the value the way Tcl does (1/0, true/false, on/off,
	  * yes/no), throws CommandException otherwise. */
	[[nodiscard]] bool getBoolean(Interpreter& interp) const;

	[[nodiscard]] friend bool operator==(const TclObject& x, const TclObject& y) {
		return x.getString() == y.getString();
	}

private:
	void init(Tcl_Obj* obj_) noexcept {
		obj = obj_;
		Tcl_IncrRefCount(obj);
	}

	[[nodiscard]] static Tcl_Obj* newObj(std::string_view s) {
		return Tcl_NewStringObj(s.data(), int(s.size()));
	}

private:
	Tcl_Obj* obj;
};

} // namespace gbcore

#endif
